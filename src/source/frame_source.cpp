#include "source/frame_source.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace {
    long long now_steady_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    // uridecodebin понимает только URI; обычный путь превращаем в file://.
    std::string to_uri(const std::string& source) {
        if (source.find("://") != std::string::npos) {
            return source;
        }
        GError* err = nullptr;
        gchar* uri = gst_filename_to_uri(source.c_str(), &err);
        if (!uri) {
            if (err) g_error_free(err);
            return source;
        }
        std::string out(uri);
        g_free(uri);
        return out;
    }

    StreamWorker::Config worker_config(const SourceConfig& cfg) {
        StreamWorker::Config wc;
        wc.uri = to_uri(cfg.source);
        wc.verbose = cfg.verbose;
        return wc;
    }
}

bool isCameraIndex(const std::string& source) {
    return !source.empty() &&
           std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string resolveBackend(const SourceConfig& cfg) {
    if (cfg.backend == "opencv" || cfg.backend == "gstreamer") {
        return cfg.backend;
    }
    if (cfg.source.rfind("rtsp://", 0) == 0 || cfg.source.rfind("rtsps://", 0) == 0) {
        return "gstreamer";
    }
    return "opencv";
}

std::unique_ptr<FrameSource> makeFrameSource(const SourceConfig& cfg) {
    if (resolveBackend(cfg) == "gstreamer") {
        return std::make_unique<GstStreamSource>(cfg);
    }
    return std::make_unique<CaptureSource>(cfg);
}

// ------------------------------ CaptureSource ------------------------------

CaptureSource::CaptureSource(const SourceConfig& cfg) : cfg_(cfg) {}

CaptureSource::~CaptureSource() {
    release();
}

bool CaptureSource::open() {
    bool ok = false;
    try {
        if (isCameraIndex(cfg_.source)) {
            ok = cap_.open(std::stoi(cfg_.source));
        } else {
            ok = cap_.open(cfg_.source);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] VideoCapture: " << e.what() << std::endl;
        return false;
    }
    if (!ok || !cap_.isOpened()) {
        return false;
    }

    // Для многих сетевых потоков это no-op.
    if (cfg_.frame_width > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.frame_width);
    if (cfg_.frame_height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.frame_height);
    return true;
}

bool CaptureSource::read(cv::Mat& out) {
    if (!cap_.isOpened()) {
        return false;
    }
    try {
        return cap_.read(out) && !out.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] VideoCapture read: " << e.what() << std::endl;
        return false;
    }
}

void CaptureSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

std::string CaptureSource::describe() const {
    return "opencv:" + cfg_.source;
}

// ----------------------------- GstStreamSource -----------------------------

GstStreamSource::GstStreamSource(const SourceConfig& cfg)
        : cfg_(cfg), worker_(store_, worker_config(cfg)), watchdog_(cfg.watchdog) {}

GstStreamSource::~GstStreamSource() {
    release();
}

bool GstStreamSource::open() {
    worker_.start();

    // Источник считается открытым, только когда пришёл первый кадр.
    cv::Mat first;
    if (!store_.waitFrame(first, std::max(1, cfg_.open_timeout_ms))) {
        worker_.stop();
        return false;
    }

    watchdog_.start(now_steady_ms());
    opened_ = true;
    return true;
}

bool GstStreamSource::read(cv::Mat& out) {
    if (!opened_) {
        return false;
    }

    if (store_.waitFrame(out, std::max(1, cfg_.read_timeout_ms))) {
        watchdog_.frameReceived(now_steady_ms());
        return true;
    }

    if (watchdog_.shouldRestart(now_steady_ms())) {
        worker_.restart();
    }
    return false;
}

void GstStreamSource::release() {
    if (!opened_) {
        worker_.stop();
        return;
    }
    opened_ = false;
    worker_.stop();
    store_.stop();
}

std::string GstStreamSource::describe() const {
    return "gstreamer:" + cfg_.source;
}
