#include "snapshot/snapshot_writer.h"
#include "util/time_format.h"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

JpegSnapshotWriter::JpegSnapshotWriter(const Config& cfg) : cfg_(cfg) {
    cfg_.jpeg_quality = std::max(1, std::min(cfg_.jpeg_quality, 100));
}

std::shared_ptr<const notify::Snapshot> JpegSnapshotWriter::persist(const cv::Mat& frame,
                                                                    std::chrono::system_clock::time_point when) {
    if (frame.empty()) {
        return nullptr;
    }

    auto snap = std::make_shared<notify::Snapshot>();

    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality};
    try {
        if (!cv::imencode(".jpg", frame, snap->jpeg, params)) {
            std::cerr << "[WARN] snapshot: jpeg encode failed" << std::endl;
            return nullptr;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] snapshot: jpeg encode failed: " << e.what() << std::endl;
        return nullptr;
    }

    // Дальше ошибки только логируем: байты уже есть, каналы смогут отправить картинку.
    std::error_code ec;
    if (!cfg_.save_dir.empty()) {
        fs::create_directories(cfg_.save_dir, ec);
        if (ec) {
            std::cerr << "[WARN] snapshot: cannot create " << cfg_.save_dir << ": " << ec.message() << std::endl;
            return snap;
        }
    }

    const fs::path path = fs::path(cfg_.save_dir.empty() ? "." : cfg_.save_dir) / util::snapshotFileName(when);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "[WARN] snapshot: cannot open " << path.string() << std::endl;
        return snap;
    }
    out.write(reinterpret_cast<const char*>(snap->jpeg.data()), static_cast<std::streamsize>(snap->jpeg.size()));
    if (!out) {
        std::cerr << "[WARN] snapshot: write failed " << path.string() << std::endl;
        return snap;
    }

    snap->path = path.string();
    if (cfg_.verbose) {
        std::cout << "[EVENT] motion confirmed -> saved: " << snap->path << std::endl;
    }
    return snap;
}
