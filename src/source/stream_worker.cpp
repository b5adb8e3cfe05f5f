#include "source/stream_worker.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <iostream>

namespace {
    // Сообщение, которым stop() будит поток, ждущий на bus.
    constexpr const char* kWakeMessage = "smartcam-wake";

    constexpr GstMessageType kWatchedMessages = static_cast<GstMessageType>(
            GST_MESSAGE_ERROR | GST_MESSAGE_EOS | GST_MESSAGE_APPLICATION);
}

StreamWorker::StreamWorker(FrameStore& store, const Config& cfg)
    : store_(store), cfg_(cfg) {}

StreamWorker::~StreamWorker() {
    stop();
}

std::string StreamWorker::describePipeline() const {
    return "uridecodebin name=src caps=video/x-raw"
           " ! videoconvert"
           " ! " + cfg_.output_caps +
           " ! appsink name=sink sync=false max-buffers=1 drop=true emit-signals=false";
}

void StreamWorker::start() {
    if (th_.joinable()) {
        // Поток жив или завершился сам (ошибка/EOS) и ещё не присоединён.
        if (active_.load(std::memory_order_acquire)) return;
        th_.join();
    }

    active_.store(true, std::memory_order_release);
    th_ = std::thread(&StreamWorker::run, this);
}

void StreamWorker::stop() {
    active_.store(false, std::memory_order_release);
    wakeBus();

    if (th_.joinable()) th_.join();
}

void StreamWorker::restart() {
    stop();

    // Камере нужно время, чтобы закрыть старую RTSP-сессию.
    if (cfg_.restart_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.restart_delay_ms));
    }

    start();
}

void StreamWorker::wakeBus() {
    std::lock_guard<std::mutex> lk(bus_mu_);
    if (!bus_ || !pipeline_) return;

    gst_bus_post(bus_, gst_message_new_application(GST_OBJECT(pipeline_),
                                                   gst_structure_new_empty(kWakeMessage)));
}

void StreamWorker::run() {
    if (!open()) {
        close();
        active_.store(false, std::memory_order_release);
        return;
    }

    if (cfg_.verbose) {
        std::cerr << "RTSP: streaming " << cfg_.uri << std::endl;
    }

    while (active_.load(std::memory_order_acquire)) {
        GstMessage* msg = gst_bus_timed_pop_filtered(bus_, 200 * GST_MSECOND, kWatchedMessages);
        if (!msg) continue;

        const bool keep_going = handleBusMessage(msg);
        gst_message_unref(msg);
        if (!keep_going) break;
    }

    close();
    active_.store(false, std::memory_order_release);

    if (cfg_.verbose) {
        std::cerr << "RTSP: stream closed" << std::endl;
    }
}

// false = поток надо закрыть.
bool StreamWorker::handleBusMessage(GstMessage* msg) {
    switch (GST_MESSAGE_TYPE(msg)) {
        case GST_MESSAGE_ERROR: {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);

            if (cfg_.verbose) {
                std::cerr << "RTSP: error from " << GST_OBJECT_NAME(GST_MESSAGE_SRC(msg)) << ": "
                          << (err ? err->message : "unknown") << std::endl;
                if (dbg) std::cerr << "RTSP: " << dbg << std::endl;
            }
            g_clear_error(&err);
            g_free(dbg);

            return false;
        }
        case GST_MESSAGE_EOS:
            if (cfg_.verbose) {
                std::cerr << "RTSP: end of stream" << std::endl;
            }
            return false;

        case GST_MESSAGE_APPLICATION:
            // Будильник от stop(): цикл сам проверит active_.
            return true;

        default:
            return true;
    }
}

bool StreamWorker::open() {
    close();

    GError* err = nullptr;
    GstElement* pipeline = gst_parse_launch(describePipeline().c_str(), &err);
    if (err) {
        if (cfg_.verbose) {
            std::cerr << "RTSP: bad pipeline: " << err->message << std::endl;
        }
        g_clear_error(&err);
        if (pipeline) gst_object_unref(pipeline);
        return false;
    }
    if (!pipeline) {
        return false;
    }

    GstElement* src = gst_bin_get_by_name(GST_BIN(pipeline), "src");
    GstElement* sink = gst_bin_get_by_name(GST_BIN(pipeline), "sink");
    if (!src || !sink) {
        if (src) gst_object_unref(src);
        if (sink) gst_object_unref(sink);
        gst_object_unref(pipeline);
        return false;
    }

    g_object_set(G_OBJECT(src), "uri", cfg_.uri.c_str(), nullptr);

    GstAppSinkCallbacks callbacks{};
    callbacks.new_sample = &StreamWorker::onSample;
    gst_app_sink_set_callbacks(GST_APP_SINK(sink), &callbacks, this, nullptr);

    gst_object_unref(src);
    gst_object_unref(sink);

    {
        std::lock_guard<std::mutex> lk(bus_mu_);
        pipeline_ = pipeline;
        bus_ = gst_element_get_bus(pipeline_);
    }

    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        if (cfg_.verbose) {
            std::cerr << "RTSP: could not switch pipeline to PLAYING" << std::endl;
        }
        return false;
    }

    // Для живых источников ответ обычно ASYNC/NO_PREROLL; ошибки всё равно придут через bus.
    const GstStateChangeReturn ret = gst_element_get_state(
            pipeline_, nullptr, nullptr, static_cast<GstClockTime>(cfg_.start_timeout_ms) * GST_MSECOND);
    return ret != GST_STATE_CHANGE_FAILURE;
}

void StreamWorker::close() {
    GstElement* pipeline = nullptr;
    GstBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lk(bus_mu_);
        pipeline = pipeline_;
        bus = bus_;
        pipeline_ = nullptr;
        bus_ = nullptr;
    }

    if (bus) gst_object_unref(bus);
    if (!pipeline) return;

    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_element_get_state(pipeline, nullptr, nullptr,
                          static_cast<GstClockTime>(cfg_.stop_timeout_ms) * GST_MSECOND);
    gst_object_unref(pipeline);
}

GstFlowReturn StreamWorker::onSample(GstAppSink* sink, gpointer user_data) {
    auto* self = static_cast<StreamWorker*>(user_data);

    GstSample* sample = gst_app_sink_pull_sample(sink);
    if (!sample) return GST_FLOW_EOS;

    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstCaps* caps = gst_sample_get_caps(sample);

    int width = 0, height = 0;
    if (caps) {
        const GstStructure* s = gst_caps_get_structure(caps, 0);
        gst_structure_get_int(s, "width", &width);
        gst_structure_get_int(s, "height", &height);
    }

    cv::Mat frame;
    GstMapInfo map{};
    if (buffer && width > 0 && height > 0 && gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        // Строки BGR могут быть выровнены: шаг берём из размера буфера.
        const size_t step = map.size / static_cast<size_t>(height);
        if (step >= static_cast<size_t>(width) * 3) {
            frame = cv::Mat(height, width, CV_8UC3, map.data, step).clone();
        }
        gst_buffer_unmap(buffer, &map);
    }
    gst_sample_unref(sample);

    if (frame.empty()) {
        // Битый кадр не повод рвать поток.
        return GST_FLOW_OK;
    }

    if (self->frames_.fetch_add(1, std::memory_order_relaxed) == 0 && self->cfg_.verbose) {
        std::cerr << "RTSP: first frame " << width << "x" << height << std::endl;
    }

    self->store_.setFrame(std::move(frame));
    return GST_FLOW_OK;
}
