#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "frame_store.h"

// StreamWorker: GStreamer-пайплайн в своём потоке, BGR-кадры уходят в FrameStore.
// Пайплайн собирается из текстового описания (см. describePipeline()),
// uridecodebin сам подбирает rtspsrc/depay/декодер и линкуется с videoconvert.
class StreamWorker {
public:
    struct Config {
        std::string uri;
        std::string output_caps = "video/x-raw,format=BGR";
        int start_timeout_ms = 5000;    // ожидание перехода в PLAYING
        int stop_timeout_ms = 2000;     // ожидание перехода в NULL
        int restart_delay_ms = 300;     // пауза между stop() и start() в restart()
        bool verbose = true;
    };

    StreamWorker(FrameStore& store, const Config& cfg);
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    void start();
    void stop();
    void restart();

    // Текст пайплайна без uri (он выставляется свойством).
    std::string describePipeline() const;

private:
    void run();
    bool open();
    void close();
    bool handleBusMessage(GstMessage* msg);
    void wakeBus();

    static GstFlowReturn onSample(GstAppSink* sink, gpointer self);

    FrameStore& store_;
    Config cfg_;

    std::atomic<bool> active_{false};
    std::atomic<std::uint64_t> frames_{0};
    std::thread th_;

    std::mutex bus_mu_;
    GstElement* pipeline_{nullptr};
    GstBus* bus_{nullptr};
};
