#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include <gst/gst.h>
#include <opencv2/opencv.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "config.h"
#include "detect/motion_detector.h"
#include "event/event_dispatcher.h"
#include "event/motion_pipeline.h"
#include "notify/alarm_channel.h"
#include "notify/discord_channel.h"
#include "notify/http_client.h"
#include "notify/telegram_channel.h"
#include "notify/webhook_channel.h"
#include "snapshot/snapshot_writer.h"
#include "source/frame_source.h"
#include "ui/preview_window.h"


static std::atomic<bool> g_running{true};

static void on_signal(int) {
    g_running.store(false, std::memory_order_relaxed);
}


static bool load_config(const std::string& path, AppConfig& cfg) {
    toml::table tbl;
    if (std::filesystem::exists(path)) {
        try {
            tbl = toml::parse_file(path);
        } catch (const toml::parse_error& e) {
            std::cerr << "[ERROR] " << path << ": " << e.description()
                      << " at " << e.source().begin << std::endl;
            return false;
        }
        std::cout << "[INFO] config: " << path << std::endl;
    } else {
        std::cout << "[INFO] " << path << " not found, using defaults" << std::endl;
    }

    if (!load_app_config(tbl, cfg)) {
        return false;
    }
    apply_env_fallbacks(cfg);

    const auto errors = validate_app_config(cfg);
    for (const auto& err : errors) {
        std::cerr << "[ERROR] config: " << err << std::endl;
    }
    return errors.empty();
}


static int run(const AppConfig& cfg) {
    notify::CurlGlobal curl;
    if (!curl.ok()) {
        std::cerr << "[ERROR] curl_global_init failed" << std::endl;
        return 1;
    }

    // Источник открываем первым: если камеры нет, остальное не нужно.
    std::unique_ptr<FrameSource> source = makeFrameSource(cfg.source);
    if (!source->open()) {
        std::cerr << "[ERROR] Could not open source: " << source->describe() << std::endl;
        return 1;
    }
    std::cout << "[INFO] source opened: " << source->describe() << std::endl;

    notify::CurlHttpClient http;
    JpegSnapshotWriter snapshots(cfg.snapshot);

    std::vector<std::unique_ptr<notify::Channel>> channels;
    channels.push_back(std::make_unique<notify::AlarmChannel>(cfg.alarm));
    channels.push_back(std::make_unique<notify::WebhookChannel>(cfg.notify.webhook, http, cfg.notify.timeouts));
    channels.push_back(std::make_unique<notify::TelegramChannel>(cfg.notify.telegram, http, cfg.notify.timeouts));
    channels.push_back(std::make_unique<notify::DiscordChannel>(cfg.notify.discord, http, cfg.notify.timeouts));

    EventDispatcher::Config dcfg;
    dcfg.verbose = cfg.logging.notify_logger;
    dcfg.max_pending = static_cast<std::size_t>(cfg.notify.max_pending);
    EventDispatcher dispatcher(dcfg, &snapshots, std::move(channels));

    MotionDetector detector(cfg.motion);
    MotionPipeline pipeline(cfg.event, detector, dispatcher);

    std::unique_ptr<ui::PreviewWindow> preview;
    if (cfg.ui.headless) {
        std::cout << "[INFO] Running headless." << std::endl;
    } else {
        preview = std::make_unique<ui::PreviewWindow>(cfg.ui.window_name, cfg.ui.show_mask);
        std::cout << "[INFO] Press 'q' to quit." << std::endl;
    }

    cv::Mat frame;
    while (g_running.load(std::memory_order_relaxed)) {
        if (!source->read(frame)) {
            if (cfg.logging.frame_grab_logger) {
                std::cerr << "[WARN] frame grab failed; retrying..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            if (preview && preview->poll()) {
                g_running.store(false, std::memory_order_relaxed);
            }
            continue;
        }

        const MotionPipeline::Step step = pipeline.process(frame);

        if (cfg.logging.motion_logger && step.admitted) {
            const MotionResult& r = detector.last_result();
            std::cout << "[MOTION] " << (step.motion ? "YES" : "no")
                      << " area:" << r.moving_area << "/" << r.required_area << std::endl;
        }

        if (preview) {
            const bool quit = step.admitted ? preview->show(detector.last_result()) : preview->poll();
            if (quit) {
                std::cout << "[KEY] quit requested" << std::endl;
                g_running.store(false, std::memory_order_relaxed);
            }
        }
    }

    std::cout << "[INFO] stopping..." << std::endl;

    // Недоставленные уведомления не ждём: stop() их бросает и прерывает HTTP.
    dispatcher.stop();
    source->release();
    return 0;
}


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    gst_init(&argc, &argv);
    std::cout << "STARTING SMARTCAM..." << std::endl;

    const std::string config_path = (argc > 1) ? argv[1] : "config.toml";

    AppConfig cfg;
    if (!load_config(config_path, cfg)) {
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        const int rc = run(cfg);
        if (!g_running.load(std::memory_order_relaxed)) {
            std::cout << "[INFO] stopped" << std::endl;
        }
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] fatal: " << e.what() << std::endl;
        return 1;
    }
}
