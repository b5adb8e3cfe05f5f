#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Загрузка config.toml
//
//  - Каждая секция необязательна: нет секции/ключа -> дефолт из структуры.
//  - Ключ неверного типа -> секция считается ошибочной, load_*() возвращает false.
//  - Имена ключей должны соответствовать config.toml.
// ============================================================================

namespace {
    // nullptr, если секции нет; исключение, если под этим именем не таблица.
    const toml::table *section(const toml::table &tbl, std::string_view name) {
        const auto *node = tbl.get(name);
        if (!node) {
            return nullptr;
        }
        const auto *t = node->as_table();
        if (!t) {
            throw std::runtime_error("invalid [" + std::string(name) + "] table");
        }
        return t;
    }

    std::chrono::milliseconds read_ms(const toml::table &tbl, std::string_view key, std::chrono::milliseconds def) {
        std::int64_t ms = def.count();
        read_optional<std::int64_t>(tbl, key, ms);
        return std::chrono::milliseconds(ms);
    }

    // Больше не влезает в steady_clock::duration (наносекунды).
    std::chrono::seconds max_cooldown() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max());
    }

    void env_fallback(std::string &value, const char *env_name) {
        if (!value.empty()) {
            return;
        }
        if (const char *env = std::getenv(env_name); env && *env) {
            value = env;
        }
    }
}


bool load_source_config(const toml::table &tbl, SourceConfig &cfg) {
    // ----------------------------- [source] -----------------------------
    try {
        const auto *src = section(tbl, "source");
        if (!src) {
            return true;
        }
        read_optional<std::string>(*src, "source", cfg.source);
        read_optional<std::string>(*src, "backend", cfg.backend);
        read_optional<int>(*src, "frame_width", cfg.frame_width);
        read_optional<int>(*src, "frame_height", cfg.frame_height);
        read_optional<int>(*src, "read_timeout_ms", cfg.read_timeout_ms);
        read_optional<int>(*src, "open_timeout_ms", cfg.open_timeout_ms);

        // ------------------------ [source.watchdog] ------------------------
        if (const auto *wd = section(*src, "watchdog"); wd) {
            read_optional<std::uint64_t>(*wd, "no_frame_timeout_ms", cfg.watchdog.no_frame_timeout_ms);
            read_optional<std::uint64_t>(*wd, "restart_cooldown_ms", cfg.watchdog.restart_cooldown_ms);
            read_optional<std::uint64_t>(*wd, "startup_grace_ms", cfg.watchdog.startup_grace_ms);
        }
        return true;

    } catch (const std::exception &e) {
        std::cerr << "source config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_motion_config(const toml::table &tbl, MotionDetector::Config &cfg) {
    // ----------------------------- [motion] -----------------------------
    try {
        const auto *motion = section(tbl, "motion");
        if (!motion) {
            return true;
        }
        read_optional<double>(*motion, "min_area_fraction", cfg.min_area_fraction);
        read_optional<double>(*motion, "min_contour_area", cfg.min_contour_area);
        read_optional<int>(*motion, "history", cfg.history);
        read_optional<double>(*motion, "var_threshold", cfg.var_threshold);
        read_optional<bool>(*motion, "detect_shadows", cfg.detect_shadows);
        read_optional<int>(*motion, "blur_size", cfg.blur_size);
        read_optional<int>(*motion, "binarize_threshold", cfg.binarize_threshold);
        read_optional<int>(*motion, "dilate_iterations", cfg.dilate_iterations);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "motion config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_event_config(const toml::table &tbl, MotionPipeline::Config &cfg) {
    // ----------------------------- [event] ------------------------------
    try {
        const auto *event = section(tbl, "event");
        if (!event) {
            return true;
        }
        read_optional<int>(*event, "min_motion_frames", cfg.min_motion_frames);

        std::int64_t cooldown_s = cfg.cooldown.count();
        read_optional<std::int64_t>(*event, "cooldown_s", cooldown_s);
        cfg.cooldown = std::chrono::seconds(cooldown_s);

        read_optional<double>(*event, "max_fps", cfg.max_fps);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "event config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_snapshot_config(const toml::table &tbl, JpegSnapshotWriter::Config &cfg) {
    // ---------------------------- [snapshot] ----------------------------
    try {
        const auto *snap = section(tbl, "snapshot");
        if (!snap) {
            return true;
        }
        read_optional<std::string>(*snap, "save_dir", cfg.save_dir);
        read_optional<int>(*snap, "jpeg_quality", cfg.jpeg_quality);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "snapshot config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_notify_config(const toml::table &tbl, NotifyConfig &cfg) {
    // ----------------------------- [notify] -----------------------------
    try {
        const auto *n = section(tbl, "notify");
        if (!n) {
            return true;
        }
        cfg.timeouts.text = read_ms(*n, "text_timeout_ms", cfg.timeouts.text);
        cfg.timeouts.image = read_ms(*n, "image_timeout_ms", cfg.timeouts.image);
        read_optional<int>(*n, "max_pending", cfg.max_pending);

        if (const auto *wh = section(*n, "webhook"); wh) {
            read_optional<std::string>(*wh, "url", cfg.webhook.url);
        }
        if (const auto *tg = section(*n, "telegram"); tg) {
            read_optional<std::string>(*tg, "token", cfg.telegram.token);
            read_optional<std::string>(*tg, "chat_id", cfg.telegram.chat_id);
            read_optional<std::string>(*tg, "api_base", cfg.telegram.api_base);
        }
        if (const auto *dc = section(*n, "discord"); dc) {
            read_optional<std::string>(*dc, "url", cfg.discord.url);
            read_optional<std::string>(*dc, "username", cfg.discord.username);
        }
        return true;

    } catch (const std::exception &e) {
        std::cerr << "notify config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_alarm_config(const toml::table &tbl, notify::AlarmChannel::Config &cfg) {
    // ------------------------------ [alarm] -----------------------------
    try {
        const auto *alarm = section(tbl, "alarm");
        if (!alarm) {
            return true;
        }
        read_optional<bool>(*alarm, "enabled", cfg.enabled);
        read_optional<std::string>(*alarm, "command", cfg.command);
        cfg.timeout = read_ms(*alarm, "timeout_ms", cfg.timeout);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "alarm config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_ui_config(const toml::table &tbl, UiConfig &cfg) {
    // ------------------------------- [ui] -------------------------------
    try {
        const auto *ui = section(tbl, "ui");
        if (!ui) {
            return true;
        }
        read_optional<bool>(*ui, "headless", cfg.headless);
        read_optional<bool>(*ui, "show_mask", cfg.show_mask);
        read_optional<std::string>(*ui, "window_name", cfg.window_name);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "ui config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
    // ----------------------------- [logging] ----------------------------
    try {
        const auto *logging = section(tbl, "logging");
        if (!logging) {
            return true;
        }
        read_optional<bool>(*logging, "frame_grab_logger", cfg.frame_grab_logger);
        read_optional<bool>(*logging, "motion_logger", cfg.motion_logger);
        read_optional<bool>(*logging, "event_logger", cfg.event_logger);
        read_optional<bool>(*logging, "notify_logger", cfg.notify_logger);
        read_optional<bool>(*logging, "rtsp_logger", cfg.rtsp_logger);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_app_config(const toml::table &tbl, AppConfig &cfg) {
    bool ok = true;
    ok &= load_source_config(tbl, cfg.source);
    ok &= load_motion_config(tbl, cfg.motion);
    ok &= load_event_config(tbl, cfg.event);
    ok &= load_snapshot_config(tbl, cfg.snapshot);
    ok &= load_notify_config(tbl, cfg.notify);
    ok &= load_alarm_config(tbl, cfg.alarm);
    ok &= load_ui_config(tbl, cfg.ui);
    ok &= load_logging_config(tbl, cfg.logging);

    cfg.source.verbose = cfg.logging.rtsp_logger;
    cfg.event.verbose = cfg.logging.event_logger;
    cfg.snapshot.verbose = cfg.logging.event_logger;
    cfg.source.watchdog.verbose = cfg.logging.rtsp_logger;
    return ok;
}

void apply_env_fallbacks(AppConfig &cfg) {
    env_fallback(cfg.notify.webhook.url, "WEBHOOK_URL");
    env_fallback(cfg.notify.telegram.token, "TELEGRAM_TOKEN");
    env_fallback(cfg.notify.telegram.chat_id, "TELEGRAM_CHAT_ID");
    env_fallback(cfg.notify.discord.url, "DISCORD_WEBHOOK_URL");
}

std::vector<std::string> validate_app_config(const AppConfig &cfg) {
    std::vector<std::string> errors;

    if (cfg.event.min_motion_frames < 1) {
        errors.emplace_back("event.min_motion_frames must be >= 1");
    }
    if (cfg.event.cooldown.count() < 0) {
        errors.emplace_back("event.cooldown_s must be >= 0");
    }
    if (cfg.event.cooldown > max_cooldown()) {
        errors.emplace_back("event.cooldown_s must be <= " + std::to_string(max_cooldown().count()));
    }
    if (!(cfg.event.max_fps > 0.0)) {
        errors.emplace_back("event.max_fps must be > 0");
    }
    if (cfg.motion.min_area_fraction < 0.0 || cfg.motion.min_area_fraction > 1.0) {
        errors.emplace_back("motion.min_area_fraction must be in [0, 1]");
    }
    if (cfg.source.source.empty()) {
        errors.emplace_back("source.source must not be empty");
    }
    if (cfg.source.backend != "auto" && cfg.source.backend != "opencv" && cfg.source.backend != "gstreamer") {
        errors.emplace_back("source.backend must be one of auto, opencv, gstreamer");
    }
    if (cfg.notify.timeouts.text.count() <= 0 || cfg.notify.timeouts.image.count() <= 0) {
        errors.emplace_back("notify timeouts must be > 0");
    }
    if (cfg.alarm.timeout.count() <= 0) {
        errors.emplace_back("alarm.timeout_ms must be > 0");
    }
    if (cfg.notify.max_pending < 1) {
        errors.emplace_back("notify.max_pending must be >= 1");
    }
    if (cfg.snapshot.jpeg_quality < 1 || cfg.snapshot.jpeg_quality > 100) {
        errors.emplace_back("snapshot.jpeg_quality must be in [1, 100]");
    }
    return errors;
}
