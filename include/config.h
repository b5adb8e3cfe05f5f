#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ

#include "detect/motion_detector.h"
#include "event/motion_pipeline.h"
#include "notify/alarm_channel.h"
#include "notify/discord_channel.h"
#include "notify/http_channel.h"
#include "notify/telegram_channel.h"
#include "notify/webhook_channel.h"
#include "snapshot/snapshot_writer.h"
#include "source/source_config.h"


// Ключа нет: оставляем дефолт. Ключ есть, но не того типа: ошибка.
template <typename T>
static void read_optional(const toml::table &tbl, std::string_view key, T &out) {
    const auto *node = tbl.get(key);
    if (!node) {
        return;
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for '" + std::string(key) + "'");
    }
    out = *value;
}


struct NotifyConfig {
    notify::HttpTimeouts timeouts;
    // Сколько событий может ждать в очереди одного канала; лишние вытесняют самые старые.
    int max_pending = 8;
    notify::WebhookChannel::Config webhook;
    notify::TelegramChannel::Config telegram;
    notify::DiscordChannel::Config discord;
};

struct UiConfig {
    // Без окон (сервер, ssh)
    bool headless = false;
    // Показывать окно с маской движения
    bool show_mask = false;
    std::string window_name = "SmartCam";
};

struct LoggingConfig {
    bool frame_grab_logger = true;   // "frame grab failed; retrying"
    bool motion_logger = false;      // флаг движения на каждом допущенном кадре
    bool event_logger = true;        // подтверждения/cooldown/снимки
    bool notify_logger = true;       // результат доставки по каждому каналу
    bool rtsp_logger = true;         // сообщения StreamWorker и watchdog
};

struct AppConfig {
    SourceConfig source;
    MotionDetector::Config motion;
    MotionPipeline::Config event;
    JpegSnapshotWriter::Config snapshot;
    NotifyConfig notify;
    notify::AlarmChannel::Config alarm;
    UiConfig ui;
    LoggingConfig logging;
};

bool load_source_config(const toml::table &tbl, SourceConfig &cfg);
bool load_motion_config(const toml::table &tbl, MotionDetector::Config &cfg);
bool load_event_config(const toml::table &tbl, MotionPipeline::Config &cfg);
bool load_snapshot_config(const toml::table &tbl, JpegSnapshotWriter::Config &cfg);
bool load_notify_config(const toml::table &tbl, NotifyConfig &cfg);
bool load_alarm_config(const toml::table &tbl, notify::AlarmChannel::Config &cfg);
bool load_ui_config(const toml::table &tbl, UiConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// Все секции подряд + раздача флагов [logging] по компонентам.
// false, если хотя бы одна секция не загрузилась (ошибка уже в std::cerr).
bool load_app_config(const toml::table &tbl, AppConfig &cfg);

// Пустые учётные данные берутся из окружения:
// WEBHOOK_URL, TELEGRAM_TOKEN, TELEGRAM_CHAT_ID, DISCORD_WEBHOOK_URL.
// Вызывается один раз при старте; компоненты окружение не читают.
void apply_env_fallbacks(AppConfig &cfg);

// Пустой список = конфигурация корректна.
std::vector<std::string> validate_app_config(const AppConfig &cfg);
