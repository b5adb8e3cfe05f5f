#include <toml++/toml.h>
#include "config.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

using namespace std::chrono_literals;

bool has_error(const std::vector<std::string>& errors, const std::string& text) {
  for (const auto& e : errors) {
    if (e == text) return true;
  }
  return false;
}

void clear_env() {
  unsetenv("WEBHOOK_URL");
  unsetenv("TELEGRAM_TOKEN");
  unsetenv("TELEGRAM_CHAT_ID");
  unsetenv("DISCORD_WEBHOOK_URL");
}

bool test_empty_config_keeps_defaults() {
  const toml::table tbl;
  AppConfig cfg;

  CHECK(load_app_config(tbl, cfg));
  CHECK(cfg.event.min_motion_frames == 5);
  CHECK(cfg.event.cooldown == 20s);
  CHECK(cfg.event.max_fps == 8.0);
  CHECK(cfg.motion.min_area_fraction == 0.01);
  CHECK(cfg.snapshot.save_dir == "events");
  CHECK(cfg.notify.timeouts.text == 5000ms);
  CHECK(cfg.notify.timeouts.image == 10000ms);
  CHECK(cfg.notify.webhook.url.empty());
  CHECK(cfg.notify.telegram.api_base == "https://api.telegram.org");
  CHECK(cfg.notify.discord.username == "SmartCam");
  CHECK(cfg.alarm.enabled);
  CHECK(cfg.alarm.timeout == 5000ms);
  CHECK(cfg.notify.max_pending == 8);
  CHECK(cfg.source.watchdog.verbose);
  CHECK(cfg.source.source == "0");
  CHECK(validate_app_config(cfg).empty());
  return true;
}

bool test_full_config_is_parsed() {
  const auto tbl = toml::parse(R"(
[source]
source = "rtsp://10.0.0.5/stream1"
backend = "gstreamer"
open_timeout_ms = 8000

[source.watchdog]
no_frame_timeout_ms = 2500

[motion]
min_area_fraction = 0.02
detect_shadows = false

[event]
min_motion_frames = 3
cooldown_s = 45
max_fps = 4.5

[snapshot]
save_dir = "/var/lib/smartcam"
jpeg_quality = 80

[notify]
text_timeout_ms = 3000
image_timeout_ms = 15000
max_pending = 3

[notify.webhook]
url = "https://hooks.example.com/x"

[notify.telegram]
token = "tok"
chat_id = "-100"

[notify.discord]
url = "https://discord.example.com/api/webhooks/1/a"
username = "Porch"

[alarm]
enabled = false
command = "aplay alarm.wav"
timeout_ms = 2500

[ui]
headless = true

[logging]
event_logger = false
rtsp_logger = false
)");

  AppConfig cfg;
  CHECK(load_app_config(tbl, cfg));

  CHECK(cfg.source.source == "rtsp://10.0.0.5/stream1");
  CHECK(cfg.source.backend == "gstreamer");
  CHECK(cfg.source.open_timeout_ms == 8000);
  CHECK(cfg.source.watchdog.no_frame_timeout_ms == 2500);
  CHECK(cfg.source.watchdog.startup_grace_ms == 3000);
  CHECK(cfg.motion.min_area_fraction == 0.02);
  CHECK(!cfg.motion.detect_shadows);
  CHECK(cfg.event.min_motion_frames == 3);
  CHECK(cfg.event.cooldown == 45s);
  CHECK(cfg.event.max_fps == 4.5);
  CHECK(cfg.snapshot.save_dir == "/var/lib/smartcam");
  CHECK(cfg.snapshot.jpeg_quality == 80);
  CHECK(cfg.notify.timeouts.text == 3000ms);
  CHECK(cfg.notify.timeouts.image == 15000ms);
  CHECK(cfg.notify.max_pending == 3);
  CHECK(cfg.notify.webhook.url == "https://hooks.example.com/x");
  CHECK(cfg.notify.telegram.token == "tok");
  CHECK(cfg.notify.telegram.chat_id == "-100");
  CHECK(cfg.notify.discord.username == "Porch");
  CHECK(!cfg.alarm.enabled);
  CHECK(cfg.alarm.command == "aplay alarm.wav");
  CHECK(cfg.alarm.timeout == 2500ms);
  CHECK(cfg.ui.headless);

  // [logging] раздаётся по компонентам
  CHECK(!cfg.event.verbose);
  CHECK(!cfg.snapshot.verbose);
  CHECK(!cfg.source.verbose);
  CHECK(!cfg.source.watchdog.verbose);

  CHECK(validate_app_config(cfg).empty());
  return true;
}

bool test_wrong_type_fails_load() {
  const auto tbl = toml::parse(R"(
[event]
min_motion_frames = "five"
)");
  AppConfig cfg;
  CHECK(!load_app_config(tbl, cfg));

  const auto not_a_table = toml::parse(R"(
notify = 3
)");
  NotifyConfig ncfg;
  CHECK(!load_notify_config(not_a_table, ncfg));
  return true;
}

bool test_validation_rejects_bad_event_values() {
  AppConfig cfg;
  cfg.event.min_motion_frames = 0;
  cfg.event.cooldown = std::chrono::seconds(-1);
  cfg.event.max_fps = 0.0;
  cfg.snapshot.jpeg_quality = 0;
  cfg.source.backend = "ffmpeg";

  const auto errors = validate_app_config(cfg);
  CHECK(has_error(errors, "event.min_motion_frames must be >= 1"));
  CHECK(has_error(errors, "event.cooldown_s must be >= 0"));
  CHECK(has_error(errors, "event.max_fps must be > 0"));
  CHECK(has_error(errors, "snapshot.jpeg_quality must be in [1, 100]"));
  CHECK(has_error(errors, "source.backend must be one of auto, opencv, gstreamer"));
  CHECK(errors.size() == 5);
  return true;
}

bool test_validation_rejects_out_of_range_limits() {
  AppConfig cfg;
  cfg.event.cooldown = std::chrono::seconds(10000000000LL);
  cfg.notify.max_pending = 0;
  cfg.alarm.timeout = 0ms;

  const auto errors = validate_app_config(cfg);
  bool cooldown_rejected = false;
  for (const auto& e : errors) {
    if (e.rfind("event.cooldown_s must be <= ", 0) == 0) cooldown_rejected = true;
  }
  CHECK(cooldown_rejected);
  CHECK(has_error(errors, "notify.max_pending must be >= 1"));
  CHECK(has_error(errors, "alarm.timeout_ms must be > 0"));
  CHECK(errors.size() == 3);

  // Самый длинный допустимый cooldown ещё проходит.
  AppConfig edge;
  edge.event.cooldown = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::duration::max());
  CHECK(validate_app_config(edge).empty());

  const auto tbl = toml::parse(R"(
[event]
cooldown_s = 10000000000
)");
  AppConfig loaded;
  CHECK(load_app_config(tbl, loaded));
  CHECK(!validate_app_config(loaded).empty());
  return true;
}

bool test_env_fills_only_empty_credentials() {
  clear_env();
  setenv("WEBHOOK_URL", "https://env.example.com/hook", 1);
  setenv("TELEGRAM_TOKEN", "env-token", 1);
  setenv("TELEGRAM_CHAT_ID", "777", 1);
  setenv("DISCORD_WEBHOOK_URL", "https://env.example.com/discord", 1);

  AppConfig cfg;
  cfg.notify.telegram.token = "from-config";
  apply_env_fallbacks(cfg);

  CHECK(cfg.notify.webhook.url == "https://env.example.com/hook");
  CHECK(cfg.notify.telegram.token == "from-config");
  CHECK(cfg.notify.telegram.chat_id == "777");
  CHECK(cfg.notify.discord.url == "https://env.example.com/discord");

  clear_env();
  setenv("WEBHOOK_URL", "", 1);
  AppConfig empty;
  apply_env_fallbacks(empty);
  CHECK(empty.notify.webhook.url.empty());
  CHECK(empty.notify.telegram.token.empty());

  clear_env();
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_empty_config_keeps_defaults();
  ok &= test_full_config_is_parsed();
  ok &= test_wrong_type_fails_load();
  ok &= test_validation_rejects_bad_event_values();
  ok &= test_validation_rejects_out_of_range_limits();
  ok &= test_env_fills_only_empty_credentials();

  if (!ok) return 1;

  std::cout << "config_flow tests passed\n";
  return 0;
}
