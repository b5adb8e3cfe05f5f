#pragma once

#include <cstdint>

// Watchdog перезапуска потока, если кадры перестали приходить.
// Время передаётся снаружи (мс steady_clock), чтобы логику можно было гонять в тестах.
class RtspWatchDog {
public:
    struct Config {
        // ------------------------- [source.watchdog] -------------------------
        // Таймаут отсутствия кадров (мс)
        std::uint64_t no_frame_timeout_ms = 1500;

        // Минимальный интервал между рестартами (мс)
        std::uint64_t restart_cooldown_ms = 1000;

        // Льготный период после старта (мс)
        std::uint64_t startup_grace_ms = 3000;

        // Писать "[WATCHDOG] ..." при рестарте (из [logging] rtsp_logger)
        bool verbose = true;
    };

    explicit RtspWatchDog(const Config& cfg) : cfg_(cfg) {}

    void start(long long now_ms);
    void frameReceived(long long now_ms);

    // true = пора перезапускать. Сразу считает, что рестарт выполнен в now_ms.
    bool shouldRestart(long long now_ms);

private:
    Config cfg_;
    long long start_ms_ = 0;
    long long last_frame_ms_ = 0;
    long long last_restart_ms_ = 0;
    bool restarted_ = false;
};
