#include "rtsp_watch_dog.h"

#include <iostream>

void RtspWatchDog::start(long long now_ms) {
    start_ms_ = now_ms;
    last_frame_ms_ = now_ms;
    last_restart_ms_ = now_ms;
    restarted_ = false;
}

void RtspWatchDog::frameReceived(long long now_ms) {
    last_frame_ms_ = now_ms;
}

bool RtspWatchDog::shouldRestart(long long now_ms) {
    const long long since_start = now_ms - start_ms_;
    const long long no_frame_ms = now_ms - last_frame_ms_;
    const long long since_restart = now_ms - last_restart_ms_;

    if (since_start <= static_cast<long long>(cfg_.startup_grace_ms)) {
        return false;
    }
    if (no_frame_ms <= static_cast<long long>(cfg_.no_frame_timeout_ms)) {
        return false;
    }
    // Первый рестарт не ограничиваем cooldown'ом: отсчёт идёт от старта, который уже старше grace.
    if (restarted_ && since_restart <= static_cast<long long>(cfg_.restart_cooldown_ms)) {
        return false;
    }

    if (cfg_.verbose) {
        std::cout << "[WATCHDOG] No frames for " << no_frame_ms
                  << " ms -> restarting stream" << std::endl;
    }

    last_restart_ms_ = now_ms;
    last_frame_ms_ = now_ms;
    restarted_ = true;
    return true;
}
