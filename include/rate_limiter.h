#pragma once
#include <algorithm>
#include <chrono>

// RateLimiter: ограничивает частоту, с которой кадры попадают в обработку движения.
// admit() не спит: кадр, пришедший раньше слота, просто пропускается вызывающим кодом.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(double max_fps)
            : period_(std::chrono::duration_cast<Clock::duration>(
                      std::chrono::duration<double>(1.0 / std::max(0.1, max_fps)))) {}

    // true, если с последнего допущенного кадра прошло не меньше period_.
    bool admit(Clock::time_point now) {
        if (has_last_ && now - last_ < period_) {
            return false;
        }
        last_ = now;
        has_last_ = true;
        return true;
    }

    void reset() {
        has_last_ = false;
    }

    Clock::duration period() const { return period_; }

private:
    Clock::duration period_;
    Clock::time_point last_{};
    bool has_last_ = false;
};
