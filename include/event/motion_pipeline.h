#pragma once
#include <opencv2/core.hpp>
#include <chrono>

#include "detect/motion_detector.h"
#include "event/cooldown_gate.h"
#include "event/debouncer.h"
#include "event/event_dispatcher.h"
#include "rate_limiter.h"

// MotionPipeline: покадровая цепочка
//   RateLimiter -> MotionSignal -> Debouncer -> CooldownGate -> EventDispatcher.
// Вызывается строго из одного потока (цикла кадров), порядок кадров важен для окна.
class MotionPipeline {
public:
    struct Config {
        int min_motion_frames = 5;                     // N подряд положительных кадров
        std::chrono::seconds cooldown{20};             // минимум между уведомлениями
        double max_fps = 8.0;                          // потолок частоты анализа
        bool verbose = false;                          // лог каждого подтверждения
    };

    struct Step {
        bool admitted = false;    // кадр прошёл RateLimiter
        bool motion = false;      // MotionSignal сказал "есть движение"
        bool confirmed = false;   // Debouncer подтвердил событие
        bool accepted = false;    // CooldownGate пропустил, событие отправлено
    };

    MotionPipeline(const Config& cfg, MotionSignal& signal, EventDispatcher& dispatcher);

    Step process(const cv::Mat& frame,
                 std::chrono::steady_clock::time_point now,
                 std::chrono::system_clock::time_point wall_now);

    // Удобная перегрузка для основного цикла: берёт текущее время.
    Step process(const cv::Mat& frame);

    const Debouncer& debouncer() const { return debouncer_; }
    const CooldownGate& cooldown_gate() const { return gate_; }

private:
    Config cfg_;
    MotionSignal& signal_;
    EventDispatcher& dispatcher_;
    RateLimiter limiter_;
    Debouncer debouncer_;
    CooldownGate gate_;
};
