#include "event/motion_pipeline.h"

#include <iostream>

MotionPipeline::MotionPipeline(const Config& cfg, MotionSignal& signal, EventDispatcher& dispatcher)
        : cfg_(cfg),
          signal_(signal),
          dispatcher_(dispatcher),
          limiter_(cfg.max_fps),
          debouncer_(cfg.min_motion_frames),
          gate_(cfg.cooldown) {}

MotionPipeline::Step MotionPipeline::process(const cv::Mat& frame) {
    return process(frame, std::chrono::steady_clock::now(), std::chrono::system_clock::now());
}

MotionPipeline::Step MotionPipeline::process(const cv::Mat& frame,
                                             std::chrono::steady_clock::time_point now,
                                             std::chrono::system_clock::time_point wall_now) {
    Step step;

    // Пропущенный кадр не считается "нет движения": окно Debouncer'а не трогаем.
    if (!limiter_.admit(now)) {
        return step;
    }
    step.admitted = true;

    step.motion = signal_.evaluate(frame);
    step.confirmed = debouncer_.offer(step.motion);
    if (!step.confirmed) {
        return step;
    }

    if (!gate_.try_accept(now)) {
        if (cfg_.verbose) {
            std::cout << "[EVENT] motion confirmed, suppressed by cooldown" << std::endl;
        }
        return step;
    }
    step.accepted = true;

    if (cfg_.verbose) {
        std::cout << "[EVENT] motion confirmed, dispatching" << std::endl;
    }

    // Результаты доставки нас здесь не интересуют: они уходят в лог каналов.
    dispatcher_.dispatch(frame, wall_now);
    return step;
}
