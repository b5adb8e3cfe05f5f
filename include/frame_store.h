#pragma once
#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// FrameStore: "последний кадр" между потоком захвата и циклом обработки.
// Старые кадры перезаписываются, цикл всегда видит самый свежий.
class FrameStore {
public:
    FrameStore() = default;

    void setFrame(cv::Mat&& frame);

    // Ждёт кадр новее, чем был на момент вызова. false = таймаут или stop().
    bool waitFrame(cv::Mat& out, int timeout_ms);

    void stop();

private:
    std::mutex m_;
    std::condition_variable cv_;
    cv::Mat last_;
    bool has_frame_ = false;
    std::uint64_t seq_ = 0;
    bool stop_ = false;
};
