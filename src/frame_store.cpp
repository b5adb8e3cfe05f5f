#include "frame_store.h"

#include <chrono>

void FrameStore::setFrame(cv::Mat&& frame) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) return;
        last_ = std::move(frame);
        has_frame_ = true;
        ++seq_;
    }
    cv_.notify_all();
}

bool FrameStore::waitFrame(cv::Mat& out, int timeout_ms) {
    std::unique_lock<std::mutex> lk(m_);
    const std::uint64_t my_seq = seq_;

    const auto pred = [&]() {
        return stop_ || (has_frame_ && seq_ != my_seq);
    };

    if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), pred)) {
        return false; // timeout
    }
    if (stop_) return false;

    // Поток захвата каждый раз кладёт новый Mat, поэтому shallow copy безопасна:
    // буфер, который держит out, больше никто не пишет.
    out = last_;
    return true;
}

void FrameStore::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
}
