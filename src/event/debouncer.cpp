#include "event/debouncer.h"

#include <algorithm>

Debouncer::Debouncer(int window_size)
        : capacity_(static_cast<std::size_t>(std::max(1, window_size))) {}

bool Debouncer::offer(bool is_motion) {
    window_.push_back(is_motion);
    if (is_motion) {
        ++positives_;
    }

    // Окно заполнено: выталкиваем самый старый флаг.
    if (window_.size() > capacity_) {
        if (window_.front()) {
            --positives_;
        }
        window_.pop_front();
    }

    if (window_.size() < capacity_) {
        return false;
    }

    if (positives_ != capacity_) {
        return false;
    }

    // Подтверждено. Чистим окно, чтобы длительное движение не давало событие на каждом кадре.
    reset();
    return true;
}

void Debouncer::reset() {
    window_.clear();
    positives_ = 0;
}
