#pragma once
#include <cstddef>
#include <deque>

// Debouncer: превращает шумный покадровый флаг движения в подтверждённые события.
// Событие подтверждается, только если ВСЕ последние N флагов положительные
// (не голосование большинством). После подтверждения окно очищается,
// и для следующего события нужно снова набрать N положительных кадров подряд.
class Debouncer {
public:
    explicit Debouncer(int window_size);

    // Добавляет флаг текущего кадра. true = событие подтверждено на этом кадре.
    bool offer(bool is_motion);

    void reset();

    std::size_t size() const { return window_.size(); }
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<bool> window_;   // - последние N флагов, старые слева.
    std::size_t positives_ = 0; // - сколько true сейчас в window_.
};
