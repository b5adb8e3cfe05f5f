#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// BlockingQueue<T>: очередь задач для рабочего потока канала уведомлений.
// pop() спит, пока нет элементов и не вызван stop().
// capacity > 0: при переполнении push() вытесняет самый старый элемент.
// После stop() новые элементы не принимаются; stop(true) ещё и выбрасывает
// всё, что не успело уйти в работу.
template<typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    // false, если очередь уже остановлена (элемент не принят).
    // evicted (если не nullptr) = сколько старых элементов вытеснено.
    bool push(T&& v, std::size_t* evicted = nullptr) {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) return false;
            while (capacity_ > 0 && q_.size() >= capacity_) {
                q_.pop_front();
                ++dropped;
            }
            q_.emplace_back(std::move(v));
        }
        cv_.notify_one();
        if (evicted) *evicted = dropped;
        return true;
    }

    // false, если очередь остановлена и в ней больше ничего нет.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return stop_ || !q_.empty(); });

        if (q_.empty()) return false;

        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Возвращает число выброшенных элементов.
    std::size_t stop(bool drop_pending = false) {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
            if (drop_pending) {
                dropped = q_.size();
                q_.clear();
            }
        }
        cv_.notify_all();
        return dropped;
    }

private:
    const std::size_t capacity_;
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool stop_ = false;
};
