#pragma once
#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "blocking_queue.h"
#include "notify/channel.h"
#include "snapshot/snapshot_writer.h"

// Принятое событие движения. Неизменяемо после создания, живёт, пока его не отправят все каналы.
struct MotionEvent {
    std::uint64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::shared_ptr<const notify::Snapshot> snapshot;   // может быть nullptr
};

// EventDispatcher: рассылает событие во все включённые каналы.
// У каждого канала свой поток и своя очередь, поэтому:
//  - dispatch() возвращается сразу и не ждёт сети,
//  - медленный/упавший канал не задерживает остальные,
//  - результат доставки виден только в логе и во future (на состояние цикла не влияет).
class EventDispatcher {
public:
    struct Config {
        bool verbose = true;    // писать результат каждой доставки в лог
        std::size_t max_pending = 8;   // очередь канала; при переполнении теряются самые старые события
    };

    using Report = std::future<notify::ChannelReport>;

    // snapshots может быть nullptr, тогда события уходят без картинки.
    EventDispatcher(const Config& cfg,
                    SnapshotWriter* snapshots,
                    std::vector<std::unique_ptr<notify::Channel>> channels);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Создаёт событие (сообщение + снимок) и раздаёт его каналам.
    std::vector<Report> dispatch(const cv::Mat& frame, std::chrono::system_clock::time_point when);

    // Повторная раздача уже созданного события: каждый канал попробует ещё раз.
    std::vector<Report> dispatch(const std::shared_ptr<const MotionEvent>& event);

    std::shared_ptr<const MotionEvent> make_event(const cv::Mat& frame, std::chrono::system_clock::time_point when);

    // Бросает недоставленное, прерывает текущие HTTP-запросы, дожидается потоков.
    void stop();

    std::size_t active_channels() const { return workers_.size(); }

private:
    struct Job {
        std::shared_ptr<const MotionEvent> event;
        std::promise<notify::ChannelReport> done;
    };

    struct Worker {
        explicit Worker(std::size_t capacity) : queue(capacity) {}

        std::unique_ptr<notify::Channel> channel;
        BlockingQueue<Job> queue;
        std::thread th;
    };

    void workerMain(Worker& w);

    Config cfg_;
    SnapshotWriter* snapshots_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint64_t> next_id_{1};
};
