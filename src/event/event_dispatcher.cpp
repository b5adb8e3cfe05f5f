#include "event/event_dispatcher.h"
#include "util/time_format.h"

#include <algorithm>
#include <iostream>
#include <utility>

EventDispatcher::EventDispatcher(const Config& cfg,
                                 SnapshotWriter* snapshots,
                                 std::vector<std::unique_ptr<notify::Channel>> channels)
        : cfg_(cfg), snapshots_(snapshots) {
    for (auto& ch : channels) {
        if (!ch) continue;

        // Выключенный канал не ошибка, просто не заводим под него поток.
        if (!ch->enabled()) {
            std::cout << "[NOTIFY] " << ch->name() << ": disabled" << std::endl;
            continue;
        }
        std::cout << "[NOTIFY] " << ch->name() << ": enabled" << std::endl;

        auto w = std::make_unique<Worker>(std::max<std::size_t>(1, cfg_.max_pending));
        w->channel = std::move(ch);
        workers_.push_back(std::move(w));
    }

    // Потоки стартуем после заполнения workers_: ссылки на Worker больше не двигаются.
    for (auto& w : workers_) {
        Worker* raw = w.get();
        raw->th = std::thread([this, raw] { workerMain(*raw); });
    }
}

EventDispatcher::~EventDispatcher() {
    stop();
}

std::shared_ptr<const MotionEvent> EventDispatcher::make_event(const cv::Mat& frame,
                                                               std::chrono::system_clock::time_point when) {
    auto ev = std::make_shared<MotionEvent>();
    ev->id = next_id_.fetch_add(1, std::memory_order_relaxed);
    ev->timestamp = when;
    ev->message = util::motionMessage(when);
    if (snapshots_) {
        ev->snapshot = snapshots_->persist(frame, when);
    }
    return ev;
}

std::vector<EventDispatcher::Report> EventDispatcher::dispatch(const cv::Mat& frame,
                                                               std::chrono::system_clock::time_point when) {
    return dispatch(make_event(frame, when));
}

std::vector<EventDispatcher::Report> EventDispatcher::dispatch(const std::shared_ptr<const MotionEvent>& event) {
    std::vector<Report> reports;
    if (!event) {
        return reports;
    }
    reports.reserve(workers_.size());

    for (auto& w : workers_) {
        Job job;
        job.event = event;
        reports.push_back(job.done.get_future());

        // Очередь уже остановлена: job уничтожится, future получит broken_promise.
        // Вытесненные старые задачи получают broken_promise так же.
        std::size_t evicted = 0;
        if (!w->queue.push(std::move(job), &evicted)) {
            continue;
        }
        if (evicted > 0) {
            std::cerr << "[NOTIFY] " << w->channel->name() << ": queue full, dropped "
                      << evicted << " oldest event(s)" << std::endl;
        }
    }
    return reports;
}

void EventDispatcher::stop() {
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    for (auto& w : workers_) {
        const std::size_t dropped = w->queue.stop(true);
        if (dropped > 0 && cfg_.verbose) {
            std::cerr << "[NOTIFY] " << w->channel->name() << ": dropped "
                      << dropped << " pending event(s) on shutdown" << std::endl;
        }
        w->channel->cancel();
    }

    for (auto& w : workers_) {
        if (w->th.joinable()) w->th.join();
    }
}

void EventDispatcher::workerMain(Worker& w) {
    notify::Channel& ch = *w.channel;

    Job job;
    while (w.queue.pop(job)) {
        if (stopping_.load(std::memory_order_acquire)) {
            break;
        }

        notify::ChannelReport report;
        report.channel = ch.name();
        report.event_id = job.event->id;

        try {
            report.outcome = ch.send(job.event->message, job.event->snapshot.get());
        } catch (const std::exception& e) {
            report.outcome = notify::ChannelOutcome::failed(e.what());
        }

        if (cfg_.verbose) {
            auto& os = (report.outcome.status == notify::DeliveryStatus::Failed) ? std::cerr : std::cout;
            os << "[NOTIFY] " << report.channel << ": event #" << report.event_id << " "
               << notify::to_string(report.outcome.status);
            if (!report.outcome.reason.empty()) {
                os << " (" << report.outcome.reason << ")";
            }
            os << std::endl;
        }

        job.done.set_value(std::move(report));
        job = Job{};
    }
}
