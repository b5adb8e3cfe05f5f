#pragma once
#include <chrono>
#include <mutex>
#include <optional>

// CooldownGate: не пропускает подтверждённые события чаще, чем раз в cooldown.
// allow()/accept() оставлены раздельными, но в цикле используется try_accept():
// проверка и запись делаются под одним мьютексом.
class CooldownGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit CooldownGate(Clock::duration cooldown);

    // Секунды из конфига: слишком большое значение насыщается до Clock::duration::max().
    explicit CooldownGate(std::chrono::seconds cooldown);

    bool allow(Clock::time_point now) const;
    void accept(Clock::time_point now);

    // allow() + accept() атомарно. true = событие принято.
    bool try_accept(Clock::time_point now);

    Clock::duration cooldown() const { return cooldown_; }
    std::optional<Clock::time_point> last_accepted() const;

private:
    bool allow_locked(Clock::time_point now) const;

    const Clock::duration cooldown_;
    mutable std::mutex m_;
    std::optional<Clock::time_point> last_accepted_;
};
