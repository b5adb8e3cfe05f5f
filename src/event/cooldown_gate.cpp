#include "event/cooldown_gate.h"

namespace {
    // seconds -> steady_clock::duration без переполнения: больше максимума = максимум.
    CooldownGate::Clock::duration saturate(std::chrono::seconds s) {
        using Dur = CooldownGate::Clock::duration;
        const auto max_s = std::chrono::duration_cast<std::chrono::seconds>(Dur::max());
        if (s >= max_s) {
            return Dur::max();
        }
        return std::chrono::duration_cast<Dur>(s);
    }
}

CooldownGate::CooldownGate(Clock::duration cooldown)
        : cooldown_(cooldown < Clock::duration::zero() ? Clock::duration::zero() : cooldown) {}

CooldownGate::CooldownGate(std::chrono::seconds cooldown) : CooldownGate(saturate(cooldown)) {}

bool CooldownGate::allow(Clock::time_point now) const {
    std::lock_guard<std::mutex> lk(m_);
    return allow_locked(now);
}

void CooldownGate::accept(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(m_);
    last_accepted_ = now;
}

bool CooldownGate::try_accept(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(m_);
    if (!allow_locked(now)) {
        return false;
    }
    last_accepted_ = now;
    return true;
}

std::optional<CooldownGate::Clock::time_point> CooldownGate::last_accepted() const {
    std::lock_guard<std::mutex> lk(m_);
    return last_accepted_;
}

bool CooldownGate::allow_locked(Clock::time_point now) const {
    if (!last_accepted_) {
        return true;
    }
    return now - *last_accepted_ >= cooldown_;
}
