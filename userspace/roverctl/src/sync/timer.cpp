// sync/timer.cpp - Cancellable fixed-rate timer
#include "timer.hpp"
#include "../log.hpp"

namespace roverctl {

PeriodicTimer::PeriodicTimer(std::chrono::milliseconds interval) : interval_(interval) {}

bool PeriodicTimer::wait_next() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_)
        return false;

    auto now = Clock::now();
    if (!started_) {
        started_ = true;
        next_ = now + interval_;
        ticks_++;
        return true;
    }

    // Skip deadlines that already passed instead of firing a burst of ticks
    if (now > next_) {
        uint64_t missed = static_cast<uint64_t>((now - next_) / interval_);
        if (missed > 0) {
            skipped_ += missed;
            next_ += interval_ * static_cast<int64_t>(missed);
            LOGW("Tick overran the interval, skipped %llu deadline(s)",
                 static_cast<unsigned long long>(missed));
        }
    }

    if (cv_.wait_until(lock, next_, [this] { return cancelled_; }))
        return false;

    next_ += interval_;
    ticks_++;
    return true;
}

void PeriodicTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool PeriodicTimer::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

}  // namespace roverctl
