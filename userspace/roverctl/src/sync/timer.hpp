// sync/timer.hpp - Cancellable fixed-rate timer
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace roverctl {

class PeriodicTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit PeriodicTimer(std::chrono::milliseconds interval);

    // Blocks until the next deadline. The first call returns at once.
    // Returns false once cancel() has been called.
    bool wait_next();

    // Safe from any thread; wakes a blocked wait_next()
    void cancel();
    bool cancelled() const;

    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t ticks() const { return ticks_; }
    // Deadlines passed over because a tick ran longer than the interval
    uint64_t skipped() const { return skipped_; }

private:
    const std::chrono::milliseconds interval_;
    Clock::time_point next_;
    bool started_ = false;
    uint64_t ticks_ = 0;
    uint64_t skipped_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace roverctl
