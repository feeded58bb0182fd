// sync/sync_loop.hpp - Periodic mirror of the rover data log
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include "timer.hpp"
#include "transfer.hpp"

namespace roverctl {

struct TickReport {
    uint64_t tick;
    std::chrono::system_clock::time_point at;
    TransferResult result;
};

struct SyncStats {
    uint64_t attempts = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t consecutive_failures = 0;
    uint64_t skipped_deadlines = 0;
};

using Reporter = std::function<void(const TickReport&)>;

// "✓ Data synced at HH:MM:SS" or "✗ Sync failed at HH:MM:SS: reason"
std::string format_tick(const TickReport& report);
void print_tick(const TickReport& report);

class SyncLoop {
public:
    SyncLoop(Transfer& transfer, PeriodicTimer& timer, Reporter reporter = print_tick);

    // Runs until the timer is cancelled or `max_ticks` ticks ran (0 = no limit)
    SyncStats run(uint64_t max_ticks = 0);

    void set_warn_after_failures(uint64_t n) { warn_after_failures_ = n; }
    const SyncStats& stats() const { return stats_; }

private:
    void tick();

    Transfer& transfer_;
    PeriodicTimer& timer_;
    Reporter reporter_;
    uint64_t warn_after_failures_;
    SyncStats stats_;
};

}  // namespace roverctl
