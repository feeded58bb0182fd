// sync/sync_loop.cpp - Periodic mirror of the rover data log
#include "sync_loop.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <cstdio>
#include <utility>

namespace roverctl {

std::string format_tick(const TickReport& report) {
    std::string clock = format_clock(report.at);
    if (report.result.ok)
        return "✓ Data synced at " + clock;
    return "✗ Sync failed at " + clock + ": " + report.result.message;
}

void print_tick(const TickReport& report) {
    printf("%s\n", format_tick(report).c_str());
    fflush(stdout);
}

SyncLoop::SyncLoop(Transfer& transfer, PeriodicTimer& timer, Reporter reporter)
    : transfer_(transfer),
      timer_(timer),
      reporter_(std::move(reporter)),
      warn_after_failures_(SYNC_WARN_AFTER_FAILURES) {}

SyncStats SyncLoop::run(uint64_t max_ticks) {
    LOGI("Syncing %s every %lld ms", transfer_.describe().c_str(),
         static_cast<long long>(timer_.interval().count()));

    while (max_ticks == 0 || stats_.attempts < max_ticks) {
        if (!timer_.wait_next())
            break;
        tick();
    }

    stats_.skipped_deadlines = timer_.skipped();
    LOGI("Sync stopped after %llu attempt(s): %llu ok, %llu failed",
         static_cast<unsigned long long>(stats_.attempts),
         static_cast<unsigned long long>(stats_.successes),
         static_cast<unsigned long long>(stats_.failures));
    return stats_;
}

void SyncLoop::tick() {
    stats_.attempts++;

    TickReport report{stats_.attempts, std::chrono::system_clock::now(), transfer_.fetch()};

    if (report.result.ok) {
        if (stats_.consecutive_failures >= warn_after_failures_) {
            LOGI("Sync recovered after %llu failure(s)",
                 static_cast<unsigned long long>(stats_.consecutive_failures));
        }
        stats_.successes++;
        stats_.consecutive_failures = 0;
        LOGD("tick %llu: %llu bytes", static_cast<unsigned long long>(report.tick),
             static_cast<unsigned long long>(report.result.bytes));
    } else {
        stats_.failures++;
        stats_.consecutive_failures++;
        LOGD("tick %llu failed: %s", static_cast<unsigned long long>(report.tick),
             report.result.message.c_str());
        if (warn_after_failures_ > 0 && stats_.consecutive_failures == warn_after_failures_) {
            LOGW("%llu consecutive sync failures, last: %s",
                 static_cast<unsigned long long>(stats_.consecutive_failures),
                 report.result.message.c_str());
        }
    }

    if (reporter_)
        reporter_(report);
}

}  // namespace roverctl
