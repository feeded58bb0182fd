// sync/sync_cli.hpp - `roverctl sync`
#pragma once

#include <signal.h>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "sync_loop.hpp"
#include "timer.hpp"

namespace roverctl {

// Blocks SIGINT/SIGTERM for the process and turns them into a timer cancel
// from a dedicated thread, so the loop stops between ticks. Every signal
// that arrives while the canceller lives is consumed.
class SignalCanceller {
public:
    explicit SignalCanceller(PeriodicTimer& timer);
    ~SignalCanceller();

    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

    uint64_t received() const { return received_; }

private:
    PeriodicTimer& timer_;
    sigset_t set_;
    sigset_t old_;
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> received_{0};
    std::thread waiter_;
};

// Decimal attempt count, no sign or trailing text
std::optional<uint64_t> parse_count(const std::string& value);

// 0 on a cancelled run or when at least one copy succeeded
int sync_exit_code(const SyncStats& stats, bool cancelled);

int cmd_sync(const std::vector<std::string>& args);

}  // namespace roverctl
