#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "sync/timer.hpp"

namespace roverctl {
namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST(PeriodicTimerTest, FirstTickIsImmediate) {
    PeriodicTimer timer(10s);
    auto start = Clock::now();
    EXPECT_TRUE(timer.wait_next());
    EXPECT_LT(Clock::now() - start, 500ms);
    EXPECT_EQ(timer.ticks(), 1u);
}

TEST(PeriodicTimerTest, TicksAtFixedRate) {
    PeriodicTimer timer(50ms);
    auto start = Clock::now();
    for (int i = 0; i < 4; i++) {
        ASSERT_TRUE(timer.wait_next());
    }
    auto elapsed = Clock::now() - start;
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(timer.ticks(), 4u);
}

TEST(PeriodicTimerTest, WorkInsideTheIntervalDoesNotShiftTheSchedule) {
    PeriodicTimer timer(100ms);
    auto start = Clock::now();
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(timer.wait_next());
        std::this_thread::sleep_for(60ms);
    }
    // Ticks at 0, 100, 200 plus the last 60ms of work
    EXPECT_LT(Clock::now() - start, 450ms);
}

TEST(PeriodicTimerTest, CancelWakesWaiter) {
    PeriodicTimer timer(10s);
    ASSERT_TRUE(timer.wait_next());

    std::thread canceller([&timer] {
        std::this_thread::sleep_for(50ms);
        timer.cancel();
    });

    auto start = Clock::now();
    EXPECT_FALSE(timer.wait_next());
    EXPECT_LT(Clock::now() - start, 5s);
    canceller.join();

    EXPECT_TRUE(timer.cancelled());
    EXPECT_FALSE(timer.wait_next());
}

TEST(PeriodicTimerTest, CancelBeforeFirstTick) {
    PeriodicTimer timer(10ms);
    timer.cancel();
    EXPECT_FALSE(timer.wait_next());
    EXPECT_EQ(timer.ticks(), 0u);
}

TEST(PeriodicTimerTest, SkipsMissedDeadlines) {
    PeriodicTimer timer(20ms);
    ASSERT_TRUE(timer.wait_next());
    std::this_thread::sleep_for(110ms);

    auto start = Clock::now();
    ASSERT_TRUE(timer.wait_next());
    EXPECT_LT(Clock::now() - start, 100ms);
    EXPECT_GE(timer.skipped(), 2u);

    // No burst of catch-up ticks after an overrun
    start = Clock::now();
    ASSERT_TRUE(timer.wait_next());
    EXPECT_GE(Clock::now() - start, 1ms);
}

}  // namespace
}  // namespace roverctl
