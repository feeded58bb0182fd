#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "sync/sync_cli.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

namespace roverctl {
namespace {

using test::TempDir;
using test::write_script;

const char* kLog = R"([{"timestamp": "2024-05-01T10:00:00", "action": "stop"}])";

class SyncCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(write_file(tools_.file("fixture.json"), kLog));
        // Records its arguments, counts calls and copies the fixture to the last one
        good_scp_ = write_script(tools_.file("scp"),
                                 "printf '%s\\n' \"$@\" > '" + tools_.file("args") + "'\n" +
                                     "echo copy >> '" + tools_.file("calls") + "'\n" +
                                     "for last; do :; done\n" + "cat '" +
                                     tools_.file("fixture.json") + "' > \"$last\"\n");
        bad_scp_ = write_script(tools_.file("scp-down"),
                                "echo copy >> '" + tools_.file("calls") + "'\n"
                                "echo 'ssh: Could not resolve hostname rover.lan' >&2\n"
                                "exit 1\n");
    }

    std::string settings_file(const std::string& scp) {
        std::string path = tools_.file("sync.conf");
        EXPECT_TRUE(write_file(path, "scp = " + scp + "\n" +
                                         "remote = pi@file.lan:/x/rover_data_log.json\n" +
                                         "dest = " + dest_.file("from-file") + "\n" +
                                         "ssh_option = Port=2222\n" + "interval = 30\n"));
        return path;
    }

    int sync(const std::vector<std::string>& args) {
        ::testing::internal::CaptureStdout();
        int rc = cmd_sync(args);
        output_ = ::testing::internal::GetCapturedStdout();
        return rc;
    }

    std::vector<std::string> recorded_args() const {
        return split(trim(read_file(tools_.file("args")).value_or("")), '\n');
    }

    size_t calls() const {
        auto content = trim(read_file(tools_.file("calls")).value_or(""));
        return content.empty() ? 0 : split(content, '\n').size();
    }

    TempDir dest_;
    TempDir tools_;
    std::string good_scp_;
    std::string bad_scp_;
    std::string output_;
};

TEST_F(SyncCommandTest, CommandLineOverridesSettingsFile) {
    int rc = sync({"--config", settings_file(good_scp_), "--remote",
                   "pi@cli.lan:/y/rover_data_log.json", "--dest", dest_.path(), "--interval", "1",
                   "--count", "2", "-o", "User=pi"});

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(calls(), 2u);
    EXPECT_NE(output_.find("Sync finished: 2 attempt(s), 2 synced, 0 failed"), std::string::npos);
    EXPECT_EQ(read_file(dest_.file("rover_data_log.json")).value_or(""), kLog);
    EXPECT_FALSE(is_directory(dest_.file("from-file")));

    auto args = recorded_args();
    EXPECT_NE(std::find(args.begin(), args.end(), "pi@cli.lan:/y/rover_data_log.json"),
              args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "pi@file.lan:/x/rover_data_log.json"),
              args.end());

    // File options come first, command line options are added after them
    auto port = std::find(args.begin(), args.end(), "Port=2222");
    auto user = std::find(args.begin(), args.end(), "User=pi");
    ASSERT_NE(port, args.end());
    ASSERT_NE(user, args.end());
    EXPECT_LT(port - args.begin(), user - args.begin());
}

TEST_F(SyncCommandTest, EveryCopyFailingExitsOne) {
    int rc = sync({"--config", settings_file(bad_scp_), "--dest", dest_.path(), "--count", "1"});

    EXPECT_EQ(rc, 1);
    EXPECT_EQ(calls(), 1u);
    EXPECT_NE(output_.find("✗ Sync failed at "), std::string::npos);
    EXPECT_NE(output_.find("1 attempt(s), 0 synced, 1 failed"), std::string::npos);
}

TEST_F(SyncCommandTest, MalformedCountIsRejected) {
    std::string conf = settings_file(good_scp_);
    for (const char* count : {"-1", "5x", "+3", "ten"}) {
        EXPECT_EQ(sync({"--config", conf, "--dest", dest_.path(), std::string("--count=") + count}),
                  1)
            << count;
    }
    EXPECT_EQ(calls(), 0u);
}

TEST_F(SyncCommandTest, BrokenSettingsFileFails) {
    std::string conf = tools_.file("broken.conf");
    ASSERT_TRUE(write_file(conf, "interval = soon\n"));
    EXPECT_EQ(sync({"--config", conf, "--count", "1"}), 1);
    EXPECT_EQ(sync({"--config", tools_.file("missing.conf"), "--count", "1"}), 1);
    EXPECT_EQ(calls(), 0u);
}

TEST(ParseCountTest, DecimalOnly) {
    EXPECT_EQ(parse_count("0"), std::optional<uint64_t>(0));
    EXPECT_EQ(parse_count("12"), std::optional<uint64_t>(12));
    EXPECT_FALSE(parse_count(""));
    EXPECT_FALSE(parse_count("-1"));
    EXPECT_FALSE(parse_count(" 3"));
    EXPECT_FALSE(parse_count("5x"));
    EXPECT_FALSE(parse_count("99999999999999999999999"));
}

TEST(SyncExitCodeTest, CancelledRunIsClean) {
    SyncStats none;
    none.attempts = 2;
    none.failures = 2;
    EXPECT_EQ(sync_exit_code(none, true), 0);
    EXPECT_EQ(sync_exit_code(none, false), 1);
    EXPECT_EQ(sync_exit_code(SyncStats{}, true), 0);

    SyncStats some;
    some.attempts = 3;
    some.successes = 1;
    some.failures = 2;
    EXPECT_EQ(sync_exit_code(some, false), 0);
}

bool wait_for(const SignalCanceller& canceller, uint64_t n) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (canceller.received() < n) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

TEST(SignalCancellerTest, ConsumesRepeatedSignals) {
    PeriodicTimer timer(std::chrono::seconds(1));
    {
        SignalCanceller canceller(timer);
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
        ASSERT_TRUE(wait_for(canceller, 1));
        EXPECT_TRUE(timer.cancelled());

        // A second interrupt while stopping is absorbed, not left pending
        ASSERT_EQ(kill(getpid(), SIGTERM), 0);
        ASSERT_TRUE(wait_for(canceller, 2));
    }

    sigset_t pending;
    sigemptyset(&pending);
    ASSERT_EQ(sigpending(&pending), 0);
    EXPECT_FALSE(sigismember(&pending, SIGINT));
    EXPECT_FALSE(sigismember(&pending, SIGTERM));
}

}  // namespace
}  // namespace roverctl
