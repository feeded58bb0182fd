// sync/sync_cli.cpp - `roverctl sync`
#include "sync_cli.hpp"
#include "../cli.hpp"
#include "../conf/sync_config.hpp"
#include "../log.hpp"
#include "transfer.hpp"

#include <pthread.h>
#include <signal.h>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace roverctl {

SignalCanceller::SignalCanceller(PeriodicTimer& timer) : timer_(timer) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set_, &old_);

    waiter_ = std::thread([this] {
        int sig = 0;
        while (sigwait(&set_, &sig) == 0 && !stopping_) {
            received_++;
            LOGI("Received %s, stopping", strsignal(sig));
            timer_.cancel();
        }
    });
}

SignalCanceller::~SignalCanceller() {
    stopping_ = true;
    pthread_kill(waiter_.native_handle(), SIGTERM);
    waiter_.join();

    // Drop anything that raced the shutdown so the old mask does not deliver it
    struct timespec zero = {0, 0};
    while (sigtimedwait(&set_, nullptr, &zero) > 0) {
    }
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
}

std::optional<uint64_t> parse_count(const std::string& value) {
    if (value.empty() || !isdigit(static_cast<unsigned char>(value[0])))
        return std::nullopt;
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(value, &used);
        if (used != value.size())
            return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int sync_exit_code(const SyncStats& stats, bool cancelled) {
    return cancelled || stats.successes > 0 ? 0 : 1;
}

static void print_sync_help(const CliParser& parser) {
    printf("USAGE: roverctl sync [OPTIONS]\n\n");
    printf("Copies the rover data log from the rover every interval.\n");
    printf("Settings file (key=value): remote, dest, interval, timeout, verify, scp, ssh_option\n\n");
    parser.print_options();
}

int cmd_sync(const std::vector<std::string>& args) {
    SyncSettings settings = SyncSettings::defaults();

    CliParser parser;
    parser.add_option({"config", 'c', "Read settings from a key=value file", true, ""});
    parser.add_option({"remote", 'r', "Remote source user@host:path", true, settings.remote});
    parser.add_option({"dest", 'd', "Local destination directory", true, settings.dest});
    parser.add_option({"interval", 'i', "Seconds between copy attempts", true,
                       std::to_string(settings.interval_sec)});
    parser.add_option({"timeout", 't', "Seconds before a copy attempt is killed", true,
                       std::to_string(settings.timeout_sec)});
    parser.add_option({"count", 'n', "Stop after N attempts (0 runs until interrupted)", true,
                       "0"});
    parser.add_option({"verify", 0, "Only keep copies that parse as a rover data log", false, ""});
    parser.add_option({"ssh-option", 'o', "Extra ssh -o option (repeatable)", true, "", true});
    parser.add_option({"help", 'h', "Show this help", false, ""});

    if (!parser.parse(args)) {
        print_sync_help(parser);
        return 1;
    }
    if (parser.has_option("help")) {
        print_sync_help(parser);
        return 0;
    }
    if (!parser.positional().empty()) {
        printf("Unexpected argument: %s\n", parser.positional()[0].c_str());
        return 1;
    }

    if (auto path = parser.get_option("config")) {
        if (!settings.load_file(*path))
            return 1;
    }

    // Command line wins over the settings file
    for (const char* key : {"remote", "dest", "interval", "timeout"}) {
        if (!parser.has_option(key))
            continue;
        std::string value = *parser.get_option(key);
        if (!settings.set(key, value)) {
            LOGE("Invalid --%s: %s", key, value.c_str());
            return 1;
        }
    }
    if (parser.has_option("verify"))
        settings.verify = true;
    for (const auto& opt : parser.get_all("ssh-option")) {
        if (!settings.set("ssh_option", opt)) {
            LOGE("Invalid --ssh-option: %s", opt.c_str());
            return 1;
        }
    }

    auto count = parse_count(*parser.get_option("count"));
    if (!count) {
        LOGE("Invalid --count: %s", parser.get_option("count")->c_str());
        return 1;
    }

    ScpTransfer transfer(settings);
    PeriodicTimer timer(std::chrono::seconds(settings.interval_sec));
    SyncLoop loop(transfer, timer);

    SyncStats stats;
    {
        SignalCanceller canceller(timer);
        stats = loop.run(*count);
    }

    printf("Sync finished: %llu attempt(s), %llu synced, %llu failed\n",
           static_cast<unsigned long long>(stats.attempts),
           static_cast<unsigned long long>(stats.successes),
           static_cast<unsigned long long>(stats.failures));
    return sync_exit_code(stats, timer.cancelled());
}

}  // namespace roverctl
