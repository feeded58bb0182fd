// sync/transfer.cpp - scp based fetch
#include "transfer.hpp"
#include "../datalog/datalog.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace roverctl {

ScpTransfer::ScpTransfer(SyncSettings settings) : settings_(std::move(settings)) {}

std::string ScpTransfer::destination() const {
    std::string dir = settings_.dest;
    if (!ends_with(dir, "/"))
        dir += "/";
    return dir + settings_.remote_name();
}

std::string ScpTransfer::part_path() const {
    std::string dir = settings_.dest;
    if (!ends_with(dir, "/"))
        dir += "/";
    return dir + "." + settings_.remote_name() + PART_SUFFIX;
}

std::vector<std::string> ScpTransfer::argv() const {
    unsigned connect_timeout = std::min(SYNC_CONNECT_TIMEOUT_SEC, settings_.timeout_sec);

    std::vector<std::string> args = {
        settings_.scp,
        "-q",
        "-o",
        "BatchMode=yes",
        "-o",
        "ConnectTimeout=" + std::to_string(connect_timeout),
    };
    for (const auto& opt : settings_.ssh_options) {
        args.push_back("-o");
        args.push_back(opt);
    }
    args.push_back(settings_.remote);
    args.push_back(part_path());
    return args;
}

std::string ScpTransfer::describe() const {
    return settings_.remote + " -> " + destination();
}

static std::string first_line(const std::string& text) {
    std::string t = trim(text);
    size_t nl = t.find('\n');
    return nl == std::string::npos ? t : trim(t.substr(0, nl));
}

TransferResult ScpTransfer::fetch() {
    TransferResult result{false, -1, false, "", 0};
    const std::string part = part_path();

    if (!is_directory(settings_.dest)) {
        result.message = "destination " + settings_.dest + " is not a directory";
        return result;
    }

    ExecOptions opts;
    opts.timeout = std::chrono::seconds(settings_.timeout_sec);

    auto exec = exec_command(argv(), opts);
    result.exit_code = exec.exit_code;
    result.timed_out = exec.timed_out;

    if (exec.timed_out) {
        unlink(part.c_str());
        result.message = "copy timed out after " + std::to_string(settings_.timeout_sec) + "s";
        return result;
    }

    if (exec.exit_code != 0) {
        unlink(part.c_str());
        std::string reason = first_line(exec.stderr_str);
        if (reason.empty()) {
            reason = exec.exit_code == 127 ? settings_.scp + " could not be executed"
                                           : "scp exited with " + std::to_string(exec.exit_code);
        }
        result.message = reason;
        return result;
    }

    struct stat st;
    if (stat(part.c_str(), &st) != 0) {
        result.message = "scp reported success but " + part + " is missing";
        return result;
    }

    if (settings_.verify) {
        try {
            auto log = DataLog::load(part);
            LOGD("Verified %zu data log entries", log.entries().size());
        } catch (const DataLogError& e) {
            unlink(part.c_str());
            result.message = std::string("downloaded file rejected: ") + e.what();
            return result;
        }
    }

    std::string dest = destination();
    if (rename(part.c_str(), dest.c_str()) != 0) {
        result.message = "rename to " + dest + " failed: " + strerror(errno);
        unlink(part.c_str());
        return result;
    }

    result.ok = true;
    result.bytes = static_cast<uint64_t>(st.st_size);
    return result;
}

}  // namespace roverctl
