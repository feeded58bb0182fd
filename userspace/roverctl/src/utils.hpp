#pragma once

#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace roverctl {

// File system utilities
bool ensure_dir_exists(const std::string& path, mode_t mode = 0755);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// String utilities
std::string trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char delim);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

// Local wall clock as HH:MM:SS
std::string format_clock(std::chrono::system_clock::time_point tp);

// File I/O
std::optional<std::string> read_file(const std::string& path);
bool write_file(const std::string& path, const std::string& content);
// Writes to a sibling temp file and renames it over `path`
bool write_file_atomic(const std::string& path, const std::string& content,
                       mode_t mode = 0644);

// User database
struct UserInfo {
    std::string name;
    uid_t uid;
    gid_t gid;
    std::string home;
};
std::optional<UserInfo> lookup_user(const std::string& name);
// $SUDO_USER, then $USER, then the real uid
std::optional<UserInfo> resolve_target_user();
// "~" and "~/..." are resolved against `home`
std::string expand_home(const std::string& path, const std::string& home);

// Command execution
struct ExecOptions {
    std::string workdir;
    // zero means no limit
    std::chrono::milliseconds timeout{0};
};

struct ExecResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
    bool timed_out;
};
ExecResult exec_command(const std::vector<std::string>& args, const ExecOptions& opts = {});

}  // namespace roverctl
