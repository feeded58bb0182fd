#pragma once

#include <cstdarg>
#include <string>

namespace roverctl {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

void log_init(const char* tag);
void log_set_level(LogLevel level);
LogLevel log_get_level();

// Mirror every log line into an append-only file. Empty path disables it.
bool log_set_file(const std::string& path);

void log_v(const char* fmt, ...);
void log_d(const char* fmt, ...);
void log_i(const char* fmt, ...);
void log_w(const char* fmt, ...);
void log_e(const char* fmt, ...);

// Helper macros
#define LOGV(...) roverctl::log_v(__VA_ARGS__)
#define LOGD(...) roverctl::log_d(__VA_ARGS__)
#define LOGI(...) roverctl::log_i(__VA_ARGS__)
#define LOGW(...) roverctl::log_w(__VA_ARGS__)
#define LOGE(...) roverctl::log_e(__VA_ARGS__)

}  // namespace roverctl
