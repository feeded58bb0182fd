#include "log.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace roverctl {

static LogLevel g_log_level = LogLevel::INFO;
static char g_log_tag[32] = "roverctl";
static FILE* g_log_file = nullptr;
static std::mutex g_log_mutex;

void log_init(const char* tag) {
    strncpy(g_log_tag, tag, sizeof(g_log_tag) - 1);
    g_log_tag[sizeof(g_log_tag) - 1] = '\0';
}

void log_set_level(LogLevel level) {
    g_log_level = level;
}

LogLevel log_get_level() {
    return g_log_level;
}

bool log_set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) {
        fclose(g_log_file);
        g_log_file = nullptr;
    }
    if (path.empty())
        return true;

    g_log_file = fopen(path.c_str(), "a");
    if (!g_log_file) {
        fprintf(stderr, "Failed to open log file %s: %s\n", path.c_str(), strerror(errno));
        return false;
    }
    setvbuf(g_log_file, nullptr, _IOLBF, 0);
    return true;
}

static void log_write(LogLevel level, const char* fmt, va_list args) {
    if (level < g_log_level)
        return;

    const char* level_str;
    switch (level) {
    case LogLevel::VERBOSE:
        level_str = "V";
        break;
    case LogLevel::DEBUG:
        level_str = "D";
        break;
    case LogLevel::INFO:
        level_str = "I";
        break;
    case LogLevel::WARN:
        level_str = "W";
        break;
    case LogLevel::ERROR:
        level_str = "E";
        break;
    default:
        level_str = "?";
        break;
    }

    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, args);

    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    char time_buf[32];
    strftime(time_buf, sizeof(time_buf), "%m-%d %H:%M:%S", &tm_info);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s %s/%s: %s\n", time_buf, level_str, g_log_tag, msg);

    if (g_log_file) {
        fprintf(g_log_file, "%s %s/%s: %s\n", time_buf, level_str, g_log_tag, msg);
    }
}

void log_v(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::VERBOSE, fmt, args);
    va_end(args);
}

void log_d(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void log_i(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::INFO, fmt, args);
    va_end(args);
}

void log_w(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::WARN, fmt, args);
    va_end(args);
}

void log_e(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::ERROR, fmt, args);
    va_end(args);
}

}  // namespace roverctl
