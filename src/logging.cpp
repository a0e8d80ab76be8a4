#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

char level_letter(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return 'E';
        case LogLevel::Warn: return 'W';
        case LogLevel::Info: return 'I';
        case LogLevel::Debug: return 'D';
    }
    return '?';
}

void write_line(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(level) > g_level.load(std::memory_order_relaxed)) {
        return;
    }

    char message[RC_LOG_MAX_MESSAGE_LEN];
    const int n = std::vsnprintf(message, sizeof(message), fmt, args);
    if (n < 0) {
        std::snprintf(message, sizeof(message), "%s", "formatting error");
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "%s.%03dZ %c (%s) %s\n",
                 stamp, static_cast<int>(millis), level_letter(level), tag ? tag : "-", message);
}
} // namespace

void init_logging(LogLevel level) {
    set_log_level(level);
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(const char* text, LogLevel& out) {
    if (text == nullptr) {
        return false;
    }
    if (std::strcmp(text, "error") == 0) { out = LogLevel::Error; return true; }
    if (std::strcmp(text, "warn") == 0) { out = LogLevel::Warn; return true; }
    if (std::strcmp(text, "info") == 0) { out = LogLevel::Info; return true; }
    if (std::strcmp(text, "debug") == 0) { out = LogLevel::Debug; return true; }
    return false;
}

void log_error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(LogLevel::Error, tag, fmt, args);
    va_end(args);
}

void log_warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(LogLevel::Warn, tag, fmt, args);
    va_end(args);
}

void log_info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(LogLevel::Info, tag, fmt, args);
    va_end(args);
}

void log_debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(LogLevel::Debug, tag, fmt, args);
    va_end(args);
}
