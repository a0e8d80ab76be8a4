#pragma once

#include <cstdarg>

#ifndef RC_LOG_MAX_MESSAGE_LEN
#define RC_LOG_MAX_MESSAGE_LEN 512
#endif

enum class LogLevel : int {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

void init_logging(LogLevel level = LogLevel::Info);
void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "error", "warn", "info", "debug". Leaves `out` untouched otherwise.
bool parse_log_level(const char* text, LogLevel& out);

void log_error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
