#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
// Prevent Windows ERROR macro from corrupting LOG_* macros
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace hubdrive {

enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Per-subsystem switches, all on by default
struct LogCategories {
    bool session = true;    // Session manager, queue, relay
    bool link = true;       // Link adapters and transports
    bool gui = true;        // Control surface, CLI, settings
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect all output (nullptr restores stderr). Caller keeps ownership of file.
void setLogFile(FILE* file);

const char* logLevelToString(LogLevel level);
LogLevel stringToLogLevel(const char* str);

// printf-style. Thread-safe; one line per call.
void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void vlog(LogLevel level, const char* category, const char* fmt, va_list args);

} // namespace hubdrive

#define HUBDRIVE_LOG_IMPL(enabled, level, category, ...)                         \
    do {                                                                         \
        if ((enabled) && hubdrive::g_log_level >= hubdrive::LogLevel::level) {   \
            hubdrive::log(hubdrive::LogLevel::level, category, __VA_ARGS__);     \
        }                                                                        \
    } while (0)

#define LOG_SESSION(level, ...) \
    HUBDRIVE_LOG_IMPL(hubdrive::g_log_categories.session, level, "SESS", __VA_ARGS__)
#define LOG_LINK(level, ...) \
    HUBDRIVE_LOG_IMPL(hubdrive::g_log_categories.link, level, "LINK", __VA_ARGS__)
#define LOG_GUI(level, ...) \
    HUBDRIVE_LOG_IMPL(hubdrive::g_log_categories.gui, level, "GUI", __VA_ARGS__)
