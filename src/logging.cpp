#include "hubdrive/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <string>

namespace hubdrive {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "NONE";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "?";
    }
}

LogLevel stringToLogLevel(const char* str) {
    if (!str) return LogLevel::INFO;

    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "NONE" || upper == "OFF")     return LogLevel::NONE;
    if (upper == "ERROR")                      return LogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "DEBUG")                      return LogLevel::DEBUG;
    if (upper == "TRACE")                      return LogLevel::TRACE;
    return LogLevel::INFO;
}

void vlog(LogLevel level, const char* category, const char* fmt, va_list args) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    std::fprintf(out, "[%3d.%03d][%-5s][%-5s] %s\n", secs, ms,
                 logLevelToString(level), category ? category : "", msg);
    std::fflush(out);
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

} // namespace hubdrive
