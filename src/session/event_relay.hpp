#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hubdrive {
namespace session {

enum class EventSeverity {
    Info,
    Warning,
    Error
};

const char* eventSeverityToString(EventSeverity severity);

// One human-readable status line for the control surface
struct LogEvent {
    std::chrono::system_clock::time_point time;
    EventSeverity severity = EventSeverity::Info;
    std::string text;
};

// "[HH:MM:SS] text"
std::string formatLogEvent(const LogEvent& event);

// Status lines from the session thread to the caller's display loop.
//
// post() never blocks beyond a short mutex hold. When the consumer falls
// behind by more than `capacity` lines the oldest line is discarded.
class EventRelay {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit EventRelay(size_t capacity = DEFAULT_CAPACITY);

    // Non-copyable
    EventRelay(const EventRelay&) = delete;
    EventRelay& operator=(const EventRelay&) = delete;

    void post(EventSeverity severity, const std::string& text);
    void info(const std::string& text) { post(EventSeverity::Info, text); }
    void warning(const std::string& text) { post(EventSeverity::Warning, text); }
    void error(const std::string& text) { post(EventSeverity::Error, text); }

    // Drain everything posted so far, oldest first
    std::vector<LogEvent> poll();
    std::optional<LogEvent> tryPop();

    size_t pending() const;
    size_t capacity() const { return capacity_; }
    uint64_t droppedCount() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogEvent> events_;
    uint64_t dropped_ = 0;
};

} // namespace session
} // namespace hubdrive
