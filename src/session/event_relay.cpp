#include "event_relay.hpp"
#include "hubdrive/logging.hpp"

#include <ctime>
#include <iterator>

namespace hubdrive {
namespace session {

const char* eventSeverityToString(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::Info:    return "INFO";
        case EventSeverity::Warning: return "WARN";
        case EventSeverity::Error:   return "ERROR";
        default:                     return "?";
    }
}

std::string formatLogEvent(const LogEvent& event) {
    auto t = std::chrono::system_clock::to_time_t(event.time);
    std::tm tm_now{};
#ifdef _WIN32
    localtime_s(&tm_now, &t);
#else
    localtime_r(&t, &tm_now);
#endif

    char ts[16];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm_now);
    return std::string("[") + ts + "] " + event.text;
}

EventRelay::EventRelay(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

void EventRelay::post(EventSeverity severity, const std::string& text) {
    // Mirror into the process log so file logs carry the same story
    switch (severity) {
        case EventSeverity::Error:
            LOG_SESSION(ERROR, "%s", text.c_str());
            break;
        case EventSeverity::Warning:
            LOG_SESSION(WARN, "%s", text.c_str());
            break;
        default:
            LOG_SESSION(INFO, "%s", text.c_str());
            break;
    }

    LogEvent event;
    event.time = std::chrono::system_clock::now();
    event.severity = severity;
    event.text = text;

    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        events_.pop_front();
        dropped_++;
    }
    events_.push_back(std::move(event));
}

std::vector<LogEvent> EventRelay::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogEvent> out(std::make_move_iterator(events_.begin()),
                              std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

std::optional<LogEvent> EventRelay::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    LogEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t EventRelay::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventRelay::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace session
} // namespace hubdrive
