// test_event_relay.cpp - Unit test for the session event relay
//
// Tests:
// 1. Events arrive in post order with severity
// 2. Overflow drops the oldest line
// 3. Timestamp formatting
// 4. Posting from another thread

#include "session/event_relay.hpp"
#include "hubdrive/logging.hpp"
#include <iostream>
#include <thread>
#include <string>

using namespace hubdrive;
using namespace hubdrive::session;

static int g_pass = 0, g_fail = 0;

static void expect(bool ok, const char* what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        g_pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        g_fail++;
    }
}

int main() {
    std::cout << "=== Event Relay Unit Test ===\n\n";
    setLogLevel(LogLevel::NONE);

    // ========================================================================
    // TEST 1: Order and severity
    // ========================================================================
    std::cout << "TEST 1: Order and severity\n";
    {
        EventRelay relay;
        relay.info("Connecting to Hub...");
        relay.warning("Unknown command, stopping all motors.");
        relay.error("Connection failed: timeout");

        expect(relay.pending() == 3, "three events pending");
        auto events = relay.poll();
        expect(events.size() == 3, "poll returns all three");
        expect(events.size() == 3 &&
               events[0].text == "Connecting to Hub..." &&
               events[1].text == "Unknown command, stopping all motors." &&
               events[2].text == "Connection failed: timeout",
               "texts in post order");
        expect(events.size() == 3 &&
               events[0].severity == EventSeverity::Info &&
               events[1].severity == EventSeverity::Warning &&
               events[2].severity == EventSeverity::Error,
               "severities preserved");
        expect(relay.pending() == 0, "poll drains the relay");
        expect(!relay.tryPop().has_value(), "tryPop on empty relay");
    }

    // ========================================================================
    // TEST 2: Overflow
    // ========================================================================
    std::cout << "\nTEST 2: Overflow drops oldest\n";
    {
        EventRelay relay(4);
        for (int i = 0; i < 10; i++) {
            relay.info("line " + std::to_string(i));
        }
        expect(relay.capacity() == 4, "capacity is 4");
        expect(relay.pending() == 4, "only capacity lines kept");
        expect(relay.droppedCount() == 6, "six lines dropped");

        auto first = relay.tryPop();
        expect(first && first->text == "line 6", "oldest kept line is line 6");
        auto rest = relay.poll();
        expect(rest.size() == 3 && rest.back().text == "line 9", "newest line is line 9");
    }

    // ========================================================================
    // TEST 3: Formatting
    // ========================================================================
    std::cout << "\nTEST 3: Formatting\n";
    {
        LogEvent event;
        event.time = std::chrono::system_clock::now();
        event.text = "System disconnected.";
        std::string line = formatLogEvent(event);
        expect(line.size() == 11 + event.text.size(), "\"[HH:MM:SS] \" prefix length");
        expect(line[0] == '[' && line[3] == ':' && line[6] == ':' && line[9] == ']',
               "timestamp shape");
        expect(line.compare(11, std::string::npos, event.text) == 0, "text follows prefix");
        expect(std::string(eventSeverityToString(EventSeverity::Warning)) == "WARN",
               "severity names");
    }

    // ========================================================================
    // TEST 4: Cross-thread
    // ========================================================================
    std::cout << "\nTEST 4: Posting from another thread\n";
    {
        EventRelay relay;
        std::thread producer([&]() {
            for (int i = 0; i < 200; i++) {
                relay.info("event " + std::to_string(i));
            }
        });

        size_t received = 0;
        bool ordered = true;
        while (received < 200) {
            for (const auto& e : relay.poll()) {
                if (e.text != "event " + std::to_string(received)) {
                    ordered = false;
                }
                received++;
            }
            std::this_thread::yield();
        }
        producer.join();
        expect(received == 200, "all events received");
        expect(ordered, "order preserved across threads");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << g_pass << " passed, " << g_fail << " failed\n";
    std::cout << "========================================\n";

    return g_fail == 0 ? 0 : 1;
}
