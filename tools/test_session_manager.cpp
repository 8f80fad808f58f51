// test_session_manager.cpp - Session lifecycle against a scripted link
//
// Tests:
// 1. Streaming: FIFO tokens, shutdown token before close
// 2. Teardown idempotence
// 3. Reconnection after Idle
// 4. Discrete: one program per command
// 5. Open failure
// 6. Close failure still sends the stop unit first
// 7. Disconnect interrupts a running program
// 8. Adapter exceptions and remote disconnect
// 9. Out-of-set command and rejected requests
// 10. Commands accepted before disconnect are still delivered
// 11. Listener that dies on the hub

#include "session/session_manager.hpp"
#include "hubdrive/logging.hpp"
#include <iostream>
#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <chrono>
#include <functional>
#include <stdexcept>

using namespace hubdrive;
using namespace hubdrive::session;
using namespace hubdrive::link;

static int g_pass = 0, g_fail = 0;

static void expect(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        g_pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        g_fail++;
    }
}

static bool waitFor(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// What the scripted adapter saw and how it should misbehave
struct MockScript {
    std::mutex mutex;
    std::vector<std::string> calls;         // "open", "install", "write:F", "run:run_x", "cancel", "close"
    std::vector<uint32_t> write_links;
    uint32_t next_link = 1;

    bool fail_open = false;
    bool fail_close = false;
    bool throw_on_write = false;
    bool benign_on_write = false;
    int write_delay_ms = 0;
    bool listener_dead = false;             // checkProgram reports a crash
    std::string block_program;              // run blocks until cancelled
    bool run_started = false;

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(call);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

    int count(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& c : calls) {
            if (c == call) n++;
        }
        return n;
    }

    int indexOf(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = 0; i < calls.size(); i++) {
            if (calls[i] == call) return static_cast<int>(i);
        }
        return -1;
    }
};

static std::string programName(const std::string& source) {
    size_t def = source.find("def ");
    size_t paren = source.find('(', def);
    if (def == std::string::npos || paren == std::string::npos) return "?";
    return source.substr(def + 4, paren - def - 4);
}

class MockLinkAdapter : public LinkAdapter {
public:
    explicit MockLinkAdapter(std::shared_ptr<MockScript> script) : script_(std::move(script)) {}

    LinkResult<LinkHandle> open(const DeviceDescriptor&) override {
        script_->record("open");
        if (script_->fail_open) {
            return LinkResult<LinkHandle>::failure(
                LinkStatus::failure(LinkErrorKind::LinkFailure, "no route to hub"));
        }
        LinkHandle h;
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            h.id = script_->next_link++;
        }
        return LinkResult<LinkHandle>::success(h);
    }

    LinkResult<ProgramHandle> installProgram(LinkHandle link, const std::string&) override {
        script_->record("install");
        ProgramHandle p;
        p.id = 100 + link.id;
        p.link_id = link.id;
        return LinkResult<ProgramHandle>::success(p);
    }

    LinkStatus cancelProgram(ProgramHandle) override {
        script_->record("cancel");
        return LinkStatus::success();
    }

    LinkStatus checkProgram(ProgramHandle) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->listener_dead) {
            return LinkStatus::failure(LinkErrorKind::LinkFailure, "OSError: [Errno 19] ENODEV");
        }
        return LinkStatus::success();
    }

    LinkStatus write(LinkHandle link, const Bytes& data) override {
        if (script_->write_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(script_->write_delay_ms));
        }
        if (script_->throw_on_write) {
            script_->record("write-throw");
            throw std::runtime_error("boom");
        }
        if (script_->benign_on_write) {
            script_->record("write-eof");
            return LinkStatus::failure(LinkErrorKind::BenignDisconnect, "hub closed the port");
        }
        script_->record("write:" + std::string(data.begin(), data.end()));
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->write_links.push_back(link.id);
        return LinkStatus::success();
    }

    LinkStatus runProgramToCompletion(LinkHandle, const std::string& source,
                                      const CancelToken& cancel) override {
        std::string name = programName(source);
        script_->record("run:" + name);
        if (name == script_->block_program) {
            {
                std::lock_guard<std::mutex> lock(script_->mutex);
                script_->run_started = true;
            }
            while (!cancel.isCancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return LinkStatus::failure(LinkErrorKind::Cancelled, "interrupted");
        }
        return LinkStatus::success();
    }

    LinkStatus close(LinkHandle) override {
        script_->record("close");
        if (script_->fail_close) {
            return LinkStatus::failure(LinkErrorKind::LinkFailure, "port busy");
        }
        return LinkStatus::success();
    }

    const char* adapterName() const override { return "mock"; }

private:
    std::shared_ptr<MockScript> script_;
};

// Session plus everything the test observes about it
struct Harness {
    std::shared_ptr<MockScript> script = std::make_shared<MockScript>();
    std::unique_ptr<SessionManager> session;
    std::mutex state_mutex;
    std::vector<SessionState> states;
    std::vector<LogEvent> events;

    explicit Harness(ProtocolMode mode) {
        SessionConfig cfg;
        cfg.mode = mode;
        cfg.settle_ms = 0;
        cfg.shutdown_timeout_ms = 500;
        session = std::make_unique<SessionManager>(std::make_unique<MockLinkAdapter>(script), cfg);
        session->setStateCallback([this](SessionState s) {
            std::lock_guard<std::mutex> lock(state_mutex);
            states.push_back(s);
        });
        session->start();
    }

    ~Harness() { session->stop(); }

    void drain() {
        for (auto& e : session->events().poll()) {
            events.push_back(std::move(e));
        }
    }

    int eventCount(const std::string& text) {
        drain();
        int n = 0;
        for (const auto& e : events) {
            if (e.text == text) n++;
        }
        return n;
    }

    int severityCount(EventSeverity severity) {
        drain();
        int n = 0;
        for (const auto& e : events) {
            if (e.severity == severity) n++;
        }
        return n;
    }

    std::vector<SessionState> stateLog() {
        std::lock_guard<std::mutex> lock(state_mutex);
        return states;
    }

    void clearStates() {
        std::lock_guard<std::mutex> lock(state_mutex);
        states.clear();
    }

    bool waitActive() {
        return waitFor([this] { return session->isActive(); });
    }

    bool waitIdle() {
        return waitFor([this] {
            return session->state() == SessionState::Idle && !stateLog().empty() &&
                   stateLog().back() == SessionState::Idle;
        });
    }
};

static DeviceDescriptor testDevice() {
    DeviceDescriptor d;
    d.address = "mock0";
    d.name = "Test Hub";
    d.transport = DeviceTransport::Simulated;
    return d;
}

int main() {
    std::cout << "=== Session Manager Test ===\n\n";
    setLogLevel(LogLevel::NONE);

    // ========================================================================
    // TEST 1: Streaming FIFO
    // ========================================================================
    std::cout << "TEST 1: Streaming scenario F S L C\n";
    {
        Harness h(ProtocolMode::Streaming);
        expect(!h.session->sendCommand(DriveCommand::Forward), "command before connect is dropped");
        expect(h.session->connect(testDevice()), "connect accepted");
        expect(h.waitActive(), "session becomes Active");
        expect(h.session->currentDevice().name == "Test Hub", "current device reported");

        h.session->sendCommand(DriveCommand::Forward);
        h.session->sendCommand(DriveCommand::Stop);
        h.session->sendCommand(DriveCommand::TurnLeft);
        h.session->sendCommand(DriveCommand::Center);
        expect(waitFor([&] { return h.script->count("write:C") == 1; }), "four tokens written");

        h.session->disconnect();
        expect(h.waitIdle(), "back to Idle");

        std::vector<std::string> expected = {
            "open", "install", "write:F", "write:S", "write:L", "write:C",
            "write:X", "cancel", "close",
        };
        expect(h.script->snapshot() == expected, "adapter saw open, install, F S L C, X, cancel, close");

        std::vector<SessionState> states = h.stateLog();
        std::vector<SessionState> expected_states = {
            SessionState::Connecting, SessionState::Active,
            SessionState::Disconnecting, SessionState::Idle,
        };
        expect(states == expected_states, "Connecting -> Active -> Disconnecting -> Idle");
        expect(h.eventCount("Connecting to Test Hub...") == 1, "\"Connecting to Test Hub...\"");
        expect(h.eventCount("Loading gateway program...") == 1, "\"Loading gateway program...\"");
        expect(h.eventCount("Connection established!") == 1, "\"Connection established!\"");
        expect(h.eventCount("Action: Forward") == 1 && h.eventCount("Action: Steering centered") == 1,
               "one Action event per command");
        expect(h.eventCount("System disconnected.") == 1, "\"System disconnected.\" once");

        // ====================================================================
        // TEST 2: Idempotence
        // ====================================================================
        std::cout << "\nTEST 2: Second disconnect is a no-op\n";
        h.session->disconnect();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        expect(h.script->count("close") == 1, "still exactly one close");
        expect(h.eventCount("System disconnected.") == 1, "still one \"System disconnected.\"");
        expect(h.session->state() == SessionState::Idle, "still Idle");

        // ====================================================================
        // TEST 3: Reconnection
        // ====================================================================
        std::cout << "\nTEST 3: Reconnection after Idle\n";
        expect(h.session->connect(testDevice()), "second connect accepted");
        expect(h.waitActive(), "Active again");
        h.session->sendCommand(DriveCommand::Turbo);
        expect(waitFor([&] { return h.script->count("write:T") == 1; }), "token written on new link");
        {
            std::lock_guard<std::mutex> lock(h.script->mutex);
            expect(!h.script->write_links.empty() && h.script->write_links.back() == 2,
                   "write used the new link handle");
        }
        expect(h.script->count("write:F") == 1, "no stale command replayed");
        h.session->disconnect();
        expect(h.waitIdle(), "Idle after second session");
        expect(h.script->count("close") == 2, "one close per session");
    }

    // ========================================================================
    // TEST 4: Discrete
    // ========================================================================
    std::cout << "\nTEST 4: Discrete scenario [Backward]\n";
    {
        Harness h(ProtocolMode::DiscreteProgram);
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        expect(h.script->count("install") == 0, "no listener installed");

        h.session->sendCommand(DriveCommand::Backward);
        expect(waitFor([&] { return h.eventCount("Executed: run_backward") == 1; }),
               "\"Executed: run_backward\" posted");
        expect(h.script->count("run:run_backward") == 1, "run_backward ran once");

        h.session->disconnect();
        expect(h.waitIdle(), "Idle");
        int shutdown_at = h.script->indexOf("run:run_shutdown");
        int close_at = h.script->indexOf("close");
        expect(shutdown_at >= 0 && close_at > shutdown_at, "shutdown program before close");
        expect(h.script->count("cancel") == 0, "nothing to cancel without a listener");
        expect(h.eventCount("Executed: run_backward") == 1, "executed exactly once");
    }

    // ========================================================================
    // TEST 5: Open failure
    // ========================================================================
    std::cout << "\nTEST 5: Open failure\n";
    {
        Harness h(ProtocolMode::Streaming);
        h.script->fail_open = true;
        h.session->connect(testDevice());
        expect(h.waitIdle(), "returns to Idle");

        std::vector<SessionState> expected_states = {
            SessionState::Connecting, SessionState::Disconnecting, SessionState::Idle,
        };
        expect(h.stateLog() == expected_states, "Connecting -> Disconnecting -> Idle");
        expect(h.severityCount(EventSeverity::Error) == 1, "exactly one failure event");
        expect(h.eventCount("Connection failed: no route to hub") == 1, "failure text");
        expect(h.eventCount("System disconnected.") == 0, "no \"System disconnected.\"");
        std::vector<std::string> expected = {"open"};
        expect(h.script->snapshot() == expected, "no writes, cancel or close");
        expect(!h.session->isActive(), "never Active");
    }

    // ========================================================================
    // TEST 6: Close failure
    // ========================================================================
    std::cout << "\nTEST 6: Close failure\n";
    {
        Harness h(ProtocolMode::Streaming);
        h.script->fail_close = true;
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        h.session->disconnect();
        expect(h.waitIdle(), "Idle despite close failure");
        int stop_at = h.script->indexOf("write:X");
        int close_at = h.script->indexOf("close");
        expect(stop_at >= 0 && close_at > stop_at, "stop token reached adapter before close");
        expect(h.severityCount(EventSeverity::Error) == 0, "cleanup failure is not a user event");
        expect(h.eventCount("System disconnected.") == 1, "\"System disconnected.\" once");
    }

    // ========================================================================
    // TEST 7: Cancel a running program
    // ========================================================================
    std::cout << "\nTEST 7: Disconnect interrupts a running program\n";
    {
        Harness h(ProtocolMode::DiscreteProgram);
        h.script->block_program = "run_forward";
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        h.session->sendCommand(DriveCommand::Forward);
        expect(waitFor([&] {
            std::lock_guard<std::mutex> lock(h.script->mutex);
            return h.script->run_started;
        }), "run_forward started");

        auto t0 = std::chrono::steady_clock::now();
        h.session->disconnect();
        expect(h.waitIdle(), "Idle");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        expect(elapsed < 1000, "teardown did not wait out the program");
        expect(h.eventCount("Interrupted: run_forward") == 1, "\"Interrupted: run_forward\"");
        expect(h.script->count("run:run_shutdown") == 1, "shutdown program still sent");
        expect(h.script->count("close") == 1, "link closed");
    }

    // ========================================================================
    // TEST 8: Adapter exceptions and remote disconnect
    // ========================================================================
    std::cout << "\nTEST 8: Adapter errors\n";
    {
        Harness h(ProtocolMode::Streaming);
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        h.script->throw_on_write = true;
        h.session->sendCommand(DriveCommand::Forward);
        expect(h.waitIdle(), "exception tears the session down");
        expect(h.eventCount("Send error: write raised: boom") == 1, "exception reported as send error");
        expect(h.script->count("close") == 1, "link closed");
    }
    {
        Harness h(ProtocolMode::Streaming);
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        h.script->benign_on_write = true;
        h.session->sendCommand(DriveCommand::Forward);
        expect(h.waitIdle(), "remote close tears the session down");
        expect(h.eventCount("Remote hub disconnected.") == 1, "\"Remote hub disconnected.\"");
        expect(h.severityCount(EventSeverity::Error) == 0, "remote close is not an error");
    }

    // ========================================================================
    // TEST 9: Out-of-set command and rejected requests
    // ========================================================================
    std::cout << "\nTEST 9: Fallback and rejected requests\n";
    {
        Harness h(ProtocolMode::Streaming);
        expect(!h.session->connect(DeviceDescriptor{}), "empty device rejected");
        expect(h.eventCount("No device selected.") == 1, "\"No device selected.\"");

        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        expect(!h.session->connect(testDevice()), "connect while Active rejected");
        expect(h.eventCount("Already connected or connecting.") == 1,
               "\"Already connected or connecting.\"");

        h.session->sendCommand(static_cast<DriveCommand>(42));
        expect(h.waitIdle(), "listener ended, session closes");
        expect(h.eventCount("Unknown command, stopping all motors.") == 1, "fallback warning");
        expect(h.script->count("write:X") == 1, "stop-all sent once, not repeated at teardown");
    }
    {
        SessionManager idle(std::make_unique<MockLinkAdapter>(std::make_shared<MockScript>()));
        expect(!idle.connect(testDevice()), "connect before start() rejected");
        auto events = idle.events().poll();
        expect(events.size() == 1 && events[0].text == "Session is not running.",
               "\"Session is not running.\"");
    }

    // ========================================================================
    // TEST 10: Accepted commands survive disconnect
    // ========================================================================
    std::cout << "\nTEST 10: Commands accepted before disconnect are delivered\n";
    {
        Harness h(ProtocolMode::Streaming);
        h.script->write_delay_ms = 20;
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");

        bool accepted = h.session->sendCommand(DriveCommand::Forward) &&
                        h.session->sendCommand(DriveCommand::Stop) &&
                        h.session->sendCommand(DriveCommand::TurnLeft) &&
                        h.session->sendCommand(DriveCommand::Center);
        h.session->disconnect();
        expect(accepted, "all four commands accepted");
        expect(!h.session->sendCommand(DriveCommand::Turbo), "command after disconnect rejected");
        expect(h.waitIdle(), "Idle");

        std::vector<std::string> expected = {
            "open", "install", "write:F", "write:S", "write:L", "write:C",
            "write:X", "cancel", "close",
        };
        expect(h.script->snapshot() == expected, "F S L C delivered, then X, cancel, close");
        expect(h.eventCount("Action: Forward") == 1, "delivered commands logged");
    }
    {
        Harness h(ProtocolMode::DiscreteProgram);
        h.script->block_program = "run_forward";
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        h.session->sendCommand(DriveCommand::Forward);
        h.session->sendCommand(DriveCommand::Backward);
        expect(waitFor([&] {
            std::lock_guard<std::mutex> lock(h.script->mutex);
            return h.script->run_started;
        }), "run_forward started");

        h.session->disconnect();
        expect(h.waitIdle(), "Idle");
        int forward_at = h.script->indexOf("run:run_forward");
        int backward_at = h.script->indexOf("run:run_backward");
        int shutdown_at = h.script->indexOf("run:run_shutdown");
        expect(forward_at >= 0 && backward_at > forward_at && shutdown_at > backward_at,
               "running program interrupted, queued program still run, then shutdown");
        expect(h.eventCount("Interrupted: run_forward") == 1, "\"Interrupted: run_forward\"");
        expect(h.eventCount("Executed: run_backward") == 1, "\"Executed: run_backward\"");
    }

    // ========================================================================
    // TEST 11: Listener crash
    // ========================================================================
    std::cout << "\nTEST 11: Listener that dies on the hub\n";
    {
        Harness h(ProtocolMode::Streaming);
        h.script->listener_dead = true;
        h.session->connect(testDevice());
        expect(h.waitIdle(), "session returns to Idle");

        std::vector<SessionState> expected_states = {
            SessionState::Connecting, SessionState::Disconnecting, SessionState::Idle,
        };
        expect(h.stateLog() == expected_states, "never Active");
        expect(h.eventCount("Connection failed: OSError: [Errno 19] ENODEV") == 1,
               "hub error reported as connection failure");
        expect(h.eventCount("Connection established!") == 0, "no \"Connection established!\"");
        int stop_at = h.script->indexOf("write:X");
        int close_at = h.script->indexOf("close");
        expect(stop_at >= 0 && close_at > stop_at, "stop token and close still sent");
    }
    {
        Harness h(ProtocolMode::Streaming);
        h.session->connect(testDevice());
        expect(h.waitActive(), "Active");
        {
            std::lock_guard<std::mutex> lock(h.script->mutex);
            h.script->listener_dead = true;
        }
        h.session->sendCommand(DriveCommand::Forward);
        expect(h.waitIdle(), "crash found on the next command tears down");
        expect(h.eventCount("Program failed: OSError: [Errno 19] ENODEV") == 1, "crash reported");
        expect(h.eventCount("Action: Forward") == 0, "undelivered command not logged as an action");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << g_pass << " passed, " << g_fail << " failed\n";
    std::cout << "========================================\n";

    return g_fail == 0 ? 0 : 1;
}
