#pragma once

#include "command_queue.hpp"
#include "event_relay.hpp"
#include "protocol_codec.hpp"
#include "link/link_adapter.hpp"
#include "hubdrive/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace hubdrive {
namespace session {

enum class SessionState {
    Idle,
    Connecting,
    Active,
    Disconnecting
};

const char* sessionStateToString(SessionState state);

struct SessionConfig {
    ProtocolMode mode = ProtocolMode::Streaming;
    DriveTuning tuning;
    int settle_ms = 1000;               // Pause after the listener starts
    int shutdown_timeout_ms = 3000;     // Bound on the discrete shutdown program
    size_t max_log_events = EventRelay::DEFAULT_CAPACITY;
};

// Owns one link to one hub at a time and drives it from a dedicated thread.
//
// The caller thread (GUI/CLI) only talks to the session through connect(),
// sendCommand(), disconnect(), the readiness flag and the event relay.
// Everything that touches the link runs on the session thread:
//
//   Idle -> Connecting -> Active -> Disconnecting -> Idle
//
// Every path into Disconnecting that had opened a link sends the shutdown
// unit, cancels the running program and closes the link before Idle.
// Commands accepted by sendCommand() are delivered before the shutdown unit,
// unless the link failed or stop() was called.
class SessionManager {
public:
    using StateCallback = std::function<void(SessionState)>;

    SessionManager(std::unique_ptr<link::LinkAdapter> adapter,
                   const SessionConfig& config = SessionConfig{});
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Session thread lifecycle. stop() disconnects and joins.
    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Returns false (and posts a warning) unless Idle with no request pending
    bool connect(const DeviceDescriptor& device);

    // Queues a command. Returns false (command dropped) unless Active.
    bool sendCommand(DriveCommand cmd);

    // Requests teardown. Stops accepting commands, interrupts the settle wait
    // and the running program; commands already queued are still delivered.
    void disconnect();

    bool isActive() const { return ready_; }
    SessionState state() const { return state_; }
    EventRelay& events() { return events_; }
    const SessionConfig& config() const { return config_; }
    DeviceDescriptor currentDevice() const;

    // Invoked on the session thread for every transition
    void setStateCallback(StateCallback callback);

private:
    void sessionLoop();
    void runSession(const DeviceDescriptor& device);
    void serveCommands();
    bool executeCommand(DriveCommand cmd);
    void teardown();

    void setState(SessionState state);
    bool waitSettle();
    bool disconnectRequested() const;
    bool stopRequested() const;
    link::LinkStatus runCommandProgram(const std::string& source);
    void reportLinkError(const char* prefix, const link::LinkStatus& status);

    // Adapter calls; exceptions come back as LinkFailure
    link::LinkResult<link::LinkHandle> linkOpen(const DeviceDescriptor& device);
    link::LinkResult<link::ProgramHandle> linkInstall(const std::string& source);
    link::LinkStatus linkWrite(const Bytes& data);
    link::LinkStatus linkRun(const std::string& source, const link::CancelToken& cancel);
    link::LinkStatus linkCheck();
    link::LinkStatus linkCancel();
    link::LinkStatus linkClose();

    std::unique_ptr<link::LinkAdapter> adapter_;
    std::unique_ptr<ProtocolCodec> codec_;
    SessionConfig config_;

    CommandQueue queue_;
    EventRelay events_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<SessionState> state_{SessionState::Idle};

    // Control requests from the caller thread
    mutable std::mutex control_mutex_;
    std::condition_variable control_cv_;
    bool shutdown_ = false;
    bool connect_requested_ = false;
    bool disconnect_requested_ = false;
    bool in_session_ = false;           // Request picked up, not yet back to Idle
    bool program_in_flight_ = false;    // Discrete program between upload and completion
    DeviceDescriptor pending_device_;
    DeviceDescriptor current_device_;
    link::CancelToken cancel_;

    std::mutex callback_mutex_;
    StateCallback state_callback_;

    // Session thread only
    link::LinkHandle link_;
    link::ProgramHandle program_;
    bool link_opened_ = false;
    bool shutdown_sent_ = false;
};

} // namespace session
} // namespace hubdrive
