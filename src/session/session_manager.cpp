#include "session_manager.hpp"
#include "hubdrive/logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace hubdrive {
namespace session {

using link::LinkErrorKind;
using link::LinkStatus;

namespace {

// Listener health is polled this often while settling
constexpr int LISTENER_CHECK_MS = 50;

LinkStatus exceptionStatus(const char* what, const std::exception& e) {
    return LinkStatus::failure(LinkErrorKind::LinkFailure,
                               std::string(what) + " raised: " + e.what());
}

} // namespace

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle:          return "Idle";
        case SessionState::Connecting:    return "Connecting";
        case SessionState::Active:        return "Active";
        case SessionState::Disconnecting: return "Disconnecting";
        default:                          return "Unknown";
    }
}

SessionManager::SessionManager(std::unique_ptr<link::LinkAdapter> adapter,
                               const SessionConfig& config)
    : adapter_(std::move(adapter)),
      codec_(createCodec(config.mode, config.tuning)),
      config_(config),
      events_(config.max_log_events) {}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::start() {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        shutdown_ = false;
        connect_requested_ = false;
        disconnect_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&SessionManager::sessionLoop, this);
    LOG_SESSION(INFO, "Session thread started (%s mode, %s link)",
                codec_->name(), adapter_ ? adapter_->adapterName() : "no");
}

void SessionManager::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        shutdown_ = true;
        connect_requested_ = false;
        disconnect_requested_ = true;
        cancel_.cancel();
        queue_.close();
    }
    control_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    LOG_SESSION(INFO, "Session thread stopped");
}

bool SessionManager::connect(const DeviceDescriptor& device) {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (running_ && !shutdown_ && !connect_requested_ && !in_session_ &&
            !device.empty() && adapter_) {
            pending_device_ = device;
            connect_requested_ = true;
            disconnect_requested_ = false;
            cancel_.reset();
            control_cv_.notify_all();
            return true;
        }
    }

    if (device.empty()) {
        events_.warning("No device selected.");
    } else if (!running_) {
        events_.warning("Session is not running.");
    } else {
        events_.warning("Already connected or connecting.");
    }
    return false;
}

bool SessionManager::sendCommand(DriveCommand cmd) {
    if (!ready_) {
        LOG_SESSION(DEBUG, "Dropping '%s': session not active", driveCommandToString(cmd));
        return false;
    }
    if (!queue_.push(cmd)) {
        LOG_SESSION(DEBUG, "Dropping '%s': queue closed", driveCommandToString(cmd));
        return false;
    }
    return true;
}

void SessionManager::disconnect() {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (connect_requested_) {
            // Not picked up yet; nothing to tear down
            connect_requested_ = false;
            return;
        }
        if (!in_session_) {
            return;
        }
        disconnect_requested_ = true;
        if (program_in_flight_) {
            cancel_.cancel();
        }
        queue_.close();
    }
    control_cv_.notify_all();
    LOG_SESSION(DEBUG, "Disconnect requested (%zu command(s) still to deliver)", queue_.size());
}

DeviceDescriptor SessionManager::currentDevice() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return current_device_;
}

void SessionManager::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

// ============================================================================
// Session thread
// ============================================================================

void SessionManager::sessionLoop() {
    while (true) {
        DeviceDescriptor device;
        {
            std::unique_lock<std::mutex> lock(control_mutex_);
            control_cv_.wait(lock, [this] { return shutdown_ || connect_requested_; });
            if (shutdown_) {
                break;
            }
            device = pending_device_;
            current_device_ = device;
            connect_requested_ = false;
            in_session_ = true;
        }
        runSession(device);
    }
}

void SessionManager::runSession(const DeviceDescriptor& device) {
    link_ = link::LinkHandle{};
    program_ = link::ProgramHandle{};
    link_opened_ = false;
    shutdown_sent_ = false;

    setState(SessionState::Connecting);
    events_.info("Connecting to " + device.name + "...");

    auto opened = linkOpen(device);
    if (!opened.ok()) {
        reportLinkError("Connection failed: ", opened.status);
        teardown();
        return;
    }
    link_ = opened.value;
    link_opened_ = true;

    if (disconnectRequested()) {
        teardown();
        return;
    }

    if (codec_->mode() == ProtocolMode::Streaming) {
        events_.info("Loading gateway program...");
        auto installed = linkInstall(codec_->listenerProgram());
        if (!installed.ok()) {
            reportLinkError("Connection failed: ", installed.status);
            teardown();
            return;
        }
        program_ = installed.value;
    }

    if (!waitSettle()) {
        teardown();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!disconnect_requested_ && !shutdown_) {
            queue_.open();
        }
    }
    if (!queue_.isOpen()) {
        teardown();
        return;
    }

    ready_ = true;
    setState(SessionState::Active);
    events_.info("Connection established!");

    serveCommands();
    teardown();
}

void SessionManager::serveCommands() {
    while (true) {
        auto cmd = queue_.pop();
        if (!cmd) {
            break;
        }
        if (stopRequested()) {
            break;
        }
        if (!executeCommand(*cmd)) {
            break;
        }
    }
}

bool SessionManager::executeCommand(DriveCommand cmd) {
    WireUnit unit = codec_->encode(cmd);
    if (unit.fallback) {
        LOG_SESSION(WARN, "Command %d is not a drive command; sending stop-all",
                    static_cast<int>(cmd));
        events_.warning("Unknown command, stopping all motors.");
    }

    if (!unit.isProgram()) {
        LinkStatus s = linkWrite(unit.token);
        if (!s.ok()) {
            reportLinkError("Send error: ", s);
            return false;
        }

        if (cmd == DriveCommand::Shutdown || unit.fallback) {
            // The listener has ended; nothing more can be streamed
            events_.info(std::string("Action: ") + driveCommandDescription(cmd));
            shutdown_sent_ = true;
            return false;
        }

        // A listener that crashed leaves the hub in an idle raw REPL
        s = linkCheck();
        if (!s.ok()) {
            reportLinkError("Program failed: ", s);
            return false;
        }
        events_.info(std::string("Action: ") + driveCommandDescription(cmd));
        return true;
    }

    LOG_SESSION(DEBUG, "Running %s (dwell %u ms)", unit.program_name.c_str(), unit.dwell_ms);
    LinkStatus s = runCommandProgram(unit.source);
    if (s.kind == LinkErrorKind::Cancelled) {
        events_.info("Interrupted: " + unit.program_name);
        // Commands accepted before the disconnect still run
        return !stopRequested();
    }
    if (!s.ok()) {
        reportLinkError("Program failed: ", s);
        return false;
    }
    events_.info("Executed: " + unit.program_name);
    return true;
}

void SessionManager::teardown() {
    if (state_ == SessionState::Idle || state_ == SessionState::Disconnecting) {
        return;
    }

    ready_ = false;
    queue_.close();
    setState(SessionState::Disconnecting);

    if (link_opened_) {
        if (!shutdown_sent_) {
            WireUnit unit = codec_->shutdownUnit();
            LinkStatus s;
            if (unit.isProgram()) {
                link::CancelToken bounded;
                bounded.setDeadline(std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(config_.shutdown_timeout_ms));
                s = linkRun(unit.source, bounded);
            } else {
                s = linkWrite(unit.token);
            }
            if (!s.ok()) {
                LOG_SESSION(WARN, "Shutdown unit not delivered: %s", s.message.c_str());
            }
            shutdown_sent_ = true;
        }

        if (program_.valid()) {
            LinkStatus s = linkCancel();
            if (!s.ok()) {
                LOG_SESSION(WARN, "Program cancel failed: %s", s.message.c_str());
            }
        }

        LinkStatus s = linkClose();
        if (!s.ok()) {
            LOG_SESSION(WARN, "Link close failed: %s", s.message.c_str());
        }
        events_.info("System disconnected.");
    }

    size_t discarded = queue_.reset();
    if (discarded > 0) {
        LOG_SESSION(WARN, "Discarded %zu queued command(s) the link could not take", discarded);
    }

    link_ = link::LinkHandle{};
    program_ = link::ProgramHandle{};
    link_opened_ = false;
    shutdown_sent_ = false;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        current_device_ = DeviceDescriptor{};
        disconnect_requested_ = false;
        in_session_ = false;
        cancel_.reset();
    }
    setState(SessionState::Idle);
}

void SessionManager::setState(SessionState state) {
    SessionState previous = state_.exchange(state);
    if (previous == state) return;

    LOG_SESSION(DEBUG, "State %s -> %s", sessionStateToString(previous),
                sessionStateToString(state));

    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = state_callback_;
    }
    if (callback) {
        callback(state);
    }
}

// Returns false if a disconnect arrived or the listener died while settling
bool SessionManager::waitSettle() {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.settle_ms > 0 ? config_.settle_ms : 0);

    while (true) {
        if (program_.valid()) {
            LinkStatus s = linkCheck();
            if (!s.ok()) {
                reportLinkError("Connection failed: ", s);
                return false;
            }
        }

        std::unique_lock<std::mutex> lock(control_mutex_);
        if (disconnect_requested_ || shutdown_) {
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(LISTENER_CHECK_MS));
        control_cv_.wait_for(lock, slice, [this] { return disconnect_requested_ || shutdown_; });
    }
}

bool SessionManager::disconnectRequested() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return disconnect_requested_ || shutdown_;
}

bool SessionManager::stopRequested() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return shutdown_;
}

// Runs one command program. disconnect() cancels it only while it is in flight,
// so programs queued behind it start with a clear token.
LinkStatus SessionManager::runCommandProgram(const std::string& source) {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (shutdown_) {
            return LinkStatus::failure(LinkErrorKind::Cancelled, "Session stopping");
        }
        program_in_flight_ = true;
    }

    LinkStatus s = linkRun(source, cancel_);

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        program_in_flight_ = false;
        if (!shutdown_) {
            cancel_.reset();
        }
    }
    return s;
}

void SessionManager::reportLinkError(const char* prefix, const LinkStatus& status) {
    switch (status.kind) {
        case LinkErrorKind::BenignDisconnect:
            LOG_SESSION(INFO, "Peer closed the link: %s", status.message.c_str());
            events_.info("Remote hub disconnected.");
            break;
        case LinkErrorKind::Cancelled:
            events_.info("Operation cancelled.");
            break;
        default:
            events_.error(prefix + status.message);
            break;
    }
}

// ============================================================================
// Adapter calls
// ============================================================================

link::LinkResult<link::LinkHandle> SessionManager::linkOpen(const DeviceDescriptor& device) {
    try {
        return adapter_->open(device);
    } catch (const std::exception& e) {
        return link::LinkResult<link::LinkHandle>::failure(exceptionStatus("open", e));
    }
}

link::LinkResult<link::ProgramHandle> SessionManager::linkInstall(const std::string& source) {
    try {
        return adapter_->installProgram(link_, source);
    } catch (const std::exception& e) {
        return link::LinkResult<link::ProgramHandle>::failure(exceptionStatus("installProgram", e));
    }
}

LinkStatus SessionManager::linkWrite(const Bytes& data) {
    try {
        return adapter_->write(link_, data);
    } catch (const std::exception& e) {
        return exceptionStatus("write", e);
    }
}

LinkStatus SessionManager::linkRun(const std::string& source, const link::CancelToken& cancel) {
    try {
        return adapter_->runProgramToCompletion(link_, source, cancel);
    } catch (const std::exception& e) {
        return exceptionStatus("runProgramToCompletion", e);
    }
}

LinkStatus SessionManager::linkCheck() {
    try {
        return adapter_->checkProgram(program_);
    } catch (const std::exception& e) {
        return exceptionStatus("checkProgram", e);
    }
}

LinkStatus SessionManager::linkCancel() {
    try {
        return adapter_->cancelProgram(program_);
    } catch (const std::exception& e) {
        return exceptionStatus("cancelProgram", e);
    }
}

LinkStatus SessionManager::linkClose() {
    try {
        return adapter_->close(link_);
    } catch (const std::exception& e) {
        return exceptionStatus("close", e);
    }
}

} // namespace session
} // namespace hubdrive
