#include "sim_hub.hpp"
#include "hubdrive/logging.hpp"

#include <algorithm>
#include <cstring>
#include <regex>

namespace hubdrive {
namespace link {

namespace {

const char* RAW_BANNER = "raw REPL; CTRL-B to exit\r\n>";
const char* FRIENDLY_BANNER =
    "\r\nMicroPython v1.20.0 on SimulatedHub\r\n"
    "Type \"help()\" for more information.\r\n>>> ";
const char* INTERRUPT_TRACEBACK =
    "Traceback (most recent call last):\r\n"
    "  File \"<stdin>\", line 1, in <module>\r\n"
    "KeyboardInterrupt: \r\n";

constexpr uint8_t CTRL_A = 0x01;
constexpr uint8_t CTRL_B = 0x02;
constexpr uint8_t CTRL_C = 0x03;
constexpr uint8_t CTRL_D = 0x04;

} // namespace

const char* simDriveToString(SimDrive drive) {
    switch (drive) {
        case SimDrive::Stopped:  return "stopped";
        case SimDrive::Forward:  return "forward";
        case SimDrive::Turbo:    return "turbo";
        case SimDrive::Backward: return "backward";
        default:                 return "unknown";
    }
}

SimulatedHub::SimulatedHub(const SimHubOptions& options)
    : options_(options) {}

bool SimulatedHub::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuse_) {
        return false;
    }
    // A fresh connection finds the hub at its friendly prompt
    connected_ = true;
    dropped_ = false;
    mode_ = Mode::Friendly;
    source_.clear();
    outbox_.clear();
    connects_++;
    LOG_LINK(DEBUG, "SIM: host connected (#%d)", connects_);
    return true;
}

void SimulatedHub::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    outbox_.clear();
    cv_.notify_all();
}

IoResult SimulatedHub::hostWrite(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dropped_) {
        return IoResult::closed("Connection reset by hub");
    }
    if (!connected_) {
        return IoResult::closed("Not connected");
    }

    advance(std::chrono::steady_clock::now());
    for (size_t i = 0; i < len; i++) {
        feed(data[i]);
    }
    cv_.notify_all();
    return IoResult::success(len);
}

IoResult SimulatedHub::hostRead(uint8_t* buffer, size_t len, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        if (dropped_) {
            return IoResult::closed("Connection reset by hub");
        }
        if (!connected_) {
            return IoResult::closed("Not connected");
        }

        auto now = std::chrono::steady_clock::now();
        advance(now);

        size_t copied = 0;
        while (copied < len && !outbox_.empty() && outbox_.front().ready_at <= now) {
            Pending& front = outbox_.front();
            size_t n = std::min(len - copied, front.bytes.size());
            std::memcpy(buffer + copied, front.bytes.data(), n);
            copied += n;
            front.bytes.erase(0, n);
            if (front.bytes.empty()) {
                outbox_.pop_front();
            }
        }
        if (copied > 0) {
            return IoResult::success(copied);
        }

        if (now >= deadline) {
            return IoResult::timeout();
        }

        auto wake = deadline;
        if (!outbox_.empty()) {
            wake = std::min(wake, outbox_.front().ready_at);
        }
        if (mode_ == Mode::Program) {
            wake = std::min(wake, program_end_);
        }
        cv_.wait_until(lock, wake);
    }
}

void SimulatedHub::setRefuseConnections(bool refuse) {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_ = refuse;
}

void SimulatedHub::setSilent(bool silent) {
    std::lock_guard<std::mutex> lock(mutex_);
    silent_ = silent;
}

void SimulatedHub::failNextProgram(const std::string& error_line) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_error_ = error_line;
}

void SimulatedHub::dropConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped_ = true;
    // Pybricks stops every motor when the hub goes away
    motors_ = SimMotorState{};
    if (mode_ == Mode::Listener || mode_ == Mode::Program) {
        mode_ = Mode::Friendly;
    }
    cv_.notify_all();
}

std::string SimulatedHub::tokenHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_;
}

std::vector<std::string> SimulatedHub::executedPrograms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return programs_;
}

SimMotorState SimulatedHub::motors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return motors_;
}

bool SimulatedHub::listenerRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_ == Mode::Listener;
}

bool SimulatedHub::programRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_ == Mode::Program;
}

bool SimulatedHub::inRawRepl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_ != Mode::Friendly;
}

bool SimulatedHub::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ && !dropped_;
}

int SimulatedHub::interruptCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupts_;
}

int SimulatedHub::connectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connects_;
}

bool SimulatedHub::waitForTokens(size_t count, int timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [&] { return tokens_.size() >= count; });
}

// ============================================================================
// Device side (mutex held)
// ============================================================================

void SimulatedHub::feed(uint8_t byte) {
    switch (mode_) {
        case Mode::Friendly:
            if (byte == CTRL_A) {
                source_.clear();
                if (!silent_) {
                    mode_ = Mode::RawIdle;
                    emit(RAW_BANNER);
                }
            } else if (byte == CTRL_C) {
                emit("\r\n>>> ");
            }
            break;

        case Mode::RawIdle:
            if (byte == CTRL_A) {
                emit(RAW_BANNER);
            } else if (byte == CTRL_B) {
                mode_ = Mode::Friendly;
                emit(FRIENDLY_BANNER);
            } else if (byte == CTRL_C) {
                source_.clear();
            } else if (byte == CTRL_D) {
                std::string source;
                source.swap(source_);
                execute(source);
            } else {
                source_.push_back(static_cast<char>(byte));
            }
            break;

        case Mode::Listener: {
            if (byte == CTRL_C) {
                interrupt();
                break;
            }
            char token = static_cast<char>(byte);
            if (std::strchr("FTBLRCSX", token) == nullptr || token == '\0') {
                // The listener reads it and matches no branch
                break;
            }
            tokens_.push_back(token);
            DriveCommand cmd = DriveCommand::Stop;
            if (parseDriveCommand(std::string(1, token), cmd)) {
                applyCommand(cmd);
            }
            LOG_LINK(TRACE, "SIM: token '%c' drive=%s steering=%d",
                     token, simDriveToString(motors_.drive), motors_.steering);
            if (token == 'X') {
                mode_ = Mode::RawIdle;
                emit("\x04\x04>");
            }
            break;
        }

        case Mode::Program:
            if (byte == CTRL_C) {
                interrupt();
            }
            break;
    }
}

void SimulatedHub::execute(const std::string& source) {
    emit("OK");

    if (source.find("stdin.read(1)") != std::string::npos) {
        if (!pending_error_.empty()) {
            // Dies while setting up its motors, before reading any token
            std::string error_line = pending_error_;
            pending_error_.clear();
            LOG_LINK(DEBUG, "SIM: listener failed: %s", error_line.c_str());
            finishProgram("Traceback (most recent call last):\r\n"
                          "  File \"<stdin>\", line 4, in <module>\r\n" + error_line + "\r\n");
            return;
        }
        mode_ = Mode::Listener;
        LOG_LINK(DEBUG, "SIM: listener program started");
        return;
    }

    static const std::regex def_re(R"(def\s+(run_\w+)\s*\(\))");
    static const std::regex wait_re(R"(wait\((\d+)\))");

    std::smatch match;
    if (!std::regex_search(source, match, def_re)) {
        // Plain statement batch: runs and returns at once
        finishProgram("");
        return;
    }

    std::string name = match[1].str();
    programs_.push_back(name);

    uint32_t dwell = 0;
    std::smatch wait_match;
    if (std::regex_search(source, wait_match, wait_re)) {
        dwell = static_cast<uint32_t>(std::stoul(wait_match[1].str()));
    }

    DriveCommand cmd = DriveCommand::Shutdown;
    std::string command_name = name.substr(4);
    if (command_name != "stop_all" && !parseDriveCommand(command_name, cmd)) {
        cmd = DriveCommand::Shutdown;
    }
    applyCommand(cmd);

    if (!pending_error_.empty()) {
        std::string error_line = pending_error_;
        pending_error_.clear();
        finishProgram("Traceback (most recent call last):\r\n"
                      "  File \"<stdin>\", line 1, in <module>\r\n" + error_line + "\r\n");
        return;
    }

    auto scaled = std::chrono::microseconds(
        static_cast<int64_t>(dwell * 1000.0 * options_.time_scale));
    program_end_ = std::chrono::steady_clock::now() + scaled;
    mode_ = Mode::Program;
    LOG_LINK(DEBUG, "SIM: %s running for %u ms", name.c_str(), dwell);
}

void SimulatedHub::applyCommand(DriveCommand cmd) {
    switch (cmd) {
        case DriveCommand::Forward:   motors_.drive = SimDrive::Forward; break;
        case DriveCommand::Turbo:     motors_.drive = SimDrive::Turbo; break;
        case DriveCommand::Backward:  motors_.drive = SimDrive::Backward; break;
        case DriveCommand::TurnLeft:  motors_.steering = -1; break;
        case DriveCommand::TurnRight: motors_.steering = 1; break;
        case DriveCommand::Center:    motors_.steering = 0; break;
        case DriveCommand::Stop:      motors_.drive = SimDrive::Stopped; break;
        case DriveCommand::Shutdown:
        default:
            motors_.drive = SimDrive::Stopped;
            break;
    }
}

void SimulatedHub::interrupt() {
    interrupts_++;
    motors_.drive = SimDrive::Stopped;
    LOG_LINK(DEBUG, "SIM: program interrupted");
    finishProgram(INTERRUPT_TRACEBACK);
}

void SimulatedHub::finishProgram(const std::string& stderr_text) {
    // Programs always end with the drive motors stopped
    motors_.drive = SimDrive::Stopped;
    mode_ = Mode::RawIdle;
    emit(std::string("\x04") + stderr_text + "\x04>");
}

void SimulatedHub::advance(std::chrono::steady_clock::time_point now) {
    if (mode_ == Mode::Program && now >= program_end_) {
        finishProgram("");
    }
}

void SimulatedHub::emit(const std::string& bytes) {
    Pending p;
    p.ready_at = std::chrono::steady_clock::now() +
                 std::chrono::milliseconds(options_.reply_latency_ms);
    p.bytes = bytes;
    outbox_.push_back(std::move(p));
}

// ============================================================================
// SimulatedHubTransport
// ============================================================================

SimulatedHubTransport::SimulatedHubTransport(std::shared_ptr<SimulatedHub> hub)
    : hub_(std::move(hub)) {}

SimulatedHubTransport::~SimulatedHubTransport() {
    close();
}

bool SimulatedHubTransport::open(int /*timeout_ms*/) {
    if (!hub_) {
        last_error_ = "No simulated hub";
        return false;
    }
    if (open_) {
        return true;
    }
    if (!hub_->connect()) {
        last_error_ = "Simulated hub refused the connection";
        return false;
    }
    open_ = true;
    last_error_.clear();
    return true;
}

void SimulatedHubTransport::close() {
    if (open_) {
        hub_->disconnect();
        open_ = false;
    }
}

IoResult SimulatedHubTransport::writeAll(const uint8_t* data, size_t len) {
    if (!open_) {
        return IoResult::closed("Not connected");
    }
    IoResult r = hub_->hostWrite(data, len);
    if (!r.ok()) {
        last_error_ = r.message;
    }
    return r;
}

IoResult SimulatedHubTransport::readSome(uint8_t* buffer, size_t len, int timeout_ms) {
    if (!open_) {
        return IoResult::closed("Not connected");
    }
    IoResult r = hub_->hostRead(buffer, len, timeout_ms);
    if (r.status == IoResult::Status::Closed || r.status == IoResult::Status::Error) {
        last_error_ = r.message;
    }
    return r;
}

} // namespace link
} // namespace hubdrive
