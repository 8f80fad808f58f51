#pragma once

#include "stream_transport.hpp"
#include "hubdrive/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hubdrive {
namespace link {

struct SimHubOptions {
    int reply_latency_ms = 5;       // Delay before each reply becomes readable
    double time_scale = 1.0;        // Multiplies wait() inside discrete programs
};

enum class SimDrive {
    Stopped,
    Forward,
    Turbo,
    Backward
};

const char* simDriveToString(SimDrive drive);

struct SimMotorState {
    SimDrive drive = SimDrive::Stopped;
    int steering = 0;               // -1 left, 0 center, +1 right
};

// Virtual hub running MicroPython's raw REPL.
//
// Understands the resident listener (any program reading single characters
// from stdin) and self-terminating run_<command> programs. Everything the
// host sends is recorded so tests can check what reached the device.
class SimulatedHub {
public:
    explicit SimulatedHub(const SimHubOptions& options = SimHubOptions{});

    // Non-copyable
    SimulatedHub(const SimulatedHub&) = delete;
    SimulatedHub& operator=(const SimulatedHub&) = delete;

    // Host side
    bool connect();
    void disconnect();
    IoResult hostWrite(const uint8_t* data, size_t len);
    IoResult hostRead(uint8_t* buffer, size_t len, int timeout_ms);

    // Fault injection
    void setRefuseConnections(bool refuse);
    void setSilent(bool silent);                        // Never shows the raw REPL prompt
    void failNextProgram(const std::string& error_line);   // Listener included
    void dropConnection();                              // Hub powers off / link lost

    // Inspection
    std::string tokenHistory() const;
    std::vector<std::string> executedPrograms() const;
    SimMotorState motors() const;
    bool listenerRunning() const;
    bool programRunning() const;
    bool inRawRepl() const;
    bool isConnected() const;
    int interruptCount() const;
    int connectCount() const;

    // Blocks until at least `count` tokens were received or the timeout expires
    bool waitForTokens(size_t count, int timeout_ms) const;

private:
    enum class Mode {
        Friendly,
        RawIdle,
        Listener,
        Program
    };

    struct Pending {
        std::chrono::steady_clock::time_point ready_at;
        std::string bytes;
    };

    void feed(uint8_t byte);
    void execute(const std::string& source);
    void applyCommand(DriveCommand cmd);
    void interrupt();
    void finishProgram(const std::string& stderr_text);
    void advance(std::chrono::steady_clock::time_point now);
    void emit(const std::string& bytes);

    SimHubOptions options_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    Mode mode_ = Mode::Friendly;
    bool connected_ = false;
    bool dropped_ = false;
    bool refuse_ = false;
    bool silent_ = false;
    std::string pending_error_;

    std::string source_;
    std::deque<Pending> outbox_;
    std::chrono::steady_clock::time_point program_end_;

    SimMotorState motors_;
    std::string tokens_;
    std::vector<std::string> programs_;
    int interrupts_ = 0;
    int connects_ = 0;
};

// StreamTransport view of a SimulatedHub
class SimulatedHubTransport : public StreamTransport {
public:
    explicit SimulatedHubTransport(std::shared_ptr<SimulatedHub> hub);
    ~SimulatedHubTransport() override;

    bool open(int timeout_ms) override;
    void close() override;
    bool isOpen() const override { return open_; }

    using StreamTransport::writeAll;
    IoResult writeAll(const uint8_t* data, size_t len) override;
    IoResult readSome(uint8_t* buffer, size_t len, int timeout_ms) override;

    std::string describe() const override { return "simulated hub"; }
    std::string lastError() const override { return last_error_; }

private:
    std::shared_ptr<SimulatedHub> hub_;
    bool open_ = false;
    std::string last_error_;
};

} // namespace link
} // namespace hubdrive
