#pragma once

#include "hubdrive/types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace hubdrive {
namespace session {

// How commands reach the hub
enum class ProtocolMode {
    Streaming = 0,        // One token per command to a resident listener program
    DiscreteProgram = 1,  // One self-terminating program per command
};

const char* protocolModeToString(ProtocolMode mode);
ProtocolMode stringToProtocolMode(const std::string& str);      // Unknown -> Streaming
bool parseProtocolMode(const std::string& str, ProtocolMode& out);

// Motor magnitudes and timing. Deployment parameters, not protocol constants.
struct DriveTuning {
    // Hub ports (Pybricks Port.X names)
    std::string left_drive_port = "B";
    std::string right_drive_port = "F";
    std::string steering_port = "D";

    // The two drive motors face each other; the left one runs with this sign
    // for forward motion and the right one with the opposite sign.
    int left_drive_sign = -1;

    int forward_speed = 800;        // deg/s
    int turbo_speed = 1100;         // deg/s
    int reverse_speed = 800;        // deg/s
    int steering_speed = 500;       // deg/s
    int steering_angle = 25;        // deg either side of center

    int listener_poll_ms = 10;      // stdin poll period on the hub

    // Hold time per command in discrete-program mode, indexed by DriveCommand
    std::array<uint32_t, DRIVE_COMMAND_COUNT> dwell_ms = {
        1000,   // Forward
        1000,   // Turbo
        1000,   // Backward
        500,    // TurnLeft
        500,    // TurnRight
        500,    // Center
        0,      // Stop
        0,      // Shutdown
    };

    uint32_t dwellFor(DriveCommand cmd) const;
};

// What the session hands to the link for one command
struct WireUnit {
    enum class Kind {
        Token,      // Write `token` to the running listener
        Program     // Run `source` to completion
    };

    Kind kind = Kind::Token;
    Bytes token;
    std::string program_name;   // run_<command>, Program only
    std::string source;         // Program only
    uint32_t dwell_ms = 0;

    // Input was outside the DriveCommand set; this is the stop-all unit
    bool fallback = false;

    bool isProgram() const { return kind == Kind::Program; }
};

// Streaming wire tokens
namespace tokens {
    constexpr char FORWARD = 'F';
    constexpr char TURBO = 'T';
    constexpr char BACKWARD = 'B';
    constexpr char LEFT = 'L';
    constexpr char RIGHT = 'R';
    constexpr char CENTER = 'C';
    constexpr char STOP = 'S';
    constexpr char SHUTDOWN = 'X';    // Stop all actuators, end listener
}

// Translates drive commands into wire units. encode() is pure and total.
class ProtocolCodec {
public:
    virtual ~ProtocolCodec() = default;

    virtual WireUnit encode(DriveCommand cmd) const = 0;

    // Source of the resident listener, empty when the mode needs none
    virtual std::string listenerProgram() const = 0;

    virtual ProtocolMode mode() const = 0;
    virtual const char* name() const = 0;

    WireUnit shutdownUnit() const { return encode(DriveCommand::Shutdown); }

    const DriveTuning& tuning() const { return tuning_; }

protected:
    explicit ProtocolCodec(const DriveTuning& tuning) : tuning_(tuning) {}

    DriveTuning tuning_;
};

class StreamingCodec : public ProtocolCodec {
public:
    explicit StreamingCodec(const DriveTuning& tuning = DriveTuning{});

    WireUnit encode(DriveCommand cmd) const override;
    std::string listenerProgram() const override;
    ProtocolMode mode() const override { return ProtocolMode::Streaming; }
    const char* name() const override { return "streaming"; }

    // Token for a command; the shutdown token for anything out of set
    static char tokenFor(DriveCommand cmd, bool* known = nullptr);
};

class DiscreteProgramCodec : public ProtocolCodec {
public:
    explicit DiscreteProgramCodec(const DriveTuning& tuning = DriveTuning{});

    WireUnit encode(DriveCommand cmd) const override;
    std::string listenerProgram() const override { return std::string(); }
    ProtocolMode mode() const override { return ProtocolMode::DiscreteProgram; }
    const char* name() const override { return "discrete"; }

    // "run_" + command name; "run_stop_all" for out-of-set input
    static std::string programNameFor(DriveCommand cmd);

private:
    std::string buildProgram(const std::string& function_name,
                             const std::string& body,
                             uint32_t dwell_ms,
                             bool stop_steering) const;
};

// Hub port letter as used in Port.<X> (A to F)
bool isHubPortName(const std::string& name);

std::unique_ptr<ProtocolCodec> createCodec(ProtocolMode mode,
                                           const DriveTuning& tuning = DriveTuning{});

} // namespace session
} // namespace hubdrive
