#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hubdrive {

using Bytes = std::vector<uint8_t>;            // Raw link payload

// How a discovered device is reached
enum class DeviceTransport : uint8_t {
    Serial = 0,     // tty (USB CDC, RFCOMM)
    Tcp = 1,        // WebREPL-style bridge or serial-over-TCP
    Simulated = 2,  // In-process virtual hub
};

inline const char* deviceTransportToString(DeviceTransport transport) {
    switch (transport) {
        case DeviceTransport::Serial:    return "serial";
        case DeviceTransport::Tcp:       return "tcp";
        case DeviceTransport::Simulated: return "sim";
        default:                         return "unknown";
    }
}

// Identity of a remote peer chosen by the user. Never modified once captured.
struct DeviceDescriptor {
    std::string address;    // /dev/ttyACM0, host:port, "sim"
    std::string name;       // Human-readable name shown in the UI
    DeviceTransport transport = DeviceTransport::Serial;

    bool empty() const { return address.empty(); }
};

// Logical movement intents. Closed set; values outside it are treated as
// protocol mismatches by the codec.
enum class DriveCommand : uint8_t {
    Forward = 0,
    Turbo = 1,
    Backward = 2,
    TurnLeft = 3,
    TurnRight = 4,
    Center = 5,
    Stop = 6,
    Shutdown = 7,
};

constexpr int DRIVE_COMMAND_COUNT = 8;

inline bool isValidDriveCommand(DriveCommand cmd) {
    return static_cast<int>(cmd) < DRIVE_COMMAND_COUNT;
}

// Lowercase identifier, used in program names (run_forward) and the CLI
inline const char* driveCommandToString(DriveCommand cmd) {
    switch (cmd) {
        case DriveCommand::Forward:   return "forward";
        case DriveCommand::Turbo:     return "turbo";
        case DriveCommand::Backward:  return "backward";
        case DriveCommand::TurnLeft:  return "left";
        case DriveCommand::TurnRight: return "right";
        case DriveCommand::Center:    return "center";
        case DriveCommand::Stop:      return "stop";
        case DriveCommand::Shutdown:  return "shutdown";
        default:                      return "unknown";
    }
}

// Text shown in the event log when a command goes out
inline const char* driveCommandDescription(DriveCommand cmd) {
    switch (cmd) {
        case DriveCommand::Forward:   return "Forward";
        case DriveCommand::Turbo:     return "TURBO!";
        case DriveCommand::Backward:  return "Reverse";
        case DriveCommand::TurnLeft:  return "Steer left";
        case DriveCommand::TurnRight: return "Steer right";
        case DriveCommand::Center:    return "Steering centered";
        case DriveCommand::Stop:      return "Stopping motors";
        case DriveCommand::Shutdown:  return "Shutdown";
        default:                      return "Unknown command";
    }
}

// Parse a CLI word or a single streaming token (case-insensitive).
// Returns false for anything that is not a known command.
bool parseDriveCommand(const std::string& text, DriveCommand& out);

} // namespace hubdrive
