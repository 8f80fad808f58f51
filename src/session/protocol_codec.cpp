#include "protocol_codec.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace hubdrive {
namespace session {

const char* protocolModeToString(ProtocolMode mode) {
    switch (mode) {
        case ProtocolMode::Streaming:       return "streaming";
        case ProtocolMode::DiscreteProgram: return "discrete";
        default:                            return "unknown";
    }
}

ProtocolMode stringToProtocolMode(const std::string& str) {
    ProtocolMode mode = ProtocolMode::Streaming;
    parseProtocolMode(str, mode);
    return mode;
}

bool parseProtocolMode(const std::string& str, ProtocolMode& out) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "streaming" || lower == "stream" || lower == "0") {
        out = ProtocolMode::Streaming;
        return true;
    }
    if (lower == "discrete" || lower == "program" || lower == "discrete_program" ||
        lower == "upload" || lower == "1") {
        out = ProtocolMode::DiscreteProgram;
        return true;
    }
    return false;
}

bool isHubPortName(const std::string& name) {
    return name.size() == 1 && name[0] >= 'A' && name[0] <= 'F';
}

uint32_t DriveTuning::dwellFor(DriveCommand cmd) const {
    if (!isValidDriveCommand(cmd)) {
        return 0;
    }
    return dwell_ms[static_cast<size_t>(cmd)];
}

namespace {

// Python statements shared by both program flavours

void appendPreamble(std::ostringstream& src) {
    src << "from pybricks.pupdevices import Motor\n";
    src << "from pybricks.parameters import Port\n";
    src << "from pybricks.tools import wait\n";
}

void appendMotors(std::ostringstream& src, const DriveTuning& t) {
    src << "drive_left = Motor(Port." << t.left_drive_port << ")\n";
    src << "drive_right = Motor(Port." << t.right_drive_port << ")\n";
    src << "steering = Motor(Port." << t.steering_port << ")\n";
}

std::string indent(const std::string& body, const char* prefix) {
    std::istringstream in(body);
    std::ostringstream out;
    std::string line;
    while (std::getline(in, line)) {
        out << prefix << line << "\n";
    }
    return out.str();
}

std::string driveLine(const DriveTuning& t, int speed) {
    std::ostringstream s;
    s << "drive_left.run(" << (t.left_drive_sign * speed) << ")\n";
    s << "drive_right.run(" << (-t.left_drive_sign * speed) << ")\n";
    return s.str();
}

std::string steerLine(const DriveTuning& t, int angle, bool wait) {
    std::ostringstream s;
    s << "steering.run_target(" << t.steering_speed << ", " << angle
      << ", wait=" << (wait ? "True" : "False") << ")\n";
    return s.str();
}

const char* STOP_DRIVE = "drive_left.stop()\ndrive_right.stop()\n";

// Motor instructions for one command, without the trailing stop
std::string commandBody(const DriveTuning& t, DriveCommand cmd) {
    switch (cmd) {
        case DriveCommand::Forward:   return driveLine(t, t.forward_speed);
        case DriveCommand::Turbo:     return driveLine(t, t.turbo_speed);
        case DriveCommand::Backward:  return driveLine(t, -t.reverse_speed);
        case DriveCommand::TurnLeft:  return steerLine(t, -t.steering_angle, false);
        case DriveCommand::TurnRight: return steerLine(t, t.steering_angle, false);
        case DriveCommand::Center:    return steerLine(t, 0, true) + "steering.stop()\n";
        case DriveCommand::Stop:      return STOP_DRIVE;
        case DriveCommand::Shutdown:  return std::string(STOP_DRIVE) + "steering.stop()\n";
        default:                      return std::string(STOP_DRIVE) + "steering.stop()\n";
    }
}

} // namespace

// ============================================================================
// StreamingCodec
// ============================================================================

StreamingCodec::StreamingCodec(const DriveTuning& tuning)
    : ProtocolCodec(tuning) {}

char StreamingCodec::tokenFor(DriveCommand cmd, bool* known) {
    if (known) *known = true;
    switch (cmd) {
        case DriveCommand::Forward:   return tokens::FORWARD;
        case DriveCommand::Turbo:     return tokens::TURBO;
        case DriveCommand::Backward:  return tokens::BACKWARD;
        case DriveCommand::TurnLeft:  return tokens::LEFT;
        case DriveCommand::TurnRight: return tokens::RIGHT;
        case DriveCommand::Center:    return tokens::CENTER;
        case DriveCommand::Stop:      return tokens::STOP;
        case DriveCommand::Shutdown:  return tokens::SHUTDOWN;
        default:
            if (known) *known = false;
            return tokens::SHUTDOWN;
    }
}

WireUnit StreamingCodec::encode(DriveCommand cmd) const {
    bool known = true;
    WireUnit unit;
    unit.kind = WireUnit::Kind::Token;
    unit.token.push_back(static_cast<uint8_t>(tokenFor(cmd, &known)));
    unit.fallback = !known;
    return unit;
}

std::string StreamingCodec::listenerProgram() const {
    const DriveTuning& t = tuning_;
    std::ostringstream src;

    src << "from pybricks.hubs import PrimeHub\n";
    appendPreamble(src);
    src << "import uselect\n";
    src << "import usys\n\n";
    src << "hub = PrimeHub()\n";
    appendMotors(src, t);
    src << "\n";
    src << "poll = uselect.poll()\n";
    src << "poll.register(usys.stdin, uselect.POLLIN)\n\n";
    src << "hub.display.char('G')\n\n";

    src << "while True:\n";
    src << "    if poll.poll(" << t.listener_poll_ms << "):\n";
    src << "        cmd = usys.stdin.read(1)\n";

    struct Branch {
        DriveCommand cmd;
        const char* keyword;
    };
    const Branch branches[] = {
        {DriveCommand::Forward, "if"},
        {DriveCommand::Turbo, "elif"},
        {DriveCommand::Backward, "elif"},
        {DriveCommand::TurnLeft, "elif"},
        {DriveCommand::TurnRight, "elif"},
        {DriveCommand::Center, "elif"},
        {DriveCommand::Stop, "elif"},
        {DriveCommand::Shutdown, "elif"},
    };

    for (const auto& b : branches) {
        src << "        " << b.keyword << " cmd == '" << tokenFor(b.cmd) << "':\n";
        src << indent(commandBody(t, b.cmd), "            ");
        if (b.cmd == DriveCommand::Shutdown) {
            src << "            break\n";
        }
    }
    src << "    wait(" << t.listener_poll_ms << ")\n";

    return src.str();
}

// ============================================================================
// DiscreteProgramCodec
// ============================================================================

DiscreteProgramCodec::DiscreteProgramCodec(const DriveTuning& tuning)
    : ProtocolCodec(tuning) {}

std::string DiscreteProgramCodec::programNameFor(DriveCommand cmd) {
    if (!isValidDriveCommand(cmd)) {
        return "run_stop_all";
    }
    return std::string("run_") + driveCommandToString(cmd);
}

std::string DiscreteProgramCodec::buildProgram(const std::string& function_name,
                                               const std::string& body,
                                               uint32_t dwell_ms,
                                               bool stop_steering) const {
    std::ostringstream src;
    appendPreamble(src);
    src << "\n";
    appendMotors(src, tuning_);
    src << "\n";
    src << "def " << function_name << "():\n";
    src << indent(body, "    ");
    src << "    wait(" << dwell_ms << ")\n";
    // Every program leaves the drive motors stopped, whatever it did
    src << indent(STOP_DRIVE, "    ");
    if (stop_steering) {
        src << "    steering.stop()\n";
    }
    src << "\n";
    src << function_name << "()\n";
    return src.str();
}

WireUnit DiscreteProgramCodec::encode(DriveCommand cmd) const {
    WireUnit unit;
    unit.kind = WireUnit::Kind::Program;
    unit.fallback = !isValidDriveCommand(cmd);
    unit.program_name = programNameFor(cmd);
    unit.dwell_ms = tuning_.dwellFor(cmd);

    bool stop_steering = unit.fallback || cmd == DriveCommand::Shutdown;
    std::string body;
    if (cmd == DriveCommand::Stop || cmd == DriveCommand::Shutdown || unit.fallback) {
        // Nothing to start; the closing stop does the work
        body = "pass\n";
    } else {
        body = commandBody(tuning_, cmd);
    }

    unit.source = buildProgram(unit.program_name, body, unit.dwell_ms, stop_steering);
    return unit;
}

std::unique_ptr<ProtocolCodec> createCodec(ProtocolMode mode, const DriveTuning& tuning) {
    switch (mode) {
        case ProtocolMode::DiscreteProgram:
            return std::make_unique<DiscreteProgramCodec>(tuning);
        case ProtocolMode::Streaming:
        default:
            return std::make_unique<StreamingCodec>(tuning);
    }
}

} // namespace session
} // namespace hubdrive
