#include "app_settings.hpp"
#include "hubdrive/logging.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace hubdrive {
namespace config {

namespace {

void copyBounded(char* dst, size_t dst_size, const std::string& value) {
    if (!dst || dst_size == 0) {
        return;
    }
    std::strncpy(dst, value.c_str(), dst_size - 1);
    dst[dst_size - 1] = '\0';
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Malformed numbers leave the current value alone
void parseInt(const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used == value.size()) {
            out = parsed;
        }
    } catch (const std::invalid_argument&) {
        LOG_GUI(WARN, "Settings: '%s' is not a number", value.c_str());
    } catch (const std::out_of_range&) {
        LOG_GUI(WARN, "Settings: '%s' is out of range", value.c_str());
    }
}

void parseFloat(const std::string& value, float& out) {
    try {
        size_t used = 0;
        float parsed = std::stof(value, &used);
        if (used == value.size()) {
            out = parsed;
        }
    } catch (const std::invalid_argument&) {
        LOG_GUI(WARN, "Settings: '%s' is not a number", value.c_str());
    } catch (const std::out_of_range&) {
        LOG_GUI(WARN, "Settings: '%s' is out of range", value.c_str());
    }
}

// Port letters end up in generated program text; anything but A-F keeps the current value
void parsePort(const std::string& value, char* dst, size_t dst_size) {
    std::string upper = value;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (!session::isHubPortName(upper)) {
        LOG_GUI(WARN, "Settings: '%s' is not a hub port (A-F)", value.c_str());
        return;
    }
    copyBounded(dst, dst_size, upper);
}

std::string checkedPort(const char* value, const std::string& fallback) {
    if (session::isHubPortName(value)) {
        return value;
    }
    LOG_GUI(WARN, "Port '%s' is not a hub port, using %s", value, fallback.c_str());
    return fallback;
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

const char* DWELL_KEYS[DRIVE_COMMAND_COUNT] = {
    "dwell_forward", "dwell_turbo", "dwell_backward", "dwell_left",
    "dwell_right", "dwell_center", "dwell_stop", "dwell_shutdown",
};

} // namespace

// Supports HUBDRIVE_CONFIG for running several instances side by side
std::string AppSettings::getDefaultPath() {
    const char* config_override = std::getenv("HUBDRIVE_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/hubdrive/settings.ini";
    }
    return "settings.ini";
}

bool AppSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_GUI(WARN, "Cannot write settings to %s", filepath.c_str());
        return false;
    }

    file << "[Session]\n";
    file << "protocol_mode="
         << session::protocolModeToString(static_cast<session::ProtocolMode>(protocol_mode)) << "\n";
    file << "settle_ms=" << settle_ms << "\n";
    file << "shutdown_timeout_ms=" << shutdown_timeout_ms << "\n";
    file << "max_log_events=" << max_log_events << "\n";

    file << "\n[Link]\n";
    file << "serial_baud=" << serial_baud << "\n";
    file << "open_timeout_ms=" << open_timeout_ms << "\n";
    file << "program_ack_timeout_ms=" << program_ack_timeout_ms << "\n";
    file << "cancel_timeout_ms=" << cancel_timeout_ms << "\n";
    file << "run_timeout_ms=" << run_timeout_ms << "\n";
    file << "poll_interval_ms=" << poll_interval_ms << "\n";
    file << "tcp_connect_timeout_ms=" << tcp_connect_timeout_ms << "\n";
    file << "tcp_endpoints=" << tcp_endpoints << "\n";
    file << "simulator_enabled=" << (simulator_enabled ? "1" : "0") << "\n";
    file << "simulator_time_scale=" << simulator_time_scale << "\n";
    file << "scan_timeout_s=" << scan_timeout_s << "\n";
    file << "last_device=" << last_device << "\n";

    file << "\n[Drive]\n";
    file << "left_drive_port=" << left_drive_port << "\n";
    file << "right_drive_port=" << right_drive_port << "\n";
    file << "steering_port=" << steering_port << "\n";
    file << "left_drive_sign=" << left_drive_sign << "\n";
    file << "forward_speed=" << forward_speed << "\n";
    file << "turbo_speed=" << turbo_speed << "\n";
    file << "reverse_speed=" << reverse_speed << "\n";
    file << "steering_speed=" << steering_speed << "\n";
    file << "steering_angle=" << steering_angle << "\n";
    file << "listener_poll_ms=" << listener_poll_ms << "\n";
    for (int i = 0; i < DRIVE_COMMAND_COUNT; i++) {
        file << DWELL_KEYS[i] << "=" << dwell_ms[i] << "\n";
    }

    file << "\n[Log]\n";
    file << "level=" << logLevelToString(static_cast<LogLevel>(log_level)) << "\n";
    file << "file=" << log_file << "\n";

    return true;
}

bool AppSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = (close == std::string::npos) ? line.substr(1) : line.substr(1, close - 1);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (section == "Session") {
            if (key == "protocol_mode") {
                protocol_mode = static_cast<int>(session::stringToProtocolMode(value));
            } else if (key == "settle_ms") {
                parseInt(value, settle_ms);
            } else if (key == "shutdown_timeout_ms") {
                parseInt(value, shutdown_timeout_ms);
            } else if (key == "max_log_events") {
                parseInt(value, max_log_events);
            }
        } else if (section == "Link") {
            if (key == "serial_baud") {
                parseInt(value, serial_baud);
            } else if (key == "open_timeout_ms") {
                parseInt(value, open_timeout_ms);
            } else if (key == "program_ack_timeout_ms") {
                parseInt(value, program_ack_timeout_ms);
            } else if (key == "cancel_timeout_ms") {
                parseInt(value, cancel_timeout_ms);
            } else if (key == "run_timeout_ms") {
                parseInt(value, run_timeout_ms);
            } else if (key == "poll_interval_ms") {
                parseInt(value, poll_interval_ms);
            } else if (key == "tcp_connect_timeout_ms") {
                parseInt(value, tcp_connect_timeout_ms);
            } else if (key == "tcp_endpoints") {
                copyBounded(tcp_endpoints, sizeof(tcp_endpoints), value);
            } else if (key == "simulator_enabled") {
                simulator_enabled = parseBool(value);
            } else if (key == "simulator_time_scale") {
                parseFloat(value, simulator_time_scale);
            } else if (key == "scan_timeout_s") {
                parseInt(value, scan_timeout_s);
            } else if (key == "last_device") {
                copyBounded(last_device, sizeof(last_device), value);
            }
        } else if (section == "Drive") {
            if (key == "left_drive_port") {
                parsePort(value, left_drive_port, sizeof(left_drive_port));
            } else if (key == "right_drive_port") {
                parsePort(value, right_drive_port, sizeof(right_drive_port));
            } else if (key == "steering_port") {
                parsePort(value, steering_port, sizeof(steering_port));
            } else if (key == "left_drive_sign") {
                parseInt(value, left_drive_sign);
                left_drive_sign = (left_drive_sign < 0) ? -1 : 1;
            } else if (key == "forward_speed") {
                parseInt(value, forward_speed);
            } else if (key == "turbo_speed") {
                parseInt(value, turbo_speed);
            } else if (key == "reverse_speed") {
                parseInt(value, reverse_speed);
            } else if (key == "steering_speed") {
                parseInt(value, steering_speed);
            } else if (key == "steering_angle") {
                parseInt(value, steering_angle);
            } else if (key == "listener_poll_ms") {
                parseInt(value, listener_poll_ms);
            } else {
                for (int i = 0; i < DRIVE_COMMAND_COUNT; i++) {
                    if (key == DWELL_KEYS[i]) {
                        parseInt(value, dwell_ms[i]);
                        break;
                    }
                }
            }
        } else if (section == "Log") {
            if (key == "level") {
                log_level = static_cast<int>(stringToLogLevel(value.c_str()));
            } else if (key == "file") {
                copyBounded(log_file, sizeof(log_file), value);
            }
        }
    }

    return true;
}

std::vector<std::string> AppSettings::tcpEndpointList() const {
    std::vector<std::string> endpoints;
    std::string list(tcp_endpoints);
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string entry = trim(list.substr(start, comma - start));
        if (!entry.empty()) {
            endpoints.push_back(entry);
        }
        start = comma + 1;
    }
    return endpoints;
}

session::SessionConfig AppSettings::toSessionConfig() const {
    session::SessionConfig cfg;
    cfg.mode = (protocol_mode == static_cast<int>(session::ProtocolMode::DiscreteProgram))
                   ? session::ProtocolMode::DiscreteProgram
                   : session::ProtocolMode::Streaming;
    cfg.settle_ms = settle_ms;
    cfg.shutdown_timeout_ms = shutdown_timeout_ms;
    cfg.max_log_events = max_log_events > 0 ? static_cast<size_t>(max_log_events)
                                            : session::EventRelay::DEFAULT_CAPACITY;

    session::DriveTuning& t = cfg.tuning;
    t.left_drive_port = checkedPort(left_drive_port, t.left_drive_port);
    t.right_drive_port = checkedPort(right_drive_port, t.right_drive_port);
    t.steering_port = checkedPort(steering_port, t.steering_port);
    t.left_drive_sign = left_drive_sign;
    t.forward_speed = forward_speed;
    t.turbo_speed = turbo_speed;
    t.reverse_speed = reverse_speed;
    t.steering_speed = steering_speed;
    t.steering_angle = steering_angle;
    t.listener_poll_ms = listener_poll_ms;
    for (int i = 0; i < DRIVE_COMMAND_COUNT; i++) {
        t.dwell_ms[i] = dwell_ms[i] > 0 ? static_cast<uint32_t>(dwell_ms[i]) : 0;
    }
    return cfg;
}

link::LinkConfig AppSettings::toLinkConfig() const {
    link::LinkConfig cfg;
    cfg.serial_baud = serial_baud;
    cfg.open_timeout_ms = open_timeout_ms;
    cfg.program_ack_timeout_ms = program_ack_timeout_ms;
    cfg.cancel_timeout_ms = cancel_timeout_ms;
    cfg.run_timeout_ms = run_timeout_ms;
    cfg.poll_interval_ms = poll_interval_ms;
    cfg.tcp_connect_timeout_ms = tcp_connect_timeout_ms;
    cfg.tcp_endpoints = tcpEndpointList();
    cfg.simulator_enabled = simulator_enabled;
    cfg.simulator_time_scale = simulator_time_scale;
    return cfg;
}

} // namespace config
} // namespace hubdrive
