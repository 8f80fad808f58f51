#pragma once

#include "session/session_manager.hpp"
#include "link/link_adapter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hubdrive {
namespace config {

// Settings that persist across runs (INI file)
struct AppSettings {
    // Save/load to file. Empty path = getDefaultPath().
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // HUBDRIVE_CONFIG, else ~/.config/hubdrive/settings.ini
    static std::string getDefaultPath();

    // Session
    int protocol_mode = 0;                  // session::ProtocolMode
    int settle_ms = 1000;
    int shutdown_timeout_ms = 3000;
    int max_log_events = 1024;

    // Link
    int serial_baud = 115200;
    int open_timeout_ms = 5000;
    int program_ack_timeout_ms = 3000;
    int cancel_timeout_ms = 2000;
    int run_timeout_ms = 0;                 // 0 = wait for the program forever
    int poll_interval_ms = 50;
    int tcp_connect_timeout_ms = 3000;
    char tcp_endpoints[256] = "";           // Comma separated host:port list
    bool simulator_enabled = true;
    float simulator_time_scale = 1.0f;
    int scan_timeout_s = 4;
    char last_device[128] = "";             // Address of the last hub used

    // Drive
    char left_drive_port[4] = "B";
    char right_drive_port[4] = "F";
    char steering_port[4] = "D";
    int left_drive_sign = -1;
    int forward_speed = 800;
    int turbo_speed = 1100;
    int reverse_speed = 800;
    int steering_speed = 500;
    int steering_angle = 25;
    int listener_poll_ms = 10;
    int dwell_ms[DRIVE_COMMAND_COUNT] = {1000, 1000, 1000, 500, 500, 500, 0, 0};

    // Log
    int log_level = 3;                      // hubdrive::LogLevel
    char log_file[256] = "";                // Empty = frontend default

    // Derived runtime configuration
    session::SessionConfig toSessionConfig() const;
    link::LinkConfig toLinkConfig() const;
    std::vector<std::string> tcpEndpointList() const;
};

} // namespace config
} // namespace hubdrive
