#include "settings.hpp"
#include "hubdrive/logging.hpp"
#include "imgui.h"

#include <cstdio>
#include <cstring>

namespace hubdrive {
namespace gui {

namespace {

const char* DWELL_LABELS[DRIVE_COMMAND_COUNT] = {
    "Forward", "Turbo", "Backward", "Left", "Right", "Center", "Stop", "Shutdown",
};

const char* HUB_PORTS[] = {"A", "B", "C", "D", "E", "F"};

bool inputPort(const char* label, char* port, size_t size) {
    int current = -1;
    for (int i = 0; i < 6; i++) {
        if (std::strcmp(port, HUB_PORTS[i]) == 0) current = i;
    }
    ImGui::SetNextItemWidth(50);
    if (!ImGui::Combo(label, &current, HUB_PORTS, 6)) {
        return false;
    }
    std::snprintf(port, size, "%s", HUB_PORTS[current]);
    return true;
}

} // namespace

SettingsWindow::SettingsWindow() {
    LOG_GUI(DEBUG, "SettingsWindow created");
}

bool SettingsWindow::render(config::AppSettings& settings) {
    just_closed_ = false;

    if (!visible_) {
        // Check if we just closed
        if (was_visible_) {
            just_closed_ = true;
            if (on_closed_) {
                on_closed_();
            }
        }
        was_visible_ = false;
        return false;
    }

    bool changed = false;

    ImGui::SetNextWindowSize(ImVec2(420, 460), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Settings", &visible_, ImGuiWindowFlags_NoCollapse)) {

        if (session_active_) {
            ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f),
                               "Changes apply after the current session ends");
            ImGui::Separator();
        }

        if (ImGui::BeginTabBar("SettingsTabs")) {

            if (ImGui::BeginTabItem("Session")) {
                changed |= renderSessionTab(settings);
                ImGui::EndTabItem();
            }

            if (ImGui::BeginTabItem("Link")) {
                changed |= renderLinkTab(settings);
                ImGui::EndTabItem();
            }

            if (ImGui::BeginTabItem("Drive")) {
                changed |= renderDriveTab(settings);
                ImGui::EndTabItem();
            }

            if (ImGui::BeginTabItem("Log")) {
                changed |= renderLogTab(settings);
                ImGui::EndTabItem();
            }

            ImGui::EndTabBar();
        }
    }
    ImGui::End();

    // Track visibility for next frame (to detect close via X button)
    was_visible_ = visible_;

    return changed;
}

bool SettingsWindow::renderSessionTab(config::AppSettings& settings) {
    bool changed = false;
    ImGui::Spacing();
    ImGui::Text("Protocol");
    ImGui::Separator();
    ImGui::Spacing();

    const char* modes[] = { "Streaming (listener program)", "Discrete (one program per command)" };
    ImGui::SetNextItemWidth(280);
    if (ImGui::Combo("##protocol_mode", &settings.protocol_mode, modes, 2)) {
        changed = true;
    }
    if (settings.protocol_mode == 0) {
        ImGui::TextDisabled("Single-letter tokens to a program left running on the hub");
    } else {
        ImGui::TextDisabled("Each command uploads and runs its own short program");
    }

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::Spacing();

    ImGui::Text("Settle Time (ms)");
    ImGui::SetNextItemWidth(120);
    if (ImGui::InputInt("##settle_ms", &settings.settle_ms, 100, 500)) {
        if (settings.settle_ms < 0) settings.settle_ms = 0;
        changed = true;
    }
    ImGui::TextDisabled("Pause after the link opens before commands are accepted");

    ImGui::Spacing();
    ImGui::Text("Shutdown Timeout (ms)");
    ImGui::SetNextItemWidth(120);
    if (ImGui::InputInt("##shutdown_timeout", &settings.shutdown_timeout_ms, 100, 1000)) {
        if (settings.shutdown_timeout_ms < 100) settings.shutdown_timeout_ms = 100;
        changed = true;
    }

    ImGui::Spacing();
    ImGui::Text("Log Panel Lines");
    ImGui::SetNextItemWidth(120);
    if (ImGui::InputInt("##max_log_events", &settings.max_log_events, 64, 256)) {
        if (settings.max_log_events < 16) settings.max_log_events = 16;
        changed = true;
    }
    return changed;
}

bool SettingsWindow::renderLinkTab(config::AppSettings& settings) {
    bool changed = false;
    ImGui::Spacing();
    ImGui::Text("Serial");
    ImGui::Separator();
    ImGui::Spacing();

    ImGui::Text("Baud Rate");
    ImGui::SetNextItemWidth(120);
    const char* bauds[] = { "9600", "19200", "38400", "57600", "115200", "230400" };
    int baud_values[] = { 9600, 19200, 38400, 57600, 115200, 230400 };
    int baud_idx = 4;
    for (int i = 0; i < 6; ++i) {
        if (settings.serial_baud == baud_values[i]) {
            baud_idx = i;
            break;
        }
    }
    if (ImGui::Combo("##serial_baud", &baud_idx, bauds, 6)) {
        settings.serial_baud = baud_values[baud_idx];
        changed = true;
    }

    ImGui::Spacing();
    ImGui::Text("Network");
    ImGui::Separator();
    ImGui::Spacing();

    ImGui::Text("Hub Endpoints");
    ImGui::SetNextItemWidth(-1);
    if (ImGui::InputTextWithHint("##tcp_endpoints", "192.168.4.1:8266, hub.local:23",
                                 settings.tcp_endpoints, sizeof(settings.tcp_endpoints))) {
        changed = true;
    }
    ImGui::TextDisabled("Comma separated host:port list tried during scan");

    ImGui::Spacing();
    if (ImGui::Checkbox("Offer simulated hub", &settings.simulator_enabled)) {
        changed = true;
    }
    if (settings.simulator_enabled) {
        ImGui::SetNextItemWidth(160);
        if (ImGui::SliderFloat("Time scale", &settings.simulator_time_scale, 0.05f, 1.0f, "%.2f")) {
            changed = true;
        }
    }

    ImGui::Spacing();
    ImGui::Text("Timeouts (ms)");
    ImGui::Separator();
    ImGui::Spacing();

    struct TimeoutField {
        const char* label;
        int* value;
    };
    TimeoutField fields[] = {
        { "Open",            &settings.open_timeout_ms },
        { "Program ack",     &settings.program_ack_timeout_ms },
        { "Cancel",          &settings.cancel_timeout_ms },
        { "Run (0 = none)",  &settings.run_timeout_ms },
        { "TCP connect",     &settings.tcp_connect_timeout_ms },
    };
    for (const auto& field : fields) {
        ImGui::SetNextItemWidth(120);
        if (ImGui::InputInt(field.label, field.value, 100, 1000)) {
            if (*field.value < 0) *field.value = 0;
            changed = true;
        }
    }

    ImGui::Spacing();
    ImGui::Text("Scan Timeout (s)");
    ImGui::SetNextItemWidth(120);
    if (ImGui::SliderInt("##scan_timeout", &settings.scan_timeout_s, 1, 15)) {
        changed = true;
    }
    return changed;
}

bool SettingsWindow::renderDriveTab(config::AppSettings& settings) {
    bool changed = false;
    ImGui::Spacing();
    ImGui::Text("Motor Ports");
    ImGui::Separator();
    ImGui::Spacing();

    changed |= inputPort("Left drive", settings.left_drive_port, sizeof(settings.left_drive_port));
    ImGui::SameLine();
    changed |= inputPort("Right drive", settings.right_drive_port, sizeof(settings.right_drive_port));
    ImGui::SameLine();
    changed |= inputPort("Steering", settings.steering_port, sizeof(settings.steering_port));

    bool invert_left = settings.left_drive_sign < 0;
    if (ImGui::Checkbox("Left drive mounted reversed", &invert_left)) {
        settings.left_drive_sign = invert_left ? -1 : 1;
        changed = true;
    }

    ImGui::Spacing();
    ImGui::Text("Speeds (deg/s)");
    ImGui::Separator();
    ImGui::Spacing();

    ImGui::SetNextItemWidth(200);
    changed |= ImGui::SliderInt("Forward", &settings.forward_speed, 100, 1500);
    ImGui::SetNextItemWidth(200);
    changed |= ImGui::SliderInt("Turbo", &settings.turbo_speed, 100, 1500);
    ImGui::SetNextItemWidth(200);
    changed |= ImGui::SliderInt("Reverse", &settings.reverse_speed, 100, 1500);
    ImGui::SetNextItemWidth(200);
    changed |= ImGui::SliderInt("Steering", &settings.steering_speed, 100, 1500);
    ImGui::SetNextItemWidth(200);
    changed |= ImGui::SliderInt("Steering angle (deg)", &settings.steering_angle, 5, 90);

    ImGui::Spacing();
    ImGui::Text("Discrete Program Dwell (ms)");
    ImGui::Separator();
    ImGui::Spacing();

    for (int i = 0; i < DRIVE_COMMAND_COUNT; i++) {
        ImGui::PushID(i);
        ImGui::SetNextItemWidth(120);
        if (ImGui::InputInt(DWELL_LABELS[i], &settings.dwell_ms[i], 100, 500)) {
            if (settings.dwell_ms[i] < 0) settings.dwell_ms[i] = 0;
            changed = true;
        }
        ImGui::PopID();
    }

    ImGui::Spacing();
    ImGui::SetNextItemWidth(120);
    if (ImGui::InputInt("Listener poll (ms)", &settings.listener_poll_ms, 1, 10)) {
        if (settings.listener_poll_ms < 1) settings.listener_poll_ms = 1;
        changed = true;
    }
    return changed;
}

bool SettingsWindow::renderLogTab(config::AppSettings& settings) {
    bool changed = false;
    ImGui::Spacing();
    ImGui::Text("Process Log");
    ImGui::Separator();
    ImGui::Spacing();

    const char* levels[] = { "NONE", "ERROR", "WARN", "INFO", "DEBUG", "TRACE" };
    ImGui::SetNextItemWidth(120);
    if (ImGui::Combo("Level", &settings.log_level, levels, 6)) {
        changed = true;
        if (on_log_level_changed_) {
            on_log_level_changed_(settings.log_level);
        }
    }

    ImGui::Spacing();
    ImGui::Text("Log File");
    ImGui::SetNextItemWidth(-1);
    if (ImGui::InputTextWithHint("##log_file", "Default: logs/hubdrive_gui.log",
                                 settings.log_file, sizeof(settings.log_file))) {
        changed = true;
    }
    ImGui::TextDisabled("Takes effect on next start");
    return changed;
}

} // namespace gui
} // namespace hubdrive
