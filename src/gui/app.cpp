#include "app.hpp"
#include "link/discovery.hpp"
#include "link/link_adapter.hpp"
#include "hubdrive/logging.hpp"
#include "imgui.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace hubdrive {
namespace gui {

// File logger for the GUI. All categories are redirected here so the
// terminal stays quiet while the window is up.
static FILE* g_gui_log_file = nullptr;
static bool g_log_initialized = false;
static std::string g_gui_log_path;

static void initLog(const std::string& preferred) {
    if (g_log_initialized) return;
    g_log_initialized = true;

    auto tryOpenLog = [](const std::filesystem::path& path) -> FILE* {
        std::error_code ec;
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        return std::fopen(path.string().c_str(), "w");
    };

    std::vector<std::filesystem::path> candidates;
    if (!preferred.empty()) {
        candidates.emplace_back(preferred);
    }
    candidates.emplace_back(std::filesystem::path("logs") / "hubdrive_gui.log");
    candidates.emplace_back("hubdrive_gui.log");
    if (const char* temp = std::getenv("TMPDIR")) {
        candidates.emplace_back(std::filesystem::path(temp) / "hubdrive_gui.log");
    }
    candidates.emplace_back("/tmp/hubdrive_gui.log");

    for (const auto& path : candidates) {
        g_gui_log_file = tryOpenLog(path);
        if (g_gui_log_file) {
            g_gui_log_path = path.string();
            break;
        }
    }

    if (g_gui_log_file) {
        setLogFile(g_gui_log_file);
        LOG_GUI(INFO, "File logger initialized: %s", g_gui_log_path.c_str());
    }
}

static void closeLog() {
    if (g_gui_log_file) {
        setLogFile(nullptr);
        std::fclose(g_gui_log_file);
        g_gui_log_file = nullptr;
    }
}

namespace {

const ImVec4 COLOR_DISCONNECTED(0.90f, 0.25f, 0.25f, 1.0f);
const ImVec4 COLOR_CONNECTING(1.00f, 0.60f, 0.15f, 1.0f);
const ImVec4 COLOR_CONNECTED(0.25f, 0.90f, 0.35f, 1.0f);

struct KeyBinding {
    ImGuiKey key;
    DriveCommand command;
    bool stop_on_release;
    int button;                 // App::ControlButton index
};

// Indices follow App::ControlButton: Turbo, Forward, Left, Right, Back, Center
const KeyBinding KEY_BINDINGS[] = {
    { ImGuiKey_UpArrow,    DriveCommand::Forward,   true,  1 },
    { ImGuiKey_DownArrow,  DriveCommand::Backward,  true,  4 },
    { ImGuiKey_LeftArrow,  DriveCommand::TurnLeft,  false, 2 },
    { ImGuiKey_RightArrow, DriveCommand::TurnRight, false, 3 },
    { ImGuiKey_Enter,      DriveCommand::Turbo,     true,  0 },
    { ImGuiKey_Space,      DriveCommand::Center,    false, 5 },
};

} // namespace

App::App() : App(Options{}) {}

App::App(const Options& opts) : options_(opts) {
    // Load persistent settings
    bool loaded = settings_.load(options_.config_path);
    initLog(settings_.log_file);
    setLogLevel(static_cast<LogLevel>(settings_.log_level));
    LOG_GUI(INFO, "=== GUI Started ===");
    if (loaded) {
        LOG_GUI(INFO, "Loaded config from: %s",
                options_.config_path.empty() ? config::AppSettings::getDefaultPath().c_str()
                                             : options_.config_path.c_str());
    } else {
        LOG_GUI(INFO, "No saved settings, using defaults");
    }
    if (options_.enable_sim) {
        settings_.simulator_enabled = true;
    }

    settings_window_.setClosedCallback([this]() {
        if (!settings_.save(options_.config_path)) {
            log_lines_.push_back("> Could not save settings.");
        }
        rebuild_pending_ = true;
    });
    settings_window_.setLogLevelChangedCallback([](int level) {
        setLogLevel(static_cast<LogLevel>(level));
    });

    rebuildSession();
    startScan();
}

App::~App() {
    joinScanThread();
    if (session_) {
        session_->stop();
        pollEvents();
        session_.reset();
    }
    settings_.save(options_.config_path);
    LOG_GUI(INFO, "=== GUI Stopped ===");
    closeLog();
}

void App::rebuildSession() {
    if (session_) {
        session_->stop();
        pollEvents();
        session_.reset();
    }

    session_ = std::make_unique<session::SessionManager>(
        link::createLinkAdapter(settings_.toLinkConfig()), settings_.toSessionConfig());
    session_->start();
    rebuild_pending_ = false;
    LOG_GUI(INFO, "Session ready (%s mode)",
            session::protocolModeToString(session_->config().mode));
}

// ============================================================================
// Device scan
// ============================================================================

void App::startScan() {
    if (scan_running_) return;
    joinScanThread();

    link::LinkConfig config = settings_.toLinkConfig();
    double timeout = settings_.scan_timeout_s > 0 ? settings_.scan_timeout_s : 4;

    scan_running_ = true;
    LOG_GUI(INFO, "Scanning for hubs (%.0f s)", timeout);
    scan_thread_ = std::thread([this, config, timeout]() {
        std::vector<DeviceDescriptor> found = link::scanDevices(config, timeout);
        {
            std::lock_guard<std::mutex> lock(scan_mutex_);
            scan_results_ = std::move(found);
            scan_ready_ = true;
        }
        scan_running_ = false;
    });
}

void App::joinScanThread() {
    if (scan_thread_.joinable()) {
        scan_thread_.join();
    }
}

void App::pollScanResults() {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    if (!scan_ready_) return;
    scan_ready_ = false;
    scanned_once_ = true;

    devices_ = std::move(scan_results_);
    scan_results_.clear();
    selected_device_ = -1;
    for (size_t i = 0; i < devices_.size(); i++) {
        if (link::formatDeviceAddress(devices_[i]) == settings_.last_device) {
            selected_device_ = static_cast<int>(i);
            break;
        }
    }
    if (selected_device_ < 0 && devices_.size() == 1) {
        selected_device_ = 0;
    }
}

// ============================================================================
// Session events and commands
// ============================================================================

void App::pollEvents() {
    if (!session_) return;
    for (const auto& event : session_->events().poll()) {
        log_lines_.push_back("> " + event.text);
        log_scroll_to_bottom_ = true;
        if (event.severity != session::EventSeverity::Info) {
            LOG_GUI(DEBUG, "%s: %s", session::eventSeverityToString(event.severity),
                    event.text.c_str());
        }
    }

    size_t limit = settings_.max_log_events > 0 ? static_cast<size_t>(settings_.max_log_events)
                                                : session::EventRelay::DEFAULT_CAPACITY;
    while (log_lines_.size() > limit) {
        log_lines_.pop_front();
    }
}

void App::send(DriveCommand cmd) {
    if (!session_ || !session_->isActive()) return;
    session_->sendCommand(cmd);
}

// ============================================================================
// Rendering
// ============================================================================

void App::render() {
    pollScanResults();
    pollEvents();

    bool idle = !session_ || session_->state() == session::SessionState::Idle;
    if (rebuild_pending_ && idle) {
        rebuildSession();
    }
    settings_window_.setSessionActive(!idle);

    handleKeyboard();

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("MainWindow", nullptr, window_flags);

    // Title bar
    ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "hubdrive");
    ImGui::SameLine();
    ImGui::TextDisabled("Hub Remote Control");

    ImGui::SameLine(ImGui::GetWindowWidth() - 80);
    if (ImGui::SmallButton("Settings")) {
        settings_window_.open();
    }

    ImGui::Separator();

    renderDevicePanel();
    ImGui::Separator();
    renderStatusLine();
    ImGui::Separator();
    renderControls();
    ImGui::Separator();
    renderLogPanel();

    ImGui::End();

    settings_window_.render(settings_);
}

void App::renderDevicePanel() {
    ImGui::Text("Hubs");
    ImGui::SameLine();

    bool scanning = scan_running_;
    ImGui::BeginDisabled(scanning);
    if (ImGui::SmallButton(scanning ? "Scanning..." : "Scan")) {
        startScan();
    }
    ImGui::EndDisabled();

    ImGui::BeginChild("DeviceList", ImVec2(0, 110), true);
    if (devices_.empty()) {
        if (scanned_once_ && !scanning) {
            ImGui::TextDisabled("No hubs found.");
        } else {
            ImGui::TextDisabled("Scanning for hubs...");
        }
    }
    bool idle = session_ && session_->state() == session::SessionState::Idle;
    for (size_t i = 0; i < devices_.size(); i++) {
        std::string label = link::formatDeviceLabel(devices_[i]);
        if (ImGui::Selectable(label.c_str(), selected_device_ == static_cast<int>(i)) && idle) {
            selected_device_ = static_cast<int>(i);
        }
    }
    ImGui::EndChild();
}

void App::renderStatusLine() {
    session::SessionState state = session_ ? session_->state() : session::SessionState::Idle;

    const char* text = "DISCONNECTED";
    ImVec4 color = COLOR_DISCONNECTED;
    switch (state) {
        case session::SessionState::Connecting:
            text = "CONNECTING...";
            color = COLOR_CONNECTING;
            break;
        case session::SessionState::Active:
            text = "CONNECTED";
            color = COLOR_CONNECTED;
            break;
        case session::SessionState::Disconnecting:
            text = "DISCONNECTING...";
            color = COLOR_CONNECTING;
            break;
        default:
            break;
    }
    ImGui::TextColored(color, "%s", text);

    if (state != session::SessionState::Idle) {
        DeviceDescriptor current = session_->currentDevice();
        if (!current.empty()) {
            ImGui::SameLine();
            ImGui::TextDisabled("%s", current.name.c_str());
        }
    }

    ImGui::SameLine(ImGui::GetWindowWidth() - 190);
    bool can_connect = state == session::SessionState::Idle && selected_device_ >= 0 &&
                       selected_device_ < static_cast<int>(devices_.size());
    ImGui::BeginDisabled(!can_connect);
    if (ImGui::Button("Connect", ImVec2(85, 0))) {
        const DeviceDescriptor& device = devices_[selected_device_];
        std::snprintf(settings_.last_device, sizeof(settings_.last_device), "%s",
                      link::formatDeviceAddress(device).c_str());
        LOG_GUI(INFO, "Connect to %s", link::formatDeviceLabel(device).c_str());
        session_->connect(device);
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    bool can_disconnect = state == session::SessionState::Connecting ||
                          state == session::SessionState::Active;
    ImGui::BeginDisabled(!can_disconnect);
    if (ImGui::Button("Disconnect", ImVec2(85, 0))) {
        LOG_GUI(INFO, "Disconnect requested by user");
        session_->disconnect();
    }
    ImGui::EndDisabled();
}

bool App::momentaryButton(ControlButton id, const char* label, DriveCommand cmd,
                          const ImVec2& size) {
    int index = static_cast<int>(id);
    bool highlighted = button_held_[index];
    if (highlighted) {
        ImGui::PushStyleColor(ImGuiCol_Button, ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
    }
    bool clicked = ImGui::Button(label, size);
    if (highlighted) {
        ImGui::PopStyleColor();
    }

    if (id == ControlButton::Center) {
        if (clicked) {
            send(cmd);
        }
        return clicked;
    }

    // Press sends the command, release stops the drive
    if (ImGui::IsItemActivated()) {
        send(cmd);
    }
    if (ImGui::IsItemDeactivated()) {
        send(DriveCommand::Stop);
    }
    return clicked;
}

void App::renderControls() {
    bool active = session_ && session_->isActive();
    ImVec2 size(90, 40);
    float spacing = ImGui::GetStyle().ItemSpacing.x;
    float row_width = size.x * 3 + spacing * 2;
    float indent = (ImGui::GetContentRegionAvail().x - row_width) * 0.5f;
    if (indent < 0) indent = 0;
    float middle = indent + size.x + spacing;

    ImGui::BeginDisabled(!active);

    ImGui::SetCursorPosX(middle);
    ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.70f, 0.35f, 0.10f, 1.0f));
    momentaryButton(ControlButton::Turbo, "TURBO", DriveCommand::Turbo, size);
    ImGui::PopStyleColor();

    ImGui::SetCursorPosX(middle);
    momentaryButton(ControlButton::Forward, "FORWARD", DriveCommand::Forward, size);

    ImGui::SetCursorPosX(indent);
    momentaryButton(ControlButton::Left, "LEFT", DriveCommand::TurnLeft, size);
    ImGui::SameLine();
    momentaryButton(ControlButton::Center, "CENTER", DriveCommand::Center, size);
    ImGui::SameLine();
    momentaryButton(ControlButton::Right, "RIGHT", DriveCommand::TurnRight, size);

    ImGui::SetCursorPosX(middle);
    momentaryButton(ControlButton::Back, "BACK", DriveCommand::Backward, size);

    ImGui::EndDisabled();

    ImGui::TextDisabled("Keys: arrows drive and steer, Enter = turbo, Space = center");
}

void App::renderLogPanel() {
    ImGui::Text("Log");
    ImGui::SameLine();
    if (ImGui::SmallButton("Clear")) {
        log_lines_.clear();
    }

    ImGui::BeginChild("LogPanel", ImVec2(0, 0), true, ImGuiWindowFlags_HorizontalScrollbar);
    for (const auto& line : log_lines_) {
        ImGui::TextUnformatted(line.c_str());
    }
    if (log_scroll_to_bottom_) {
        ImGui::SetScrollHereY(1.0f);
        log_scroll_to_bottom_ = false;
    }
    ImGui::EndChild();
}

void App::handleKeyboard() {
    if (ImGui::GetIO().WantTextInput) {
        return;
    }

    for (const auto& binding : KEY_BINDINGS) {
        int key = static_cast<int>(binding.key);
        if (ImGui::IsKeyDown(binding.key)) {
            if (pressed_keys_.insert(key).second) {
                button_held_[binding.button] = true;
                send(binding.command);
            }
        } else if (pressed_keys_.erase(key) > 0) {
            button_held_[binding.button] = false;
            if (binding.stop_on_release) {
                send(DriveCommand::Stop);
            }
        }
    }
}

} // namespace gui
} // namespace hubdrive
