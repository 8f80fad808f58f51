#pragma once

#include "widgets/settings.hpp"
#include "config/app_settings.hpp"
#include "session/session_manager.hpp"
#include "hubdrive/types.hpp"
#include "imgui.h"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hubdrive {
namespace gui {

class App {
public:
    struct Options {
        bool enable_sim = false;        // --sim: always offer the simulated hub
        std::string config_path = "";   // --config: Custom config file path
    };

    App();  // Default constructor
    explicit App(const Options& opts);
    ~App();

    void render();

private:
    // Momentary control buttons; index into the button table in app.cpp
    enum class ControlButton {
        Turbo,
        Forward,
        Left,
        Right,
        Back,
        Center,
        Count
    };

    void rebuildSession();
    void startScan();
    void joinScanThread();
    void pollScanResults();
    void pollEvents();
    void send(DriveCommand cmd);

    void renderDevicePanel();
    void renderStatusLine();
    void renderControls();
    void renderLogPanel();
    void handleKeyboard();

    bool momentaryButton(ControlButton id, const char* label, DriveCommand cmd,
                         const ImVec2& size);

    Options options_;
    config::AppSettings settings_;
    SettingsWindow settings_window_;
    std::unique_ptr<session::SessionManager> session_;
    bool rebuild_pending_ = false;      // Settings changed during a session

    // Device scan runs off the render thread
    std::thread scan_thread_;
    std::atomic<bool> scan_running_{false};
    std::mutex scan_mutex_;
    bool scan_ready_ = false;
    std::vector<DeviceDescriptor> scan_results_;
    std::vector<DeviceDescriptor> devices_;
    int selected_device_ = -1;
    bool scanned_once_ = false;

    std::deque<std::string> log_lines_;
    bool log_scroll_to_bottom_ = false;

    // Keys currently held (suppresses auto-repeat)
    std::set<int> pressed_keys_;
    bool button_held_[static_cast<int>(ControlButton::Count)] = {};
};

} // namespace gui
} // namespace hubdrive
