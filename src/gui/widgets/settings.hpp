#pragma once

#include "config/app_settings.hpp"

#include <functional>

namespace hubdrive {
namespace gui {

class SettingsWindow {
public:
    SettingsWindow();

    // Show the settings window (call from main render loop)
    // Returns true if settings were changed
    bool render(config::AppSettings& settings);

    // Open/close the window
    void open() { visible_ = true; }
    void close() { visible_ = false; }
    bool isVisible() const { return visible_; }
    bool wasJustClosed() const { return just_closed_; }  // Check if closed this frame

    // Locked while a session is in progress; link and drive values apply on the next session
    void setSessionActive(bool active) { session_active_ = active; }

    // Callback when settings window closes (to save and rebuild the session)
    using ClosedCallback = std::function<void()>;
    void setClosedCallback(ClosedCallback cb) { on_closed_ = cb; }

    // Callback when the log level changes (applied immediately)
    using LogLevelChangedCallback = std::function<void(int level)>;
    void setLogLevelChangedCallback(LogLevelChangedCallback cb) { on_log_level_changed_ = cb; }

private:
    bool visible_ = false;
    bool was_visible_ = false;  // Track previous frame visibility
    bool just_closed_ = false;  // Set when window closes
    bool session_active_ = false;

    ClosedCallback on_closed_;
    LogLevelChangedCallback on_log_level_changed_;

    bool renderSessionTab(config::AppSettings& settings);
    bool renderLinkTab(config::AppSettings& settings);
    bool renderDriveTab(config::AppSettings& settings);
    bool renderLogTab(config::AppSettings& settings);
};

} // namespace gui
} // namespace hubdrive
