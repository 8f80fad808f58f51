/**
 * hubdrive CLI - drive a hub from a terminal
 *
 * Connects to one device, then reads drive commands from stdin, one or more
 * per line: single-letter tokens (F T B L R C S X) or words (forward, turbo,
 * back, left, right, center, stop, shutdown). "quit" or EOF disconnects.
 * Session events are printed as they arrive.
 *
 *   hubdrive_cli --device sim
 *   hubdrive_cli --device serial:/dev/ttyACM0 --mode discrete
 *   hubdrive_cli --scan
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "config/app_settings.hpp"
#include "link/discovery.hpp"
#include "link/link_adapter.hpp"
#include "session/protocol_codec.hpp"
#include "session/session_manager.hpp"
#include "hubdrive/logging.hpp"
#include "hubdrive/types.hpp"

using namespace hubdrive;

namespace {

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --device, -d <addr>   serial:/dev/ttyACM0 | /dev/ttyACM0 | tcp:host:port | sim\n"
              << "  --mode, -m <mode>     streaming | discrete (default from settings)\n"
              << "  --config, -c <path>   Settings file\n"
              << "  --scan                List reachable hubs and exit\n"
              << "  --verbose, -v         Debug logging to stderr\n"
              << "\nCommands on stdin: F T B L R C S X, forward, turbo, back, left,\n"
              << "right, center, stop, shutdown, quit\n";
}

// Prints relay events from a background thread while stdin blocks
class EventPrinter {
public:
    explicit EventPrinter(session::EventRelay& relay) : relay_(relay) {}
    ~EventPrinter() { stop(); }

    void start() {
        running_ = true;
        thread_ = std::thread([this]() {
            while (running_) {
                flush();
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        flush();
    }

private:
    void flush() {
        for (const auto& event : relay_.poll()) {
            std::ostream& out = (event.severity == session::EventSeverity::Info) ? std::cout : std::cerr;
            out << session::formatLogEvent(event) << std::endl;
        }
    }

    session::EventRelay& relay_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

int runScan(const config::AppSettings& settings) {
    auto devices = link::scanDevices(settings.toLinkConfig(), settings.scan_timeout_s);
    if (devices.empty()) {
        std::cout << "No hubs found." << std::endl;
        return 1;
    }
    for (const auto& device : devices) {
        std::cout << link::formatDeviceLabel(device) << "  ("
                  << deviceTransportToString(device.transport) << ")" << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string device_spec;
    std::string mode_arg;
    std::string config_path;
    bool scan_only = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--device" || arg == "-d") && i + 1 < argc) {
            device_spec = argv[++i];
        } else if ((arg == "--mode" || arg == "-m") && i + 1 < argc) {
            mode_arg = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--scan") {
            scan_only = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    config::AppSettings settings;
    settings.load(config_path);
    setLogLevel(verbose ? LogLevel::DEBUG : static_cast<LogLevel>(settings.log_level));

    if (!mode_arg.empty()) {
        session::ProtocolMode mode = session::ProtocolMode::Streaming;
        if (!session::parseProtocolMode(mode_arg, mode)) {
            std::cerr << "Unknown mode: " << mode_arg << " (use "
                      << session::protocolModeToString(session::ProtocolMode::Streaming) << ", "
                      << session::protocolModeToString(session::ProtocolMode::DiscreteProgram) << ")\n";
            return 1;
        }
        settings.protocol_mode = static_cast<int>(mode);
    }

    if (scan_only) {
        return runScan(settings);
    }

    if (device_spec.empty()) {
        device_spec = settings.last_device;
    }
    DeviceDescriptor device;
    if (!link::parseDeviceAddress(device_spec, device)) {
        std::cerr << "No usable device. Pass --device or run --scan.\n";
        return 1;
    }

    session::SessionManager session(link::createLinkAdapter(settings.toLinkConfig()),
                                    settings.toSessionConfig());

    std::atomic<bool> reached_active{false};
    std::atomic<bool> session_ended{false};
    session.setStateCallback([&](session::SessionState state) {
        if (state == session::SessionState::Active) {
            reached_active = true;
        } else if (state == session::SessionState::Idle) {
            session_ended = true;
        }
    });

    EventPrinter printer(session.events());
    printer.start();
    session.start();

    if (!session.connect(device)) {
        session.stop();
        printer.stop();
        return 1;
    }

    while (!reached_active && !session_ended) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!reached_active) {
        session.stop();
        printer.stop();
        return 1;
    }

    std::string line;
    bool quit = false;
    while (!quit && !session_ended && std::getline(std::cin, line)) {
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            if (word == "quit" || word == "q" || word == "exit") {
                quit = true;
                break;
            }
            DriveCommand cmd;
            if (!parseDriveCommand(word, cmd)) {
                std::cerr << "Unknown command: " << word << std::endl;
                continue;
            }
            if (!session.sendCommand(cmd)) {
                std::cerr << "Not connected; '" << word << "' dropped" << std::endl;
            }
        }
    }

    session.disconnect();
    while (!session_ended) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    session.stop();
    printer.stop();

    // Remember the device only; command-line overrides stay out of the file
    config::AppSettings saved;
    saved.load(config_path);
    std::snprintf(saved.last_device, sizeof(saved.last_device), "%s", device_spec.c_str());
    saved.save(config_path);
    return 0;
}
