#include "discovery.hpp"
#include "tcp_transport.hpp"
#include "hubdrive/logging.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace hubdrive {
namespace link {

namespace {

const char* SERIAL_PREFIXES[] = {"ttyACM", "ttyUSB", "rfcomm"};

bool hasSerialPrefix(const std::string& name) {
    for (const char* prefix : SERIAL_PREFIXES) {
        if (name.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::string readFirstLine(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) {
        return std::string();
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

// USB product string for a tty, looked up through sysfs
std::string serialProductName(const std::string& tty) {
    std::filesystem::path device = std::filesystem::path("/sys/class/tty") / tty / "device";
    // CDC ACM: device is the interface, product sits on its parent.
    // USB-serial: one level further up.
    const std::filesystem::path candidates[] = {
        device / ".." / "product",
        device / ".." / ".." / "product",
    };
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }
        std::string name = readFirstLine(candidate);
        if (!name.empty()) {
            return name;
        }
    }
    if (tty.rfind("rfcomm", 0) == 0) {
        return "Bluetooth serial (" + tty + ")";
    }
    return std::string();
}

bool usableName(const std::string& name) {
    return !name.empty() && name != "Unknown";
}

} // namespace

std::vector<DeviceDescriptor> scanDevices(const LinkConfig& config, double timeout_seconds) {
    auto start = std::chrono::steady_clock::now();
    auto budget = std::chrono::milliseconds(static_cast<int64_t>(timeout_seconds * 1000.0));
    std::vector<DeviceDescriptor> devices;

    std::error_code ec;
    std::vector<std::string> ttys;
    for (const auto& entry : std::filesystem::directory_iterator("/dev", ec)) {
        std::string name = entry.path().filename().string();
        if (hasSerialPrefix(name)) {
            ttys.push_back(name);
        }
    }
    if (ec) {
        LOG_LINK(WARN, "Cannot list /dev: %s", ec.message().c_str());
    }
    std::sort(ttys.begin(), ttys.end());

    for (const auto& tty : ttys) {
        DeviceDescriptor d;
        d.address = "/dev/" + tty;
        d.name = serialProductName(tty);
        d.transport = DeviceTransport::Serial;
        if (!usableName(d.name)) {
            LOG_LINK(DEBUG, "Skipping %s (no product name)", d.address.c_str());
            continue;
        }
        devices.push_back(d);
    }

    for (const auto& endpoint : config.tcp_endpoints) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed >= budget) {
            LOG_LINK(WARN, "Scan time exhausted before trying %s", endpoint.c_str());
            break;
        }
        int remaining_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(budget - elapsed).count());

        std::string host;
        int port = 0;
        if (!TcpTransport::splitEndpoint(endpoint, host, port)) {
            LOG_LINK(WARN, "Ignoring malformed endpoint '%s'", endpoint.c_str());
            continue;
        }

        TcpTransport tcp(host, port);
        if (!tcp.open(std::min(remaining_ms, config.tcp_connect_timeout_ms))) {
            continue;
        }
        tcp.close();

        DeviceDescriptor d;
        d.address = endpoint;
        d.name = "Network hub " + host;
        d.transport = DeviceTransport::Tcp;
        devices.push_back(d);
    }

    if (config.simulator_enabled) {
        DeviceDescriptor d;
        d.address = "sim";
        d.name = "Simulated hub";
        d.transport = DeviceTransport::Simulated;
        devices.push_back(d);
    }

    LOG_LINK(INFO, "Scan found %zu device(s)", devices.size());
    return devices;
}

bool parseDeviceAddress(const std::string& text, DeviceDescriptor& out) {
    if (text.empty()) {
        return false;
    }

    DeviceDescriptor d;
    if (text == "sim") {
        d.address = "sim";
        d.name = "Simulated hub";
        d.transport = DeviceTransport::Simulated;
    } else if (text.rfind("tcp:", 0) == 0) {
        d.address = text.substr(4);
        std::string host;
        int port = 0;
        if (!TcpTransport::splitEndpoint(d.address, host, port)) {
            return false;
        }
        d.name = "Network hub " + host;
        d.transport = DeviceTransport::Tcp;
    } else {
        d.address = (text.rfind("serial:", 0) == 0) ? text.substr(7) : text;
        if (d.address.empty()) {
            return false;
        }
        std::string tty = std::filesystem::path(d.address).filename().string();
        d.name = serialProductName(tty);
        if (d.name.empty()) {
            d.name = tty;
        }
        d.transport = DeviceTransport::Serial;
    }

    out = d;
    return true;
}

std::string formatDeviceAddress(const DeviceDescriptor& device) {
    switch (device.transport) {
        case DeviceTransport::Tcp:       return "tcp:" + device.address;
        case DeviceTransport::Simulated: return "sim";
        default:                         return device.address;
    }
}

std::string formatDeviceLabel(const DeviceDescriptor& device) {
    return device.name + " [" + device.address + "]";
}

} // namespace link
} // namespace hubdrive
