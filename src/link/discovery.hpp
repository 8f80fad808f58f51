#pragma once

#include "link_adapter.hpp"
#include "hubdrive/types.hpp"

#include <string>
#include <vector>

namespace hubdrive {
namespace link {

// Lists hubs that can be offered to the user: serial ports with a readable
// product name, configured TCP endpoints that accept a connection, and the
// simulated hub when enabled. Blocks for at most about timeout_seconds.
std::vector<DeviceDescriptor> scanDevices(const LinkConfig& config, double timeout_seconds);

// "serial:/dev/ttyACM0", "/dev/ttyACM0", "tcp:host:port", "sim"
bool parseDeviceAddress(const std::string& text, DeviceDescriptor& out);

// Inverse of parseDeviceAddress: "tcp:host:port", "sim" or the device path
std::string formatDeviceAddress(const DeviceDescriptor& device);

// "name [address]"
std::string formatDeviceLabel(const DeviceDescriptor& device);

} // namespace link
} // namespace hubdrive
