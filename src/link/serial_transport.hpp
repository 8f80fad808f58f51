#pragma once

#include "stream_transport.hpp"

#include <string>

namespace hubdrive {
namespace link {

// tty in raw 8N1 mode (USB CDC ACM, USB-serial, RFCOMM)
class SerialTransport : public StreamTransport {
public:
    SerialTransport(const std::string& port_name, int baud_rate);
    ~SerialTransport() override;

    // Non-copyable
    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool open(int timeout_ms) override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    using StreamTransport::writeAll;
    IoResult writeAll(const uint8_t* data, size_t len) override;
    IoResult readSome(uint8_t* buffer, size_t len, int timeout_ms) override;

    std::string describe() const override;
    std::string lastError() const override { return last_error_; }

private:
    std::string port_name_;
    int baud_rate_;
    int fd_ = -1;
    std::string last_error_;
};

} // namespace link
} // namespace hubdrive
