#pragma once

#include "stream_transport.hpp"

#include <string>

namespace hubdrive {
namespace link {

// Raw REPL tunnelled over a TCP byte stream (serial-over-network bridges)
class TcpTransport : public StreamTransport {
public:
    TcpTransport(const std::string& host, int port);
    ~TcpTransport() override;

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    bool open(int timeout_ms) override;
    void close() override;
    bool isOpen() const override { return socket_fd_ >= 0; }

    using StreamTransport::writeAll;
    IoResult writeAll(const uint8_t* data, size_t len) override;
    IoResult readSome(uint8_t* buffer, size_t len, int timeout_ms) override;

    std::string describe() const override;
    std::string lastError() const override { return last_error_; }

    // "host:port" -> parts. False when the port is missing or not a number.
    static bool splitEndpoint(const std::string& endpoint, std::string& host, int& port);

private:
    std::string host_;
    int port_;
    int socket_fd_ = -1;
    std::string last_error_;
};

} // namespace link
} // namespace hubdrive
