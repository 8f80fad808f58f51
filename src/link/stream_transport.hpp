#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hubdrive {
namespace link {

// Result of one transport read or write
struct IoResult {
    enum class Status {
        Ok,
        Timeout,    // Nothing happened within the wait
        Closed,     // Peer went away (EOF, hangup, reset)
        Error       // Anything else; see message
    };

    Status status = Status::Ok;
    size_t bytes = 0;
    std::string message;

    bool ok() const { return status == Status::Ok; }

    static IoResult success(size_t n) {
        IoResult r;
        r.bytes = n;
        return r;
    }
    static IoResult timeout() {
        IoResult r;
        r.status = Status::Timeout;
        return r;
    }
    static IoResult closed(std::string msg) {
        IoResult r;
        r.status = Status::Closed;
        r.message = std::move(msg);
        return r;
    }
    static IoResult error(std::string msg) {
        IoResult r;
        r.status = Status::Error;
        r.message = std::move(msg);
        return r;
    }
};

const char* ioStatusToString(IoResult::Status status);

// Byte pipe to a hub. Blocking, used from one thread at a time.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    virtual bool open(int timeout_ms) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Writes everything or fails
    virtual IoResult writeAll(const uint8_t* data, size_t len) = 0;

    // Waits up to timeout_ms for at least one byte
    virtual IoResult readSome(uint8_t* buffer, size_t len, int timeout_ms) = 0;

    virtual std::string describe() const = 0;
    virtual std::string lastError() const = 0;

    IoResult writeAll(const std::string& text) {
        return writeAll(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }
};

} // namespace link
} // namespace hubdrive
