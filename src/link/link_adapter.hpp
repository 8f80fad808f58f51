#pragma once

#include "hubdrive/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hubdrive {
namespace link {

// Outcome of a link operation. The kind is what callers branch on; the
// message is only for humans.
enum class LinkErrorKind {
    None = 0,
    BenignDisconnect,   // Peer closed the link normally
    LinkFailure,        // Open/write/install/run failed
    Cancelled,          // Caller's CancelToken fired during a wait
    Timeout             // Bounded wait expired
};

const char* linkErrorKindToString(LinkErrorKind kind);

struct LinkStatus {
    LinkErrorKind kind = LinkErrorKind::None;
    std::string message;

    bool ok() const { return kind == LinkErrorKind::None; }
    bool isBenignDisconnect() const { return kind == LinkErrorKind::BenignDisconnect; }

    static LinkStatus success() { return LinkStatus{}; }
    static LinkStatus failure(LinkErrorKind kind, std::string message) {
        LinkStatus s;
        s.kind = kind;
        s.message = std::move(message);
        return s;
    }
};

template <typename T>
struct LinkResult {
    LinkStatus status;
    T value{};

    bool ok() const { return status.ok(); }

    static LinkResult success(T v) {
        LinkResult r;
        r.value = v;
        return r;
    }
    static LinkResult failure(LinkStatus s) {
        LinkResult r;
        r.status = std::move(s);
        return r;
    }
};

// Opaque id of an open link. Zero is "no link".
struct LinkHandle {
    uint32_t id = 0;
    bool valid() const { return id != 0; }
    bool operator==(const LinkHandle& o) const { return id == o.id; }
    bool operator!=(const LinkHandle& o) const { return id != o.id; }
};

// Opaque id of a program running on the hub. Zero is "none".
struct ProgramHandle {
    uint32_t id = 0;
    uint32_t link_id = 0;
    bool valid() const { return id != 0; }
};

// Set from any thread, polled by adapters while they wait on the hub.
// An optional deadline makes the token fire on its own.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }

    void reset() {
        cancelled_.store(false);
        deadline_ns_.store(0);
    }

    void setDeadline(std::chrono::steady_clock::time_point deadline) {
        int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            deadline.time_since_epoch()).count();
        deadline_ns_.store(ns > 0 ? ns : 1);
    }

    bool isCancelled() const {
        if (cancelled_.load()) {
            return true;
        }
        int64_t deadline = deadline_ns_.load();
        if (deadline == 0) {
            return false;
        }
        auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
        return now >= deadline;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadline_ns_{0};   // steady_clock ns, 0 = none
};

// Contract the session manager consumes. Every call may block. Failures come
// back as LinkStatus, never as exceptions. Implementations are used from a
// single thread (the session thread); CancelToken is the exception.
class LinkAdapter {
public:
    virtual ~LinkAdapter() = default;

    // Blocks until connected and attached, or failed
    virtual LinkResult<LinkHandle> open(const DeviceDescriptor& device) = 0;

    // Starts a program that keeps running (listener). Returns once accepted.
    virtual LinkResult<ProgramHandle> installProgram(LinkHandle link,
                                                     const std::string& source) = 0;

    // Best-effort and idempotent
    virtual LinkStatus cancelProgram(ProgramHandle program) = 0;

    // Non-blocking. Ok while an installed program still runs; LinkFailure
    // carrying the hub's error line once it has ended.
    virtual LinkStatus checkProgram(ProgramHandle program) = 0;

    // Blocks until the bytes are handed to the transport
    virtual LinkStatus write(LinkHandle link, const Bytes& data) = 0;

    // Uploads and runs `source`, blocking until it ends on the hub or the
    // token is cancelled (Cancelled is returned after the program was stopped)
    virtual LinkStatus runProgramToCompletion(LinkHandle link,
                                              const std::string& source,
                                              const CancelToken& cancel) = 0;

    // Best-effort and idempotent
    virtual LinkStatus close(LinkHandle link) = 0;

    virtual const char* adapterName() const = 0;
};

// Timeouts and transport settings shared by link implementations
struct LinkConfig {
    int serial_baud = 115200;
    int open_timeout_ms = 5000;         // Connect + raw REPL handshake
    int program_ack_timeout_ms = 3000;  // Wait for "OK" after upload
    int cancel_timeout_ms = 2000;       // Drain after Ctrl-C
    int run_timeout_ms = 0;             // Discrete programs; 0 = no limit
    int poll_interval_ms = 50;          // CancelToken poll period
    int tcp_connect_timeout_ms = 3000;
    std::vector<std::string> tcp_endpoints;     // host:port entries offered by discovery
    bool simulator_enabled = false;
    int simulator_latency_ms = 5;       // Reply delay of the virtual hub
    double simulator_time_scale = 1.0;  // Multiplies program dwell on the virtual hub
};

std::unique_ptr<LinkAdapter> createLinkAdapter(const LinkConfig& config);

} // namespace link
} // namespace hubdrive
