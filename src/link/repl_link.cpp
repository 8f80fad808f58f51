#include "repl_link.hpp"
#include "serial_transport.hpp"
#include "sim_hub.hpp"
#include "tcp_transport.hpp"
#include "hubdrive/logging.hpp"

#include <algorithm>
#include <chrono>

namespace hubdrive {
namespace link {

namespace {

const char* RAW_PROMPT = "raw REPL; CTRL-B to exit\r\n>";
const char* EXEC_ACK = "OK";
const char* SECTION_END = "\x04";
const char* PROGRAM_END = "\x04>";

// Last non-blank line of a traceback, e.g. "OSError: [Errno 19] ENODEV"
std::string lastLine(const std::string& text) {
    std::string line;
    size_t end = text.size();
    while (end > 0) {
        size_t start = text.find_last_of("\r\n", end - 1);
        size_t from = (start == std::string::npos) ? 0 : start + 1;
        line = text.substr(from, end - from);
        if (line.find_first_not_of(" \t") != std::string::npos) {
            return line;
        }
        if (start == std::string::npos) {
            break;
        }
        end = start;
    }
    return text;
}

} // namespace

ReplLinkAdapter::ReplLinkAdapter(const LinkConfig& config, TransportFactory factory)
    : config_(config), factory_(std::move(factory)) {}

ReplLinkAdapter::~ReplLinkAdapter() {
    if (transport_) {
        LinkStatus s = close(link_);
        if (!s.ok()) {
            LOG_LINK(DEBUG, "Close on destruction: %s", s.message.c_str());
        }
    }
}

TransportFactory ReplLinkAdapter::defaultTransportFactory(const LinkConfig& config) {
    SimHubOptions sim_options;
    sim_options.reply_latency_ms = config.simulator_latency_ms;
    sim_options.time_scale = config.simulator_time_scale;
    // One virtual hub per adapter so it keeps its state across reconnects
    auto sim = std::make_shared<SimulatedHub>(sim_options);

    return [config, sim](const DeviceDescriptor& device) -> std::unique_ptr<StreamTransport> {
        switch (device.transport) {
            case DeviceTransport::Serial:
                return std::make_unique<SerialTransport>(device.address, config.serial_baud);
            case DeviceTransport::Tcp: {
                std::string host;
                int port = 0;
                if (!TcpTransport::splitEndpoint(device.address, host, port)) {
                    return nullptr;
                }
                return std::make_unique<TcpTransport>(host, port);
            }
            case DeviceTransport::Simulated:
                return std::make_unique<SimulatedHubTransport>(sim);
            default:
                return nullptr;
        }
    };
}

LinkResult<LinkHandle> ReplLinkAdapter::open(const DeviceDescriptor& device) {
    if (transport_) {
        // At most one link: drop the previous one first
        LinkStatus s = close(link_);
        if (!s.ok()) {
            LOG_LINK(WARN, "Closing previous link: %s", s.message.c_str());
        }
    }

    transport_ = factory_ ? factory_(device) : nullptr;
    if (!transport_) {
        return LinkResult<LinkHandle>::failure(LinkStatus::failure(
            LinkErrorKind::LinkFailure, "Unsupported device address '" + device.address + "'"));
    }

    int connect_timeout_ms = (device.transport == DeviceTransport::Tcp)
                                 ? config_.tcp_connect_timeout_ms
                                 : config_.open_timeout_ms;
    LOG_LINK(INFO, "Opening %s", transport_->describe().c_str());
    if (!transport_->open(connect_timeout_ms)) {
        std::string msg = transport_->lastError();
        transport_.reset();
        return LinkResult<LinkHandle>::failure(
            LinkStatus::failure(LinkErrorKind::LinkFailure, msg.empty() ? "Open failed" : msg));
    }

    rx_.clear();

    // Stop whatever the hub is running, then switch to the raw REPL
    LinkStatus s = send("\r\x03\x03", "interrupt");
    if (s.ok()) {
        s = send("\x01", "enter raw REPL");
    }
    if (s.ok()) {
        s = readUntil(RAW_PROMPT, config_.open_timeout_ms, nullptr, nullptr);
    }

    if (!s.ok()) {
        std::string where = transport_->describe();
        transport_->close();
        transport_.reset();
        rx_.clear();
        if (s.kind == LinkErrorKind::Timeout) {
            s = LinkStatus::failure(LinkErrorKind::LinkFailure,
                                    "No raw REPL prompt from " + where);
        }
        LOG_LINK(ERROR, "Open failed: %s", s.message.c_str());
        return LinkResult<LinkHandle>::failure(s);
    }

    link_.id = next_link_id_++;
    program_ = ProgramHandle{};
    program_running_ = false;
    LOG_LINK(INFO, "Raw REPL ready on %s (link %u)", transport_->describe().c_str(), link_.id);
    return LinkResult<LinkHandle>::success(link_);
}

LinkResult<ProgramHandle> ReplLinkAdapter::installProgram(LinkHandle link, const std::string& source) {
    LinkStatus s = checkLink(link);
    if (!s.ok()) {
        return LinkResult<ProgramHandle>::failure(s);
    }

    if (program_running_) {
        LinkStatus is = interruptProgram();
        if (!is.ok()) {
            LOG_LINK(WARN, "Stopping previous program: %s", is.message.c_str());
        }
    }

    s = uploadAndStart(source);
    if (!s.ok()) {
        return LinkResult<ProgramHandle>::failure(s);
    }

    program_.id = next_program_id_++;
    program_.link_id = link_.id;
    program_running_ = true;
    LOG_LINK(DEBUG, "Program %u installed (%zu bytes)", program_.id, source.size());
    return LinkResult<ProgramHandle>::success(program_);
}

LinkStatus ReplLinkAdapter::cancelProgram(ProgramHandle program) {
    if (!program.valid() || !program_running_ || program.id != program_.id || !transport_) {
        return LinkStatus::success();
    }
    LOG_LINK(DEBUG, "Cancelling program %u", program.id);
    return interruptProgram();
}

LinkStatus ReplLinkAdapter::checkProgram(ProgramHandle program) {
    if (!transport_ || !program.valid() || program.id != program_.id) {
        return LinkStatus::failure(LinkErrorKind::LinkFailure, "Program is not loaded");
    }
    if (!program_running_) {
        return LinkStatus::failure(LinkErrorKind::LinkFailure, "Program has ended");
    }

    // Pick up whatever the hub has sent without waiting
    uint8_t buffer[256];
    while (true) {
        IoResult io = transport_->readSome(buffer, sizeof(buffer), 0);
        if (io.status == IoResult::Status::Timeout) {
            break;
        }
        if (!io.ok()) {
            return statusFromIo(io, "Read");
        }
        rx_.append(reinterpret_cast<const char*>(buffer), io.bytes);
        if (io.bytes < sizeof(buffer)) {
            break;
        }
    }

    if (rx_.find(SECTION_END) == std::string::npos) {
        return LinkStatus::success();
    }
    return collectProgramEnd();
}

// The running program printed its end marker: read the rest of
// "stdout \x04 stderr \x04>" and report why it stopped.
LinkStatus ReplLinkAdapter::collectProgramEnd() {
    program_running_ = false;

    std::string out;
    std::string err;
    LinkStatus s = readUntil(SECTION_END, config_.cancel_timeout_ms, &out, nullptr);
    if (s.ok()) {
        s = readUntil(PROGRAM_END, config_.cancel_timeout_ms, &err, nullptr);
    }
    if (!s.ok()) {
        return s;
    }

    if (!out.empty()) {
        LOG_LINK(DEBUG, "Program output: %s", out.c_str());
    }
    if (!err.empty()) {
        LOG_LINK(WARN, "Program %u ended with an error: %s", program_.id, err.c_str());
        return LinkStatus::failure(LinkErrorKind::LinkFailure, lastLine(err));
    }
    LOG_LINK(WARN, "Program %u ended", program_.id);
    return LinkStatus::failure(LinkErrorKind::LinkFailure, "Program ended on the hub");
}

LinkStatus ReplLinkAdapter::write(LinkHandle link, const Bytes& data) {
    LinkStatus s = checkLink(link);
    if (!s.ok()) {
        return s;
    }

    IoResult io = transport_->writeAll(data.data(), data.size());
    if (!io.ok()) {
        return statusFromIo(io, "Write");
    }
    LOG_LINK(TRACE, "Wrote %zu bytes", data.size());
    return LinkStatus::success();
}

LinkStatus ReplLinkAdapter::runProgramToCompletion(LinkHandle link, const std::string& source,
                                                   const CancelToken& cancel) {
    LinkStatus s = checkLink(link);
    if (!s.ok()) {
        return s;
    }
    if (cancel.isCancelled()) {
        return LinkStatus::failure(LinkErrorKind::Cancelled, "Cancelled before upload");
    }

    if (program_running_) {
        LinkStatus is = interruptProgram();
        if (!is.ok()) {
            LOG_LINK(WARN, "Stopping previous program: %s", is.message.c_str());
        }
    }

    s = uploadAndStart(source);
    if (!s.ok()) {
        return s;
    }
    program_.id = next_program_id_++;
    program_.link_id = link_.id;
    program_running_ = true;

    std::string out;
    std::string err;
    s = readUntil(SECTION_END, config_.run_timeout_ms, &out, &cancel);
    if (s.ok()) {
        s = readUntil(PROGRAM_END, config_.run_timeout_ms, &err, &cancel);
    }

    if (s.kind == LinkErrorKind::Cancelled || s.kind == LinkErrorKind::Timeout) {
        LinkStatus is = interruptProgram();
        if (!is.ok()) {
            LOG_LINK(WARN, "Interrupting program %u: %s", program_.id, is.message.c_str());
        }
        return s;
    }

    program_running_ = false;
    if (!s.ok()) {
        return s;
    }

    if (!out.empty()) {
        LOG_LINK(DEBUG, "Program output: %s", out.c_str());
    }
    if (!err.empty()) {
        LOG_LINK(DEBUG, "Program stderr: %s", err.c_str());
        return LinkStatus::failure(LinkErrorKind::LinkFailure, lastLine(err));
    }
    return LinkStatus::success();
}

LinkStatus ReplLinkAdapter::close(LinkHandle link) {
    if (!transport_) {
        return LinkStatus::success();
    }
    if (link.valid() && link != link_) {
        // Stale handle from an earlier link
        return LinkStatus::success();
    }

    LinkStatus s = send("\x02", "leave raw REPL");
    transport_->close();
    transport_.reset();
    rx_.clear();
    LOG_LINK(INFO, "Link %u closed", link_.id);
    link_ = LinkHandle{};
    program_ = ProgramHandle{};
    program_running_ = false;
    return s;
}

// ============================================================================
// Helpers
// ============================================================================

LinkStatus ReplLinkAdapter::checkLink(LinkHandle link) const {
    if (!transport_ || !link.valid() || link != link_) {
        return LinkStatus::failure(LinkErrorKind::LinkFailure, "Link is not open");
    }
    return LinkStatus::success();
}

LinkStatus ReplLinkAdapter::send(const std::string& bytes, const char* what) {
    if (!transport_) {
        return LinkStatus::failure(LinkErrorKind::LinkFailure, "Link is not open");
    }
    IoResult io = transport_->writeAll(bytes);
    if (!io.ok()) {
        return statusFromIo(io, what);
    }
    return LinkStatus::success();
}

LinkStatus ReplLinkAdapter::statusFromIo(const IoResult& io, const char* what) const {
    switch (io.status) {
        case IoResult::Status::Ok:
            return LinkStatus::success();
        case IoResult::Status::Closed:
            return LinkStatus::failure(LinkErrorKind::BenignDisconnect,
                                       io.message.empty() ? "Hub closed the link" : io.message);
        case IoResult::Status::Timeout:
            return LinkStatus::failure(LinkErrorKind::Timeout, std::string(what) + " timed out");
        case IoResult::Status::Error:
        default:
            return LinkStatus::failure(LinkErrorKind::LinkFailure,
                                       std::string(what) + ": " + io.message);
    }
}

LinkStatus ReplLinkAdapter::readUntil(const std::string& marker, int timeout_ms,
                                      std::string* out, const CancelToken* cancel) {
    auto start = std::chrono::steady_clock::now();
    int poll_ms = config_.poll_interval_ms > 0 ? config_.poll_interval_ms : 50;
    uint8_t buffer[256];

    while (true) {
        size_t pos = rx_.find(marker);
        if (pos != std::string::npos) {
            if (out) {
                out->append(rx_, 0, pos);
            }
            rx_.erase(0, pos + marker.size());
            return LinkStatus::success();
        }

        if (cancel && cancel->isCancelled()) {
            return LinkStatus::failure(LinkErrorKind::Cancelled, "Cancelled");
        }

        int wait_ms = poll_ms;
        if (timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            int remaining = timeout_ms - static_cast<int>(elapsed);
            if (remaining <= 0) {
                return LinkStatus::failure(LinkErrorKind::Timeout, "Timed out waiting for the hub");
            }
            wait_ms = std::min(wait_ms, remaining);
        }

        IoResult io = transport_->readSome(buffer, sizeof(buffer), wait_ms);
        if (io.ok()) {
            rx_.append(reinterpret_cast<const char*>(buffer), io.bytes);
        } else if (io.status != IoResult::Status::Timeout) {
            return statusFromIo(io, "Read");
        }
    }
}

LinkStatus ReplLinkAdapter::interruptProgram() {
    program_running_ = false;
    LinkStatus s = send("\x03", "interrupt");
    if (!s.ok()) {
        return s;
    }
    return readUntil(PROGRAM_END, config_.cancel_timeout_ms, nullptr, nullptr);
}

LinkStatus ReplLinkAdapter::uploadAndStart(const std::string& source) {
    LinkStatus s = send(source + "\x04", "upload");
    if (!s.ok()) {
        return s;
    }
    s = readUntil(EXEC_ACK, config_.program_ack_timeout_ms, nullptr, nullptr);
    if (s.kind == LinkErrorKind::Timeout) {
        return LinkStatus::failure(LinkErrorKind::LinkFailure, "Hub did not accept the program");
    }
    return s;
}

} // namespace link
} // namespace hubdrive
