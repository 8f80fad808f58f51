#pragma once

#include "link_adapter.hpp"
#include "stream_transport.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hubdrive {
namespace link {

// Builds the transport for a device. Returns nullptr for devices it cannot reach.
using TransportFactory =
    std::function<std::unique_ptr<StreamTransport>(const DeviceDescriptor& device)>;

// LinkAdapter speaking MicroPython's raw REPL over a StreamTransport.
//
//   enter raw   \x01        -> "raw REPL; CTRL-B to exit\r\n>"
//   execute     source \x04 -> "OK" <stdout> \x04 <stderr> \x04 ">"
//   interrupt   \x03
//   leave raw   \x02
//
// A resident listener is a program whose execution never completes; it reads
// the bytes passed to write() from its stdin.
class ReplLinkAdapter : public LinkAdapter {
public:
    ReplLinkAdapter(const LinkConfig& config, TransportFactory factory);
    ~ReplLinkAdapter() override;

    // Non-copyable
    ReplLinkAdapter(const ReplLinkAdapter&) = delete;
    ReplLinkAdapter& operator=(const ReplLinkAdapter&) = delete;

    LinkResult<LinkHandle> open(const DeviceDescriptor& device) override;
    LinkResult<ProgramHandle> installProgram(LinkHandle link, const std::string& source) override;
    LinkStatus cancelProgram(ProgramHandle program) override;
    LinkStatus checkProgram(ProgramHandle program) override;
    LinkStatus write(LinkHandle link, const Bytes& data) override;
    LinkStatus runProgramToCompletion(LinkHandle link, const std::string& source,
                                      const CancelToken& cancel) override;
    LinkStatus close(LinkHandle link) override;
    const char* adapterName() const override { return "raw-repl"; }

    // Default factory: serial ports, host:port endpoints, the simulated hub
    static TransportFactory defaultTransportFactory(const LinkConfig& config);

private:
    LinkStatus checkLink(LinkHandle link) const;
    LinkStatus collectProgramEnd();
    LinkStatus send(const std::string& bytes, const char* what);
    LinkStatus statusFromIo(const IoResult& io, const char* what) const;

    // Reads until `marker` arrives. Text before the marker goes to `out`.
    // timeout_ms <= 0 waits forever (still honouring `cancel`).
    LinkStatus readUntil(const std::string& marker, int timeout_ms,
                         std::string* out, const CancelToken* cancel);

    // Ctrl-C and drain to the end-of-program marker
    LinkStatus interruptProgram();

    LinkStatus uploadAndStart(const std::string& source);

    LinkConfig config_;
    TransportFactory factory_;
    std::unique_ptr<StreamTransport> transport_;
    std::string rx_;

    LinkHandle link_;
    ProgramHandle program_;
    bool program_running_ = false;
    uint32_t next_link_id_ = 1;
    uint32_t next_program_id_ = 1;
};

} // namespace link
} // namespace hubdrive
