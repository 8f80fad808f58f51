#include "link_adapter.hpp"
#include "repl_link.hpp"
#include "stream_transport.hpp"

namespace hubdrive {
namespace link {

const char* linkErrorKindToString(LinkErrorKind kind) {
    switch (kind) {
        case LinkErrorKind::None:             return "ok";
        case LinkErrorKind::BenignDisconnect: return "disconnected";
        case LinkErrorKind::LinkFailure:      return "failure";
        case LinkErrorKind::Cancelled:        return "cancelled";
        case LinkErrorKind::Timeout:          return "timeout";
        default:                              return "unknown";
    }
}

const char* ioStatusToString(IoResult::Status status) {
    switch (status) {
        case IoResult::Status::Ok:      return "ok";
        case IoResult::Status::Timeout: return "timeout";
        case IoResult::Status::Closed:  return "closed";
        case IoResult::Status::Error:   return "error";
        default:                        return "unknown";
    }
}

// Factory function
std::unique_ptr<LinkAdapter> createLinkAdapter(const LinkConfig& config) {
    return std::make_unique<ReplLinkAdapter>(config, ReplLinkAdapter::defaultTransportFactory(config));
}

} // namespace link
} // namespace hubdrive
