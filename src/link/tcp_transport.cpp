#include "tcp_transport.hpp"
#include "hubdrive/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hubdrive {
namespace link {

namespace {

bool isPeerGone(int err) {
    return err == EPIPE || err == ECONNRESET || err == ENOTCONN || err == ECONNABORTED;
}

// connect() with a deadline: non-blocking connect, then poll for writability
bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t addr_len,
                        int timeout_ms, int& err) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int ret = ::connect(fd, addr, addr_len);
    if (ret != 0 && errno != EINPROGRESS) {
        err = errno;
        return false;
    }

    if (ret != 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready <= 0) {
            err = (ready == 0) ? ETIMEDOUT : errno;
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            err = so_error;
            return false;
        }
    }

    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return true;
}

} // namespace

TcpTransport::TcpTransport(const std::string& host, int port)
    : host_(host), port_(port) {}

TcpTransport::~TcpTransport() {
    close();
}

bool TcpTransport::splitEndpoint(const std::string& endpoint, std::string& host, int& port) {
    size_t colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= endpoint.size()) {
        return false;
    }

    std::string port_str = endpoint.substr(colon + 1);
    char* end = nullptr;
    long value = std::strtol(port_str.c_str(), &end, 10);
    if (end == port_str.c_str() || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }

    host = endpoint.substr(0, colon);
    port = static_cast<int>(value);
    return true;
}

bool TcpTransport::open(int timeout_ms) {
    if (host_.empty()) {
        last_error_ = "No host configured";
        return false;
    }

    if (isOpen()) {
        return true;
    }

    struct addrinfo hints{};
    struct addrinfo* result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port_str = std::to_string(port_);
    int ret = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0 || result == nullptr) {
        last_error_ = "Failed to resolve host: " + host_;
        LOG_LINK(ERROR, "%s (%s)", last_error_.c_str(), gai_strerror(ret));
        return false;
    }

    socket_fd_ = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (socket_fd_ < 0) {
        last_error_ = "Failed to create socket";
        freeaddrinfo(result);
        return false;
    }

    int err = 0;
    bool connected = connectWithTimeout(socket_fd_, result->ai_addr,
                                        static_cast<socklen_t>(result->ai_addrlen),
                                        timeout_ms, err);
    freeaddrinfo(result);

    if (!connected) {
        last_error_ = "Failed to connect to " + host_ + ":" + std::to_string(port_) +
                      " (" + std::strerror(err) + ")";
        LOG_LINK(ERROR, "%s", last_error_.c_str());
        close();
        return false;
    }

    // Tokens are single bytes; send them immediately
    int one = 1;
    setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    LOG_LINK(INFO, "Connected to %s:%d", host_.c_str(), port_);
    last_error_.clear();
    return true;
}

void TcpTransport::close() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        LOG_LINK(DEBUG, "Disconnected from %s:%d", host_.c_str(), port_);
    }
}

IoResult TcpTransport::writeAll(const uint8_t* data, size_t len) {
    if (!isOpen()) {
        return IoResult::closed("Not connected");
    }

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            last_error_ = std::string("Send failed (") + std::strerror(err) + ")";
            if (isPeerGone(err)) {
                return IoResult::closed(last_error_);
            }
            return IoResult::error(last_error_);
        }
        sent += static_cast<size_t>(n);
    }
    return IoResult::success(sent);
}

IoResult TcpTransport::readSome(uint8_t* buffer, size_t len, int timeout_ms) {
    if (!isOpen()) {
        return IoResult::closed("Not connected");
    }

    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, timeout_ms);

    if (ready < 0) {
        if (errno == EINTR) {
            return IoResult::timeout();
        }
        last_error_ = std::string("Poll failed (") + std::strerror(errno) + ")";
        return IoResult::error(last_error_);
    }
    if (ready == 0) {
        return IoResult::timeout();
    }

    ssize_t n = ::recv(socket_fd_, buffer, len, 0);
    if (n == 0) {
        last_error_ = "Connection closed by peer";
        return IoResult::closed(last_error_);
    }
    if (n < 0) {
        int err = errno;
        if (err == EINTR || err == EAGAIN) {
            return IoResult::timeout();
        }
        last_error_ = std::string("Receive failed (") + std::strerror(err) + ")";
        if (isPeerGone(err)) {
            return IoResult::closed(last_error_);
        }
        return IoResult::error(last_error_);
    }
    return IoResult::success(static_cast<size_t>(n));
}

std::string TcpTransport::describe() const {
    return "tcp " + host_ + ":" + std::to_string(port_);
}

} // namespace link
} // namespace hubdrive
