#include "serial_transport.hpp"
#include "hubdrive/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace hubdrive {
namespace link {

namespace {

speed_t baudToSpeed(int baud_rate) {
    switch (baud_rate) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        case 921600: return B921600;
        default: return B115200;
    }
}

// The errors a tty reports when the device vanished or hung up
bool isHangup(int err) {
    return err == EIO || err == ENXIO || err == ENODEV || err == EPIPE;
}

} // namespace

SerialTransport::SerialTransport(const std::string& port_name, int baud_rate)
    : port_name_(port_name), baud_rate_(baud_rate > 0 ? baud_rate : 115200) {}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::open(int /*timeout_ms*/) {
    if (port_name_.empty()) {
        last_error_ = "No serial port configured";
        return false;
    }

    if (isOpen()) {
        return true;
    }

    fd_ = ::open(port_name_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        last_error_ = "Failed to open serial port " + port_name_ + " (" + std::strerror(errno) + ")";
        LOG_LINK(ERROR, "%s", last_error_.c_str());
        return false;
    }

    termios tio{};
    if (tcgetattr(fd_, &tio) != 0) {
        last_error_ = "tcgetattr failed on " + port_name_ + " (" + std::strerror(errno) + ")";
        LOG_LINK(ERROR, "%s", last_error_.c_str());
        close();
        return false;
    }

    cfmakeraw(&tio);
    speed_t speed = baudToSpeed(baud_rate_);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        last_error_ = "tcsetattr failed on " + port_name_ + " (" + std::strerror(errno) + ")";
        LOG_LINK(ERROR, "%s", last_error_.c_str());
        close();
        return false;
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK);
    }
    tcflush(fd_, TCIOFLUSH);

    LOG_LINK(INFO, "Opened serial port '%s' @ %d", port_name_.c_str(), baud_rate_);
    last_error_.clear();
    return true;
}

void SerialTransport::close() {
    if (!isOpen()) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
    LOG_LINK(DEBUG, "Closed serial port '%s'", port_name_.c_str());
}

IoResult SerialTransport::writeAll(const uint8_t* data, size_t len) {
    if (!isOpen()) {
        return IoResult::closed("Serial port not open");
    }

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::write(fd_, data + sent, len - sent);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            int err = errno;
            last_error_ = std::string("Serial write failed (") + std::strerror(err) + ")";
            if (isHangup(err)) {
                return IoResult::closed(last_error_);
            }
            return IoResult::error(last_error_);
        }
        sent += static_cast<size_t>(n);
    }
    tcdrain(fd_);
    return IoResult::success(sent);
}

IoResult SerialTransport::readSome(uint8_t* buffer, size_t len, int timeout_ms) {
    if (!isOpen()) {
        return IoResult::closed("Serial port not open");
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) {
            return IoResult::timeout();
        }
        last_error_ = std::string("Serial poll failed (") + std::strerror(errno) + ")";
        return IoResult::error(last_error_);
    }
    if (ready == 0) {
        return IoResult::timeout();
    }
    if ((pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) && !(pfd.revents & POLLIN)) {
        last_error_ = "Serial device hung up";
        return IoResult::closed(last_error_);
    }

    ssize_t n = ::read(fd_, buffer, len);
    if (n < 0) {
        int err = errno;
        if (err == EINTR || err == EAGAIN) {
            return IoResult::timeout();
        }
        last_error_ = std::string("Serial read failed (") + std::strerror(err) + ")";
        if (isHangup(err)) {
            return IoResult::closed(last_error_);
        }
        return IoResult::error(last_error_);
    }
    if (n == 0) {
        // Readable with no data: the device is gone
        last_error_ = "Serial device closed";
        return IoResult::closed(last_error_);
    }
    return IoResult::success(static_cast<size_t>(n));
}

std::string SerialTransport::describe() const {
    return "serial " + port_name_ + " @ " + std::to_string(baud_rate_);
}

} // namespace link
} // namespace hubdrive
