#include "transport/UARTTransport.hpp"
#include "transport/SystemError.hpp"
#include "utils/Logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>

namespace payload_hal {
namespace transport {

namespace {

std::optional<speed_t> baudToSpeed(uint32_t baud) {
    switch (baud) {
        case 1200U:   return B1200;
        case 2400U:   return B2400;
        case 4800U:   return B4800;
        case 9600U:   return B9600;
        case 19200U:  return B19200;
        case 38400U:  return B38400;
        case 57600U:  return B57600;
        case 115200U: return B115200;
        case 230400U: return B230400;
#ifdef B460800
        case 460800U: return B460800;
#endif
#ifdef B921600
        case 921600U: return B921600;
#endif
        default: return std::nullopt;
    }
}

} // namespace

UARTTransport::UARTTransport(const Config& config)
    : TransportBase("UART(" + config.device_path + ")", false)
    , config_(config)
    , fd_(-1) {
}

UARTTransport::UARTTransport()
    : UARTTransport(Config{}) {
}

UARTTransport::~UARTTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

HardwareResult<void> UARTTransport::openDevice() {
    int fd = ::open(config_.device_path.c_str(), O_RDWR | O_NOCTTY);
    if (fd < 0) {
        return errnoToHardwareError(errno, "open " + config_.device_path);
    }

    fd_ = fd;
    auto configured = configurePort();
    if (!configured) {
        ::close(fd_);
        fd_ = -1;
        return configured;
    }

    LOG_DEBUG(name(), ": Opened at ", config_.baud_rate, " baud, ",
              static_cast<int>(config_.data_bits), parityToString(config_.parity),
              static_cast<int>(config_.stop_bits), ", flow ", flowControlToString(config_.flow_control));
    return {};
}

HardwareResult<void> UARTTransport::closeDevice() {
    if (fd_ < 0) {
        return {};
    }

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) {
        return errnoToHardwareError(errno, "close " + config_.device_path);
    }
    return {};
}

HardwareResult<void> UARTTransport::configurePort() {
    auto speed = baudToSpeed(config_.baud_rate);
    if (!speed) {
        return HardwareError::invalidParameter("unsupported baud rate " +
                                               std::to_string(config_.baud_rate));
    }

    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));
    if (::tcgetattr(fd_, &tio) != 0) {
        return errnoToHardwareError(errno, "tcgetattr");
    }

    // Raw mode
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR |
                                           IGNCR | ICRNL | IXON | IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (config_.data_bits) {
        case 5: tio.c_cflag |= CS5; break;
        case 6: tio.c_cflag |= CS6; break;
        case 7: tio.c_cflag |= CS7; break;
        case 8: tio.c_cflag |= CS8; break;
        default:
            return HardwareError::invalidParameter("data bits must be 5-8, got " +
                                                   std::to_string(config_.data_bits));
    }

    switch (config_.stop_bits) {
        case 1: break;
        case 2: tio.c_cflag |= CSTOPB; break;
        default:
            return HardwareError::invalidParameter("stop bits must be 1 or 2, got " +
                                                   std::to_string(config_.stop_bits));
    }

    switch (config_.parity) {
        case Parity::ODD:  tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD); break;
        case Parity::EVEN: tio.c_cflag |= PARENB; break;
        case Parity::NONE: break;
    }

    switch (config_.flow_control) {
        case FlowControl::HARDWARE: tio.c_cflag |= CRTSCTS; break;
        case FlowControl::SOFTWARE: tio.c_iflag |= static_cast<tcflag_t>(IXON | IXOFF); break;
        case FlowControl::NONE: break;
    }

    // Reads are paced by poll(), the tty itself never blocks
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    ::cfsetispeed(&tio, *speed);
    ::cfsetospeed(&tio, *speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        return errnoToHardwareError(errno, "tcsetattr");
    }

    if (::tcflush(fd_, TCIOFLUSH) != 0) {
        return errnoToHardwareError(errno, "tcflush");
    }
    return {};
}

HardwareResult<void> UARTTransport::setBaudRate(uint32_t baud_rate) {
    if (!baudToSpeed(baud_rate)) {
        return track<void>(HardwareError::invalidParameter("unsupported baud rate " +
                                                           std::to_string(baud_rate)));
    }

    auto device = exclusiveDeviceLock();
    config_.baud_rate = baud_rate;
    if (fd_ < 0) {
        return {};
    }
    return track(configurePort());
}

HardwareResult<size_t> UARTTransport::read(uint8_t* data, size_t size,
                                           std::chrono::milliseconds timeout) {
    auto device = sharedDeviceLock();
    auto ready = ensureInitialized();
    if (!ready) return ready.error();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t received = 0;

    while (received < size) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd descriptor;
        descriptor.fd = fd_;
        descriptor.events = POLLIN;
        descriptor.revents = 0;

        int ready_count = ::poll(&descriptor, 1, static_cast<int>(remaining.count()));
        if (ready_count < 0) {
            if (errno == EINTR) continue;
            return track<size_t>(errnoToHardwareError(errno, "poll"));
        }
        if (ready_count == 0) {
            break;
        }

        ssize_t count = ::read(fd_, data + received, size - received);
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return track<size_t>(errnoToHardwareError(errno, "read"));
        }
        received += static_cast<size_t>(count);
    }

    if (received == 0 && size > 0) {
        return track<size_t>(HardwareError::timeout());
    }

    if (received < size) {
        recordWarning("short read: " + std::to_string(received) + " of " +
                      std::to_string(size) + " bytes");
    }

    LOG_TRACE(name(), ": Read ", received, " bytes");
    return received;
}

HardwareResult<size_t> UARTTransport::write(const uint8_t* data, size_t size) {
    auto device = sharedDeviceLock();
    auto ready = ensureInitialized();
    if (!ready) return ready.error();

    size_t written = 0;
    while (written < size) {
        ssize_t count = ::write(fd_, data + written, size - written);
        if (count < 0) {
            if (errno == EINTR) continue;
            return track<size_t>(errnoToHardwareError(errno, "write"));
        }
        written += static_cast<size_t>(count);
    }

    if (::tcdrain(fd_) != 0) {
        return track<size_t>(errnoToHardwareError(errno, "tcdrain"));
    }

    LOG_TRACE(name(), ": Wrote ", written, " bytes");
    return written;
}

const char* parityToString(Parity parity) {
    switch (parity) {
        case Parity::NONE: return "N";
        case Parity::ODD:  return "O";
        case Parity::EVEN: return "E";
        default: return "?";
    }
}

const char* flowControlToString(FlowControl flow_control) {
    switch (flow_control) {
        case FlowControl::NONE:     return "none";
        case FlowControl::HARDWARE: return "rts/cts";
        case FlowControl::SOFTWARE: return "xon/xoff";
        default: return "?";
    }
}

} // namespace transport
} // namespace payload_hal
