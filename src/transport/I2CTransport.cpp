#include "transport/I2CTransport.hpp"
#include "transport/SystemError.hpp"
#include "utils/Logger.hpp"

#include <fcntl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <iomanip>
#include <sstream>

namespace payload_hal {
namespace transport {

namespace {

constexpr uint16_t MAX_7BIT_ADDRESS = 0x7F;
constexpr uint16_t MAX_10BIT_ADDRESS = 0x3FF;
constexpr size_t MAX_MESSAGE_LENGTH = 0xFFFF;  // i2c_msg::len is 16 bits

} // namespace

I2CTransport::I2CTransport(const Config& config)
    : TransportBase(describe(config), false)
    , config_(config)
    , fd_(-1) {
}

I2CTransport::I2CTransport()
    : I2CTransport(Config{}) {
}

I2CTransport::~I2CTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::string I2CTransport::devicePath() const {
    return "/dev/i2c-" + std::to_string(config_.bus_number);
}

std::string I2CTransport::describe(const Config& config) {
    std::ostringstream oss;
    oss << "I2C(/dev/i2c-" << static_cast<int>(config.bus_number)
        << "@0x" << std::hex << std::setw(2) << std::setfill('0') << config.device_address << ")";
    return oss.str();
}

HardwareResult<void> I2CTransport::validateAddress(uint16_t address, bool ten_bit) {
    const uint16_t limit = ten_bit ? MAX_10BIT_ADDRESS : MAX_7BIT_ADDRESS;
    if (address > limit) {
        std::ostringstream oss;
        oss << "I2C address 0x" << std::hex << address << " exceeds "
            << (ten_bit ? "10" : "7") << "-bit range";
        return HardwareError::invalidParameter(oss.str());
    }
    return {};
}

HardwareResult<void> I2CTransport::openDevice() {
    auto valid = validateAddress(config_.device_address, config_.ten_bit_address);
    if (!valid) {
        return valid;
    }

    const std::string path = devicePath();
    int fd = ::open(path.c_str(), O_RDWR);
    if (fd < 0) {
        return errnoToHardwareError(errno, "open " + path);
    }

    if (::ioctl(fd, I2C_TENBIT, config_.ten_bit_address ? 1UL : 0UL) < 0) {
        int err = errno;
        ::close(fd);
        return errnoToHardwareError(err, "I2C_TENBIT");
    }

    if (::ioctl(fd, I2C_SLAVE, static_cast<unsigned long>(config_.device_address)) < 0) {
        int err = errno;
        ::close(fd);
        return errnoToHardwareError(err, "I2C_SLAVE");
    }

    fd_ = fd;
    LOG_DEBUG(name(), ": Opened ", path);
    return {};
}

HardwareResult<void> I2CTransport::closeDevice() {
    if (fd_ < 0) {
        return {};
    }

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) {
        return errnoToHardwareError(errno, "close " + devicePath());
    }
    return {};
}

HardwareResult<void> I2CTransport::applyTimeout(std::chrono::milliseconds timeout) {
    // I2C_TIMEOUT is expressed in units of 10 ms
    const unsigned long ticks = static_cast<unsigned long>((timeout.count() + 9) / 10);
    if (::ioctl(fd_, I2C_TIMEOUT, ticks) < 0) {
        return errnoToHardwareError(errno, "I2C_TIMEOUT");
    }
    return {};
}

HardwareResult<size_t> I2CTransport::read(uint8_t* data, size_t size,
                                          std::chrono::milliseconds timeout) {
    auto device = sharedDeviceLock();
    auto ready = ensureInitialized();
    if (!ready) return ready.error();

    auto timed = track(applyTimeout(timeout));
    if (!timed) return timed.error();

    ssize_t count = ::read(fd_, data, size);
    if (count < 0) {
        return track<size_t>(errnoToHardwareError(errno, "read"));
    }

    LOG_TRACE(name(), ": Read ", count, " bytes");
    return static_cast<size_t>(count);
}

HardwareResult<size_t> I2CTransport::write(const uint8_t* data, size_t size) {
    auto device = sharedDeviceLock();
    auto ready = ensureInitialized();
    if (!ready) return ready.error();

    ssize_t count = ::write(fd_, data, size);
    if (count < 0) {
        return track<size_t>(errnoToHardwareError(errno, "write"));
    }

    LOG_TRACE(name(), ": Wrote ", count, " bytes");
    return static_cast<size_t>(count);
}

HardwareResult<size_t> I2CTransport::transfer(const uint8_t* tx_data, size_t tx_size,
                                              uint8_t* rx_data, size_t rx_size,
                                              std::chrono::milliseconds timeout) {
    auto device = sharedDeviceLock();
    auto ready = checkTransfer(tx_size, rx_size);
    if (!ready) return ready.error();

    if (tx_size > MAX_MESSAGE_LENGTH || rx_size > MAX_MESSAGE_LENGTH) {
        return track<size_t>(HardwareError::invalidParameter("I2C message longer than 65535 bytes"));
    }

    auto timed = track(applyTimeout(timeout));
    if (!timed) return timed.error();

    const uint16_t flags = config_.ten_bit_address ? I2C_M_TEN : 0;

    struct i2c_msg messages[2];
    uint32_t message_count = 0;

    if (tx_size > 0) {
        messages[message_count].addr = config_.device_address;
        messages[message_count].flags = flags;
        messages[message_count].len = static_cast<uint16_t>(tx_size);
        messages[message_count].buf = const_cast<uint8_t*>(tx_data);
        ++message_count;
    }

    if (rx_size > 0) {
        messages[message_count].addr = config_.device_address;
        messages[message_count].flags = static_cast<uint16_t>(flags | I2C_M_RD);
        messages[message_count].len = static_cast<uint16_t>(rx_size);
        messages[message_count].buf = rx_data;
        ++message_count;
    }

    if (message_count == 0) {
        return static_cast<size_t>(0);
    }

    struct i2c_rdwr_ioctl_data transaction;
    transaction.msgs = messages;
    transaction.nmsgs = message_count;

    if (::ioctl(fd_, I2C_RDWR, &transaction) < 0) {
        return track<size_t>(errnoToHardwareError(errno, "I2C_RDWR"));
    }

    LOG_TRACE(name(), ": Transferred ", tx_size, " out / ", rx_size, " in");
    return rx_size;
}

} // namespace transport
} // namespace payload_hal
