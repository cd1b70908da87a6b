#include "transport/SPITransport.hpp"
#include "transport/SystemError.hpp"
#include "utils/Logger.hpp"

#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <vector>

namespace payload_hal {
namespace transport {

SPITransport::SPITransport(const Config& config)
    : TransportBase("SPI(" + config.device_path + ")", true)
    , config_(config)
    , fd_(-1) {
}

SPITransport::SPITransport()
    : SPITransport(Config{}) {
}

SPITransport::~SPITransport() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

HardwareResult<void> SPITransport::validateMode(uint8_t mode) {
    if (mode > MAX_MODE) {
        return HardwareError::invalidParameter("SPI mode must be 0-3, got " +
                                               std::to_string(mode));
    }
    return {};
}

HardwareResult<void> SPITransport::openDevice() {
    auto valid = validateMode(config_.mode);
    if (!valid) {
        return valid;
    }

    int fd = ::open(config_.device_path.c_str(), O_RDWR);
    if (fd < 0) {
        return errnoToHardwareError(errno, "open " + config_.device_path);
    }
    fd_ = fd;

    for (auto apply : {&SPITransport::applyMode, &SPITransport::applyBitsPerWord,
                       &SPITransport::applySpeed}) {
        auto applied = (this->*apply)();
        if (!applied) {
            ::close(fd_);
            fd_ = -1;
            return applied;
        }
    }

    LOG_DEBUG(name(), ": Opened mode ", static_cast<int>(config_.mode), ", ",
              config_.speed_hz, " Hz, ", static_cast<int>(config_.bits_per_word), " bits/word");
    return {};
}

HardwareResult<void> SPITransport::closeDevice() {
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

HardwareResult<void> SPITransport::applyMode() {
    uint8_t mode = config_.mode;
    if (::ioctl(fd_, SPI_IOC_WR_MODE, &mode) < 0) {
        return errnoToHardwareError(errno, "SPI_IOC_WR_MODE");
    }
    return {};
}

HardwareResult<void> SPITransport::applyBitsPerWord() {
    uint8_t bits = config_.bits_per_word;
    if (::ioctl(fd_, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
        return errnoToHardwareError(errno, "SPI_IOC_WR_BITS_PER_WORD");
    }
    return {};
}

HardwareResult<void> SPITransport::applySpeed() {
    uint32_t speed = config_.speed_hz;
    if (::ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        return errnoToHardwareError(errno, "SPI_IOC_WR_MAX_SPEED_HZ");
    }
    return {};
}

HardwareResult<void> SPITransport::setSpeed(uint32_t speed_hz) {
    if (speed_hz == 0) {
        return track<void>(HardwareError::invalidParameter("SPI speed must be non-zero"));
    }

    auto device = exclusiveDeviceLock();
    config_.speed_hz = speed_hz;
    if (fd_ < 0) {
        return {};
    }
    return track(applySpeed());
}

HardwareResult<void> SPITransport::setMode(uint8_t mode) {
    auto valid = validateMode(mode);
    if (!valid) {
        return track(valid);
    }

    auto device = exclusiveDeviceLock();
    config_.mode = mode;
    if (fd_ < 0) {
        return {};
    }
    return track(applyMode());
}

HardwareResult<void> SPITransport::setBitsPerWord(uint8_t bits_per_word) {
    if (bits_per_word == 0) {
        return track<void>(HardwareError::invalidParameter("bits per word must be non-zero"));
    }

    auto device = exclusiveDeviceLock();
    config_.bits_per_word = bits_per_word;
    if (fd_ < 0) {
        return {};
    }
    return track(applyBitsPerWord());
}

HardwareResult<size_t> SPITransport::transfer(const uint8_t* tx_data, size_t tx_size,
                                              uint8_t* rx_data, size_t rx_size,
                                              std::chrono::milliseconds /*timeout*/) {
    auto device = sharedDeviceLock();
    return transferFrame(tx_data, tx_size, rx_data, rx_size);
}

HardwareResult<size_t> SPITransport::transferFrame(const uint8_t* tx_data, size_t tx_size,
                                                   uint8_t* rx_data, size_t rx_size) {
    auto ready = checkTransfer(tx_size, rx_size);
    if (!ready) return ready.error();

    if (tx_size == 0) {
        return size_t{0};
    }

    struct spi_ioc_transfer xfer;
    std::memset(&xfer, 0, sizeof(xfer));
    xfer.tx_buf = reinterpret_cast<uintptr_t>(tx_data);
    xfer.rx_buf = reinterpret_cast<uintptr_t>(rx_data);
    xfer.len = static_cast<uint32_t>(tx_size);
    xfer.speed_hz = config_.speed_hz;
    xfer.bits_per_word = config_.bits_per_word;

    if (::ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer) < 0) {
        return track<size_t>(errnoToHardwareError(errno, "SPI_IOC_MESSAGE"));
    }

    LOG_TRACE(name(), ": Transferred ", rx_size, " bytes");
    return rx_size;
}

HardwareResult<size_t> SPITransport::read(uint8_t* data, size_t size,
                                          std::chrono::milliseconds /*timeout*/) {
    std::vector<uint8_t> zeros(size, 0x00);
    auto device = sharedDeviceLock();
    return transferFrame(zeros.data(), size, data, size);
}

HardwareResult<size_t> SPITransport::write(const uint8_t* data, size_t size) {
    std::vector<uint8_t> discard(size);
    auto device = sharedDeviceLock();
    return transferFrame(data, size, discard.data(), size);
}

} // namespace transport
} // namespace payload_hal
