#pragma once

#include "transport/TransportBase.hpp"
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief SPI master transport over Linux spidev
 *
 * SPI is full duplex: every transfer clocks tx and rx simultaneously, so
 * transfer() requires equal buffer lengths. read() clocks out zeros and
 * write() discards what comes back.
 */
class SPITransport final : public TransportBase, public IBidirectional {
public:
    static constexpr uint8_t MAX_MODE = 3;

    struct Config {
        std::string device_path = "/dev/spidev0.0";
        uint8_t mode = 0;
        uint32_t speed_hz = 1000000;
        uint8_t bits_per_word = 8;
        InterfaceParams params;
    };

    explicit SPITransport(const Config& config);
    SPITransport();
    ~SPITransport() override;

    SPITransport(const SPITransport&) = delete;
    SPITransport& operator=(const SPITransport&) = delete;

    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;
    HardwareResult<size_t> transfer(const uint8_t* tx_data, size_t tx_size,
                                    uint8_t* rx_data, size_t rx_size,
                                    std::chrono::milliseconds timeout) override;

    uint32_t getSpeed() const { return config_.speed_hz; }
    uint8_t getMode() const { return config_.mode; }
    uint8_t getBitsPerWord() const { return config_.bits_per_word; }

    /**
     * @brief Reconfigure the bus; applied immediately when the device is open
     */
    HardwareResult<void> setSpeed(uint32_t speed_hz);
    HardwareResult<void> setMode(uint8_t mode);
    HardwareResult<void> setBitsPerWord(uint8_t bits_per_word);

    const Config& getConfig() const { return config_; }

    static HardwareResult<void> validateMode(uint8_t mode);

protected:
    HardwareResult<void> openDevice() override;
    HardwareResult<void> closeDevice() override;

private:
    HardwareResult<void> applyMode();
    HardwareResult<void> applyBitsPerWord();
    HardwareResult<void> applySpeed();

    // Caller holds the shared device lock
    HardwareResult<size_t> transferFrame(const uint8_t* tx_data, size_t tx_size,
                                         uint8_t* rx_data, size_t rx_size);

    Config config_;
    int fd_;
};

} // namespace transport
} // namespace payload_hal
