#pragma once

#include "transport/TransportBase.hpp"
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief I2C master transport over Linux i2c-dev (/dev/i2c-N)
 *
 * transfer() issues one combined write/read transaction with a repeated
 * start, so tx and rx lengths are independent.
 */
class I2CTransport final : public TransportBase, public IBidirectional {
public:
    struct Config {
        uint8_t bus_number = 1;
        uint16_t device_address = 0x50;
        bool ten_bit_address = false;
        uint32_t clock_speed = 100000;  // Hz, informational: set by the adapter driver
        InterfaceParams params;
    };

    explicit I2CTransport(const Config& config);
    I2CTransport();
    ~I2CTransport() override;

    I2CTransport(const I2CTransport&) = delete;
    I2CTransport& operator=(const I2CTransport&) = delete;

    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;
    HardwareResult<size_t> transfer(const uint8_t* tx_data, size_t tx_size,
                                    uint8_t* rx_data, size_t rx_size,
                                    std::chrono::milliseconds timeout) override;

    std::string devicePath() const;
    const Config& getConfig() const { return config_; }

    /**
     * @brief Validate an address against the configured addressing mode
     */
    static HardwareResult<void> validateAddress(uint16_t address, bool ten_bit);

    static std::string describe(const Config& config);

protected:
    HardwareResult<void> openDevice() override;
    HardwareResult<void> closeDevice() override;

private:
    HardwareResult<void> applyTimeout(std::chrono::milliseconds timeout);

    Config config_;
    int fd_;
};

} // namespace transport
} // namespace payload_hal
