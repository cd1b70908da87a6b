#pragma once

#include "transport/TransportBase.hpp"
#include <string>

namespace payload_hal {
namespace transport {

enum class Parity {
    NONE,
    ODD,
    EVEN
};

enum class FlowControl {
    NONE,
    HARDWARE,   // RTS/CTS
    SOFTWARE    // XON/XOFF
};

/**
 * @brief Serial transport over a termios tty in raw mode
 *
 * Parity and flow control only change the line framing; the capability
 * contract is the same as any other Readable + Writable transport.
 */
class UARTTransport final : public TransportBase, public IReadable, public IWritable {
public:
    struct Config {
        std::string device_path = "/dev/ttyUSB0";
        uint32_t baud_rate = 9600;
        uint8_t data_bits = 8;
        uint8_t stop_bits = 1;
        Parity parity = Parity::NONE;
        FlowControl flow_control = FlowControl::NONE;
        InterfaceParams params;
    };

    explicit UARTTransport(const Config& config);
    UARTTransport();
    ~UARTTransport() override;

    UARTTransport(const UARTTransport&) = delete;
    UARTTransport& operator=(const UARTTransport&) = delete;

    /**
     * @brief Read up to size bytes, waiting at most timeout overall
     *
     * Returns whatever arrived before the deadline. Nothing at all is a
     * TimeoutError; a partial read is returned and counted as a warning.
     */
    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;

    uint32_t getBaudRate() const { return config_.baud_rate; }

    /**
     * @brief Change the baud rate, reprogramming the line if it is open
     */
    HardwareResult<void> setBaudRate(uint32_t baud_rate);

    const Config& getConfig() const { return config_; }

protected:
    HardwareResult<void> openDevice() override;
    HardwareResult<void> closeDevice() override;

private:
    HardwareResult<void> configurePort();

    Config config_;
    int fd_;
};

const char* parityToString(Parity parity);
const char* flowControlToString(FlowControl flow_control);

} // namespace transport
} // namespace payload_hal
