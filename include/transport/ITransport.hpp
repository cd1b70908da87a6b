#pragma once

#include "transport/HardwareError.hpp"
#include "transport/InterfaceState.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace payload_hal {
namespace transport {

/**
 * @brief Lifecycle contract shared by every bus implementation
 *
 * Uninitialized -> initialize() -> Initialized -> deinitialize() -> Uninitialized.
 * Both transitions are idempotent. A failed operation bumps the error
 * accounting without changing the lifecycle state, so an interface can be
 * initialized but degraded.
 *
 * The capability interfaces below inherit this one virtually so that a
 * concrete transport exposes a single lifecycle whichever capability it
 * is reached through.
 */
class IHardwareInterface {
public:
    virtual ~IHardwareInterface() = default;

    /**
     * @brief Open the underlying device
     * @return Success, or the error that kept the device closed
     */
    virtual HardwareResult<void> initialize() = 0;

    /**
     * @brief Release the underlying device
     */
    virtual HardwareResult<void> deinitialize() = 0;

    virtual bool isInitialized() const = 0;

    /**
     * @brief Snapshot of lifecycle and error accounting, never fails
     */
    virtual InterfaceStatus getStatus() const = 0;

protected:
    /**
     * @brief Account a failed operation against this interface
     */
    virtual void recordFailure(const HardwareError& error) = 0;
};

class IReadable : public virtual IHardwareInterface {
public:
    /**
     * @brief Read up to size bytes
     * @param data Destination buffer
     * @param size Maximum number of bytes to read
     * @param timeout Time to wait for data
     * @return Number of bytes actually read
     */
    virtual HardwareResult<size_t> read(uint8_t* data, size_t size,
                                        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Read exactly size bytes, a short read is a CommunicationError
     */
    HardwareResult<void> readExact(uint8_t* data, size_t size,
                                   std::chrono::milliseconds timeout);
};

class IWritable : public virtual IHardwareInterface {
public:
    /**
     * @brief Write data to the bus
     * @return Number of bytes actually written
     */
    virtual HardwareResult<size_t> write(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Write all bytes, a short write is a CommunicationError
     */
    HardwareResult<void> writeAll(const uint8_t* data, size_t size);
};

/**
 * @brief Combined write-then-read in one bus transaction
 *
 * Whether tx and rx must have equal lengths depends on the bus
 * (SPI clocks both directions at once, I2C does not).
 */
class IBidirectional : public IReadable, public IWritable {
public:
    /**
     * @return Number of bytes received into rx_data
     */
    virtual HardwareResult<size_t> transfer(const uint8_t* tx_data, size_t tx_size,
                                            uint8_t* rx_data, size_t rx_size,
                                            std::chrono::milliseconds timeout) = 0;
};

} // namespace transport
} // namespace payload_hal
