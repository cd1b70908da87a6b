#pragma once

#include "transport/ITransport.hpp"
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief Parameters common to every bus configuration
 */
struct InterfaceParams {
    std::chrono::milliseconds timeout{1000};
    uint32_t retry_count{3};
    std::chrono::milliseconds retry_delay{100};
};

/**
 * @brief Shared lifecycle and error accounting for concrete transports
 *
 * Derived classes supply openDevice()/closeDevice() and the data-path
 * operations; everything else (idempotent transitions, error recording,
 * NotInitialized guarding, status snapshots) lives here. The state is
 * guarded by an internal mutex so a status snapshot is safe while an
 * abandoned operation is still finishing on another thread.
 *
 * Lifecycle transitions hold a separate device mutex exclusively across
 * the check, the open/close and the state update, so concurrent
 * initialize() calls open the device once. Data-path calls hold it
 * shared: the descriptor is never closed under an in-flight call.
 */
class TransportBase : public virtual IHardwareInterface {
public:
    ~TransportBase() override = default;

    HardwareResult<void> initialize() override;
    HardwareResult<void> deinitialize() override;
    bool isInitialized() const override;
    InterfaceStatus getStatus() const override;

    /**
     * @brief Short name used in log lines, e.g. "I2C(/dev/i2c-1@0x50)"
     */
    const std::string& name() const { return name_; }

protected:
    TransportBase(std::string name, bool requires_equal_transfer_lengths);

    virtual HardwareResult<void> openDevice() = 0;
    virtual HardwareResult<void> closeDevice() = 0;

    void recordFailure(const HardwareError& error) override;
    void recordWarning(const std::string& message);

    /**
     * @brief NotInitialized (recorded) unless initialize() succeeded
     */
    HardwareResult<void> ensureInitialized();

    /**
     * @brief Transfer preconditions: initialized, and equal lengths if the bus needs them
     */
    HardwareResult<void> checkTransfer(size_t tx_size, size_t rx_size);

    /**
     * @brief Hold the open device for one data-path call
     */
    std::shared_lock<std::shared_mutex> sharedDeviceLock() const {
        return std::shared_lock<std::shared_mutex>(device_mutex_);
    }

    /**
     * @brief Hold the device exclusively while its configuration changes
     */
    std::unique_lock<std::shared_mutex> exclusiveDeviceLock() const {
        return std::unique_lock<std::shared_mutex>(device_mutex_);
    }

    /**
     * @brief Record the error carried by result, if any, and pass it through
     */
    template<typename T>
    HardwareResult<T> track(HardwareResult<T> result) {
        if (!result) {
            recordFailure(result.error());
        }
        return result;
    }

private:
    std::string name_;
    bool requires_equal_transfer_lengths_;
    mutable std::shared_mutex device_mutex_;
    mutable std::mutex state_mutex_;
    InterfaceState state_;
};

} // namespace transport
} // namespace payload_hal
