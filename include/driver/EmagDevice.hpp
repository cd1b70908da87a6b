#pragma once

#include "protocol/CommandChannel.hpp"
#include "protocol/EmagProtocol.hpp"
#include "transport/ITransport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace payload_hal {
namespace driver {

/**
 * @brief Driver for the electromagnetic actuator (EMAG) payload
 *
 * Each call is one paced command over the channel; the results are
 * the typed values an RPC layer hands back to the ground segment.
 */
class EmagDevice {
public:
    using ErrorCallback = std::function<void(const transport::HardwareError& error,
                                             const std::string& context)>;

    /**
     * @brief Channel settings the EMAG firmware expects
     *
     * 60 ms settle time before every command, 50 ms per transfer and a
     * single attempt: actuate and wipe are not idempotent, so a lost
     * acknowledgement must not trigger a second pulse.
     */
    static protocol::CommandChannel::Config defaultConfig();

    EmagDevice(std::shared_ptr<transport::IBidirectional> transport,
               const protocol::CommandChannel::Config& config);
    explicit EmagDevice(std::shared_ptr<transport::IBidirectional> transport);

    transport::HardwareResult<void> initialize();
    transport::HardwareResult<void> deinitialize();

    /**
     * @brief Read current, hall sensors and capacitor voltage
     */
    transport::HardwareResult<protocol::SystemStatus> getSystemStatus();

    /**
     * @brief Set the capacitor charge target
     * @param percent 0..100
     * @return Charge value reported back by the device
     */
    transport::HardwareResult<uint16_t> setChargeVoltage(uint8_t percent);

    /**
     * @brief Fire the coil on one axis
     */
    transport::HardwareResult<void> actuate(protocol::Axis axis);

    /**
     * @brief Degauss one axis
     */
    transport::HardwareResult<void> wipe(protocol::Axis axis);

    /**
     * @brief Telemetry from the last successful getSystemStatus()
     */
    std::optional<protocol::SystemStatus> lastSystemStatus() const;

    transport::InterfaceStatus getStatus() const;

    uint64_t commandsSent() const { return channel_.commandsSent(); }

    void setErrorCallback(ErrorCallback callback) {
        error_callback_ = callback;
    }

private:
    static std::shared_ptr<transport::IBidirectional> requireTransport(
        std::shared_ptr<transport::IBidirectional> transport);

    transport::HardwareResult<void> acknowledged(const protocol::CommandRequest& request,
                                                 const std::string& context);
    void handleError(const transport::HardwareError& error, const std::string& context);

    protocol::CommandChannel channel_;
    ErrorCallback error_callback_;

    mutable std::mutex status_mutex_;
    std::optional<protocol::SystemStatus> last_status_;
};

} // namespace driver
} // namespace payload_hal
