#include "driver/EmagDevice.hpp"
#include "utils/Logger.hpp"
#include <stdexcept>

namespace payload_hal {
namespace driver {

using protocol::Axis;
using protocol::EmagProtocol;
using transport::HardwareError;
using transport::HardwareResult;

protocol::CommandChannel::Config EmagDevice::defaultConfig() {
    protocol::CommandChannel::Config config;
    config.timeout = EmagProtocol::TRANSFER_TIMEOUT;
    config.retry.retry_count = 1;
    config.retry.retry_delay = std::chrono::milliseconds{0};
    config.inter_command_delay = EmagProtocol::INTER_COMMAND_DELAY;
    config.timeout_scope = protocol::TimeoutScope::PER_ATTEMPT;
    return config;
}

std::shared_ptr<transport::IBidirectional> EmagDevice::requireTransport(
    std::shared_ptr<transport::IBidirectional> transport) {
    if (!transport) {
        throw std::invalid_argument("EmagDevice requires a transport");
    }
    return transport;
}

EmagDevice::EmagDevice(std::shared_ptr<transport::IBidirectional> transport,
                       const protocol::CommandChannel::Config& config)
    : channel_(requireTransport(std::move(transport)), config) {
}

EmagDevice::EmagDevice(std::shared_ptr<transport::IBidirectional> transport)
    : EmagDevice(std::move(transport), defaultConfig()) {
}

HardwareResult<void> EmagDevice::initialize() {
    LOG_INFO("EmagDevice: Initializing");

    auto result = channel_.hardware().initialize();
    if (!result) {
        handleError(result.error(), "Initialization failed");
    }
    return result;
}

HardwareResult<void> EmagDevice::deinitialize() {
    auto result = channel_.hardware().deinitialize();
    if (!result) {
        handleError(result.error(), "Deinitialization failed");
    }
    return result;
}

HardwareResult<protocol::SystemStatus> EmagDevice::getSystemStatus() {
    auto reply = channel_.execute(EmagProtocol::createSystemStatusRequest());
    if (!reply) {
        handleError(reply.error(), "Failed to get system status");
        return reply.error();
    }

    auto status = EmagProtocol::parseSystemStatus(reply.value());
    if (!status) {
        handleError(status.error(), "Malformed system status");
        return status;
    }

    LOG_DEBUG("EmagDevice: ", status.value());

    std::lock_guard<std::mutex> lock(status_mutex_);
    last_status_ = status.value();
    return status;
}

HardwareResult<uint16_t> EmagDevice::setChargeVoltage(uint8_t percent) {
    auto request = EmagProtocol::createChargeVoltageRequest(percent);
    if (!request) {
        handleError(request.error(), "Rejected charge voltage");
        return request.error();
    }

    auto reply = channel_.execute(request.value());
    if (!reply) {
        handleError(reply.error(), "Failed to set charge voltage");
        return reply.error();
    }

    auto charge = EmagProtocol::parseChargeVoltage(reply.value());
    if (!charge) {
        handleError(charge.error(), "Malformed charge voltage reply");
        return charge;
    }

    LOG_INFO("EmagDevice: Charge voltage set to ", static_cast<int>(percent),
             "%, device reports ", charge.value());
    return charge;
}

HardwareResult<void> EmagDevice::actuate(Axis axis) {
    LOG_INFO("EmagDevice: Actuating ", axis);
    return acknowledged(EmagProtocol::createActuateRequest(axis),
                        std::string("Actuate ") + protocol::axisName(axis));
}

HardwareResult<void> EmagDevice::wipe(Axis axis) {
    LOG_INFO("EmagDevice: Wiping ", axis);
    return acknowledged(EmagProtocol::createWipeRequest(axis),
                        std::string("Wipe ") + protocol::axisName(axis));
}

HardwareResult<void> EmagDevice::acknowledged(const protocol::CommandRequest& request,
                                              const std::string& context) {
    auto reply = channel_.execute(request);
    if (!reply) {
        handleError(reply.error(), context + " failed");
        return reply.error();
    }

    auto ack = EmagProtocol::parseAcknowledge(reply.value());
    if (!ack) {
        handleError(ack.error(), context + " not acknowledged");
    }
    return ack;
}

std::optional<protocol::SystemStatus> EmagDevice::lastSystemStatus() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_status_;
}

transport::InterfaceStatus EmagDevice::getStatus() const {
    return channel_.hardware().getStatus();
}

void EmagDevice::handleError(const HardwareError& error, const std::string& context) {
    LOG_ERROR("EmagDevice: ", context, ": ", error);

    if (error_callback_) {
        error_callback_(error, context);
    }
}

} // namespace driver
} // namespace payload_hal
