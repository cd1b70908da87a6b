#include "protocol/EmagProtocol.hpp"
#include "protocol/WireCodec.hpp"

namespace payload_hal {
namespace protocol {

using transport::HardwareError;
using transport::HardwareResult;

namespace {

CommandRequest makeRequest(EmagOpcode opcode, std::vector<uint8_t> payload, size_t reply_length) {
    CommandRequest request;
    request.command.opcode = static_cast<uint8_t>(opcode);
    request.command.payload = std::move(payload);
    request.response_length = reply_length;
    return request;
}

} // namespace

CommandRequest EmagProtocol::createSystemStatusRequest() {
    return makeRequest(EmagOpcode::SYSTEM_STATUS, {0x00}, SYSTEM_STATUS_REPLY_LENGTH);
}

HardwareResult<CommandRequest> EmagProtocol::createChargeVoltageRequest(uint8_t percent) {
    if (percent > MAX_CHARGE_PERCENT) {
        return HardwareError::invalidParameter("charge voltage must be 0-100%, got " +
                                               std::to_string(percent));
    }
    return makeRequest(EmagOpcode::SET_CHARGE_VOLTAGE, {percent}, CHARGE_VOLTAGE_REPLY_LENGTH);
}

CommandRequest EmagProtocol::createActuateRequest(Axis axis) {
    return makeRequest(EmagOpcode::ACTUATE, {encodeAxis(axis)}, ACK_REPLY_LENGTH);
}

CommandRequest EmagProtocol::createWipeRequest(Axis axis) {
    return makeRequest(EmagOpcode::WIPE, {encodeAxis(axis)}, ACK_REPLY_LENGTH);
}

HardwareResult<SystemStatus> EmagProtocol::parseSystemStatus(const std::vector<uint8_t>& reply) {
    auto fields = WireCodec::decodeFloatFields(reply, SystemStatus::FIELD_COUNT);
    if (!fields) return fields.error();

    const auto& values = fields.value();
    SystemStatus status;
    status.sys_current = values[0];
    status.x_hall = values[1];
    status.y_hall = values[2];
    status.z_hall = values[3];
    status.cap_volt = values[4];
    return status;
}

HardwareResult<uint16_t> EmagProtocol::parseChargeVoltage(const std::vector<uint8_t>& reply) {
    return WireCodec::decodeUint16BE(reply);
}

HardwareResult<void> EmagProtocol::parseAcknowledge(const std::vector<uint8_t>& reply) {
    return WireCodec::decodeAcknowledge(reply);
}

std::vector<uint8_t> EmagProtocol::encodeSystemStatus(const SystemStatus& status) {
    return WireCodec::encodeFloatFields({status.sys_current, status.x_hall, status.y_hall,
                                         status.z_hall, status.cap_volt});
}

} // namespace protocol
} // namespace payload_hal
