#pragma once

#include "protocol/Command.hpp"
#include "protocol/EmagTypes.hpp"
#include "transport/HardwareError.hpp"
#include <chrono>
#include <vector>

namespace payload_hal {
namespace protocol {

/**
 * @brief EMAG command opcodes
 */
enum class EmagOpcode : uint8_t {
    SYSTEM_STATUS = 0x01,
    SET_CHARGE_VOLTAGE = 0x02,
    ACTUATE = 0x03,
    WIPE = 0x04,
};

/**
 * @brief Request builders and reply parsers for the electromagnetic actuator payload
 *
 * | opcode | payload        | reply                         |
 * |--------|----------------|-------------------------------|
 * | 0x01   | [0x00]         | 20 bytes, five LE floats      |
 * | 0x02   | [percent]      | 2 bytes, big-endian u16       |
 * | 0x03   | [axis]         | [0x01]                        |
 * | 0x04   | [axis]         | [0x01]                        |
 */
class EmagProtocol {
public:
    static constexpr uint16_t DEFAULT_ADDRESS = 0x50;
    static constexpr uint8_t MAX_CHARGE_PERCENT = 100;
    static constexpr size_t SYSTEM_STATUS_REPLY_LENGTH = SystemStatus::FIELD_COUNT * 4;
    static constexpr size_t CHARGE_VOLTAGE_REPLY_LENGTH = 2;
    static constexpr size_t ACK_REPLY_LENGTH = 1;

    // Settle time the device needs between commands
    static constexpr std::chrono::milliseconds INTER_COMMAND_DELAY{60};
    static constexpr std::chrono::milliseconds TRANSFER_TIMEOUT{50};

    static CommandRequest createSystemStatusRequest();

    /**
     * @brief Set the capacitor charge target
     * @param percent 0..100, anything higher is InvalidParameter
     */
    static transport::HardwareResult<CommandRequest> createChargeVoltageRequest(uint8_t percent);

    static CommandRequest createActuateRequest(Axis axis);
    static CommandRequest createWipeRequest(Axis axis);

    static transport::HardwareResult<SystemStatus> parseSystemStatus(const std::vector<uint8_t>& reply);

    /**
     * @brief Charge voltage echoed by the device
     */
    static transport::HardwareResult<uint16_t> parseChargeVoltage(const std::vector<uint8_t>& reply);

    static transport::HardwareResult<void> parseAcknowledge(const std::vector<uint8_t>& reply);

    /**
     * @brief Build the 20-byte telemetry reply a device would send
     */
    static std::vector<uint8_t> encodeSystemStatus(const SystemStatus& status);
};

} // namespace protocol
} // namespace payload_hal
