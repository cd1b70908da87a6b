#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace payload_hal {
namespace protocol {

/**
 * @brief Outbound command
 *
 * Wire layout: [OPCODE][PAYLOAD0]...[PAYLOADN]
 */
struct Command {
    uint8_t opcode = 0;
    std::vector<uint8_t> payload;

    std::vector<uint8_t> serialize() const;
};

/**
 * @brief A command plus the exact reply length the device answers with
 */
struct CommandRequest {
    Command command;
    size_t response_length = 0;
};

std::ostream& operator<<(std::ostream& os, const Command& command);

} // namespace protocol
} // namespace payload_hal
