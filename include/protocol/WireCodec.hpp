#pragma once

#include "transport/HardwareError.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace payload_hal {
namespace protocol {

using transport::HardwareResult;

/**
 * @brief Byte-level encode/decode rules shared by device protocols
 *
 * Every decoder validates the reply length exactly; a reply is never
 * truncated or padded to fit.
 */
class WireCodec {
public:
    static constexpr uint8_t ACK_SENTINEL = 0x01;
    static constexpr size_t FLOAT_FIELD_SIZE = 4;

    /**
     * @brief InvalidParameter unless reply.size() == expected
     */
    static HardwareResult<void> validateLength(const std::vector<uint8_t>& reply, size_t expected);

    /**
     * @brief Assemble 4 bytes, least significant first
     */
    static uint32_t readUint32LE(const uint8_t* data);

    static void writeUint32LE(uint32_t value, uint8_t* data);

    /**
     * @brief Reinterpret a 32-bit pattern as an IEEE-754 single
     */
    static float floatFromBits(uint32_t bits);

    static uint32_t bitsFromFloat(float value);

    /**
     * @brief Decode field_count consecutive little-endian floats
     *
     * Reply length must be exactly field_count * 4.
     */
    static HardwareResult<std::vector<float>> decodeFloatFields(const std::vector<uint8_t>& reply,
                                                                size_t field_count);

    static std::vector<uint8_t> encodeFloatFields(const std::vector<float>& values);

    /**
     * @brief Two-byte big-endian unsigned value
     */
    static HardwareResult<uint16_t> decodeUint16BE(const std::vector<uint8_t>& reply);

    static std::vector<uint8_t> encodeUint16BE(uint16_t value);

    /**
     * @brief Success only for exactly [ACK_SENTINEL]
     */
    static HardwareResult<void> decodeAcknowledge(const std::vector<uint8_t>& reply);

    /**
     * @brief Place value into byte at bits [offset, offset + width)
     *
     * Bits of value above width are masked off; other bits of byte are kept.
     */
    static uint8_t packField(uint8_t byte, uint8_t value, uint8_t offset, uint8_t width);

    static uint8_t extractField(uint8_t byte, uint8_t offset, uint8_t width);

private:
    static uint8_t fieldMask(uint8_t width);
};

} // namespace protocol
} // namespace payload_hal
