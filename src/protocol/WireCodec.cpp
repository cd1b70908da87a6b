#include "protocol/WireCodec.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace payload_hal {
namespace protocol {

using transport::HardwareError;

static_assert(sizeof(float) == 4, "IEEE-754 single precision required");

HardwareResult<void> WireCodec::validateLength(const std::vector<uint8_t>& reply, size_t expected) {
    if (reply.size() != expected) {
        return HardwareError::invalidParameter("expected " + std::to_string(expected) +
                                               " reply bytes, got " + std::to_string(reply.size()));
    }
    return {};
}

uint32_t WireCodec::readUint32LE(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

void WireCodec::writeUint32LE(uint32_t value, uint8_t* data) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

float WireCodec::floatFromBits(uint32_t bits) {
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

uint32_t WireCodec::bitsFromFloat(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

HardwareResult<std::vector<float>> WireCodec::decodeFloatFields(const std::vector<uint8_t>& reply,
                                                                size_t field_count) {
    auto valid = validateLength(reply, field_count * FLOAT_FIELD_SIZE);
    if (!valid) return valid.error();

    std::vector<float> fields;
    fields.reserve(field_count);
    for (size_t i = 0; i < field_count; ++i) {
        fields.push_back(floatFromBits(readUint32LE(reply.data() + i * FLOAT_FIELD_SIZE)));
    }
    return fields;
}

std::vector<uint8_t> WireCodec::encodeFloatFields(const std::vector<float>& values) {
    std::vector<uint8_t> data(values.size() * FLOAT_FIELD_SIZE);
    for (size_t i = 0; i < values.size(); ++i) {
        writeUint32LE(bitsFromFloat(values[i]), data.data() + i * FLOAT_FIELD_SIZE);
    }
    return data;
}

HardwareResult<uint16_t> WireCodec::decodeUint16BE(const std::vector<uint8_t>& reply) {
    auto valid = validateLength(reply, 2);
    if (!valid) return valid.error();

    return static_cast<uint16_t>((static_cast<uint16_t>(reply[0]) << 8) | reply[1]);
}

std::vector<uint8_t> WireCodec::encodeUint16BE(uint16_t value) {
    return {static_cast<uint8_t>((value >> 8) & 0xFF), static_cast<uint8_t>(value & 0xFF)};
}

HardwareResult<void> WireCodec::decodeAcknowledge(const std::vector<uint8_t>& reply) {
    auto valid = validateLength(reply, 1);
    if (!valid) return valid;

    if (reply[0] != ACK_SENTINEL) {
        std::ostringstream oss;
        oss << "invalid acknowledgement 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(reply[0]);
        return HardwareError::invalidParameter(oss.str());
    }
    return {};
}

uint8_t WireCodec::fieldMask(uint8_t width) {
    return width >= 8 ? 0xFF : static_cast<uint8_t>((1U << width) - 1U);
}

uint8_t WireCodec::packField(uint8_t byte, uint8_t value, uint8_t offset, uint8_t width) {
    const uint8_t mask = static_cast<uint8_t>(fieldMask(width) << offset);
    return static_cast<uint8_t>((byte & ~mask) | ((value << offset) & mask));
}

uint8_t WireCodec::extractField(uint8_t byte, uint8_t offset, uint8_t width) {
    return static_cast<uint8_t>((byte >> offset) & fieldMask(width));
}

} // namespace protocol
} // namespace payload_hal
