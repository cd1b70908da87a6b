#pragma once

#include "transport/HardwareError.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace payload_hal {
namespace protocol {

/**
 * @brief EMAG telemetry, fields in wire order
 */
struct SystemStatus {
    float sys_current = 0.0f;
    float x_hall = 0.0f;
    float y_hall = 0.0f;
    float z_hall = 0.0f;
    float cap_volt = 0.0f;

    static constexpr size_t FIELD_COUNT = 5;
};

/**
 * @brief Actuation axis: coil channel plus polarity
 */
enum class Axis : uint8_t {
    X_PLUS,
    Y_PLUS,
    Z_PLUS,
    X_MINUS,
    Y_MINUS,
    Z_MINUS
};

/**
 * @brief Coil channel, bits 3..2 of the axis byte
 */
enum class Channel : uint8_t {
    X = 0x00,
    Y = 0x01,
    Z = 0x02
};

/**
 * @brief Drive polarity, bits 1..0 of the axis byte
 */
enum class Polarity : uint8_t {
    PLUS = 0x00,
    MINUS = 0x01
};

constexpr uint8_t CHANNEL_OFFSET = 2;
constexpr uint8_t CHANNEL_WIDTH = 2;
constexpr uint8_t POLARITY_OFFSET = 0;
constexpr uint8_t POLARITY_WIDTH = 2;

Channel axisChannel(Axis axis);
Polarity axisPolarity(Axis axis);

/**
 * @brief Wire pattern for an axis, e.g. Z_PLUS -> 0b1000
 */
uint8_t encodeAxis(Axis axis);

/**
 * @brief Inverse of encodeAxis; any byte outside the six patterns is InvalidParameter
 */
transport::HardwareResult<Axis> decodeAxis(uint8_t value);

/**
 * @brief Text form used by operators, e.g. "Z_plus"
 */
const char* axisName(Axis axis);

transport::HardwareResult<Axis> parseAxis(const std::string& name);

std::ostream& operator<<(std::ostream& os, Axis axis);
std::ostream& operator<<(std::ostream& os, const SystemStatus& status);

} // namespace protocol
} // namespace payload_hal
