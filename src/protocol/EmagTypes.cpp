#include "protocol/EmagTypes.hpp"
#include "protocol/WireCodec.hpp"
#include <array>
#include <iomanip>
#include <sstream>

namespace payload_hal {
namespace protocol {

using transport::HardwareError;
using transport::HardwareResult;

namespace {

constexpr std::array<Axis, 6> ALL_AXES = {
    Axis::X_PLUS, Axis::Y_PLUS, Axis::Z_PLUS,
    Axis::X_MINUS, Axis::Y_MINUS, Axis::Z_MINUS
};

} // namespace

Channel axisChannel(Axis axis) {
    switch (axis) {
        case Axis::X_PLUS:
        case Axis::X_MINUS: return Channel::X;
        case Axis::Y_PLUS:
        case Axis::Y_MINUS: return Channel::Y;
        case Axis::Z_PLUS:
        case Axis::Z_MINUS:
        default:            return Channel::Z;
    }
}

Polarity axisPolarity(Axis axis) {
    switch (axis) {
        case Axis::X_MINUS:
        case Axis::Y_MINUS:
        case Axis::Z_MINUS: return Polarity::MINUS;
        default:            return Polarity::PLUS;
    }
}

uint8_t encodeAxis(Axis axis) {
    uint8_t byte = 0;
    byte = WireCodec::packField(byte, static_cast<uint8_t>(axisChannel(axis)),
                                CHANNEL_OFFSET, CHANNEL_WIDTH);
    byte = WireCodec::packField(byte, static_cast<uint8_t>(axisPolarity(axis)),
                                POLARITY_OFFSET, POLARITY_WIDTH);
    return byte;
}

HardwareResult<Axis> decodeAxis(uint8_t value) {
    for (auto axis : ALL_AXES) {
        if (encodeAxis(axis) == value) {
            return axis;
        }
    }

    std::ostringstream oss;
    oss << "unknown axis pattern 0x" << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(value);
    return HardwareError::invalidParameter(oss.str());
}

const char* axisName(Axis axis) {
    switch (axis) {
        case Axis::X_PLUS:  return "X_plus";
        case Axis::Y_PLUS:  return "Y_plus";
        case Axis::Z_PLUS:  return "Z_plus";
        case Axis::X_MINUS: return "X_minus";
        case Axis::Y_MINUS: return "Y_minus";
        case Axis::Z_MINUS: return "Z_minus";
        default: return "unknown";
    }
}

HardwareResult<Axis> parseAxis(const std::string& name) {
    for (auto axis : ALL_AXES) {
        if (name == axisName(axis)) {
            return axis;
        }
    }
    return HardwareError::invalidParameter("unknown axis '" + name + "'");
}

std::ostream& operator<<(std::ostream& os, Axis axis) {
    return os << axisName(axis);
}

std::ostream& operator<<(std::ostream& os, const SystemStatus& status) {
    return os << "current=" << status.sys_current
              << " hall=(" << status.x_hall << ", " << status.y_hall << ", " << status.z_hall << ")"
              << " cap=" << status.cap_volt;
}

} // namespace protocol
} // namespace payload_hal
