#include "transport/HardwareError.hpp"

namespace payload_hal {
namespace transport {

HardwareError::HardwareError(Kind kind, std::string reason)
    : kind_(kind)
    , reason_(std::move(reason)) {
}

HardwareError HardwareError::communication(std::string reason) {
    return HardwareError(Kind::COMMUNICATION_ERROR, std::move(reason));
}

HardwareError HardwareError::timeout() {
    return HardwareError(Kind::TIMEOUT_ERROR, "");
}

HardwareError HardwareError::invalidParameter(std::string reason) {
    return HardwareError(Kind::INVALID_PARAMETER, std::move(reason));
}

HardwareError HardwareError::deviceNotFound() {
    return HardwareError(Kind::DEVICE_NOT_FOUND, "");
}

HardwareError HardwareError::permissionDenied() {
    return HardwareError(Kind::PERMISSION_DENIED, "");
}

HardwareError HardwareError::notInitialized() {
    return HardwareError(Kind::NOT_INITIALIZED, "");
}

HardwareError HardwareError::alreadyInitialized() {
    return HardwareError(Kind::ALREADY_INITIALIZED, "");
}

HardwareError HardwareError::operationFailed(std::string reason) {
    return HardwareError(Kind::OPERATION_FAILED, std::move(reason));
}

std::string HardwareError::toString() const {
    switch (kind_) {
        case Kind::COMMUNICATION_ERROR: return "Communication error: " + reason_;
        case Kind::TIMEOUT_ERROR:       return "Operation timed out";
        case Kind::INVALID_PARAMETER:   return "Invalid parameter: " + reason_;
        case Kind::DEVICE_NOT_FOUND:    return "Device not found";
        case Kind::PERMISSION_DENIED:   return "Permission denied";
        case Kind::NOT_INITIALIZED:     return "Device not initialized";
        case Kind::ALREADY_INITIALIZED: return "Device already initialized";
        case Kind::OPERATION_FAILED:    return "Operation failed: " + reason_;
        default: return "Unknown hardware error";
    }
}

bool HardwareError::isUsageError() const {
    return kind_ == Kind::NOT_INITIALIZED ||
           kind_ == Kind::ALREADY_INITIALIZED ||
           kind_ == Kind::INVALID_PARAMETER;
}

bool HardwareError::isEnvironmentError() const {
    return kind_ == Kind::DEVICE_NOT_FOUND ||
           kind_ == Kind::PERMISSION_DENIED;
}

bool HardwareError::isTransient() const {
    return kind_ == Kind::COMMUNICATION_ERROR ||
           kind_ == Kind::TIMEOUT_ERROR ||
           kind_ == Kind::OPERATION_FAILED;
}

const char* kindToString(HardwareError::Kind kind) {
    switch (kind) {
        case HardwareError::Kind::COMMUNICATION_ERROR: return "CommunicationError";
        case HardwareError::Kind::TIMEOUT_ERROR:       return "TimeoutError";
        case HardwareError::Kind::INVALID_PARAMETER:   return "InvalidParameter";
        case HardwareError::Kind::DEVICE_NOT_FOUND:    return "DeviceNotFound";
        case HardwareError::Kind::PERMISSION_DENIED:   return "PermissionDenied";
        case HardwareError::Kind::NOT_INITIALIZED:     return "NotInitialized";
        case HardwareError::Kind::ALREADY_INITIALIZED: return "AlreadyInitialized";
        case HardwareError::Kind::OPERATION_FAILED:    return "OperationFailed";
        default: return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const HardwareError& error) {
    return os << kindToString(error.kind()) << " (" << error.toString() << ")";
}

} // namespace transport
} // namespace payload_hal
