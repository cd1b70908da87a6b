#pragma once

#include "utils/Result.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief Closed error taxonomy shared by every layer
 *
 * Errors fall into three classes:
 * - usage (NotInitialized, AlreadyInitialized, InvalidParameter): caller bug, never retried
 * - environment (DeviceNotFound, PermissionDenied): fatal for the current attempt
 * - transient (CommunicationError, TimeoutError, OperationFailed): eligible for retry
 */
class HardwareError {
public:
    enum class Kind : uint8_t {
        COMMUNICATION_ERROR,
        TIMEOUT_ERROR,
        INVALID_PARAMETER,
        DEVICE_NOT_FOUND,
        PERMISSION_DENIED,
        NOT_INITIALIZED,
        ALREADY_INITIALIZED,
        OPERATION_FAILED
    };

    static HardwareError communication(std::string reason);
    static HardwareError timeout();
    static HardwareError invalidParameter(std::string reason);
    static HardwareError deviceNotFound();
    static HardwareError permissionDenied();
    static HardwareError notInitialized();
    static HardwareError alreadyInitialized();
    static HardwareError operationFailed(std::string reason);

    Kind kind() const { return kind_; }

    /**
     * @brief Reason attached to the error, empty for kinds that carry none
     */
    const std::string& reason() const { return reason_; }

    /**
     * @brief Human-readable description, e.g. "Invalid parameter: mode 4"
     */
    std::string toString() const;

    bool isUsageError() const;
    bool isEnvironmentError() const;
    bool isTransient() const;

    bool operator==(const HardwareError& other) const {
        return kind_ == other.kind_ && reason_ == other.reason_;
    }
    bool operator!=(const HardwareError& other) const { return !(*this == other); }

private:
    HardwareError(Kind kind, std::string reason);

    Kind kind_;
    std::string reason_;
};

const char* kindToString(HardwareError::Kind kind);

std::ostream& operator<<(std::ostream& os, const HardwareError& error);

template<typename T>
using HardwareResult = utils::Result<T, HardwareError>;

} // namespace transport
} // namespace payload_hal
