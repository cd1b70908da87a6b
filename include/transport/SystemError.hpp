#pragma once

#include "transport/HardwareError.hpp"
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief Map an errno value from a device syscall onto the error taxonomy
 *
 * ENOENT/ENODEV/ENXIO -> DeviceNotFound, EACCES/EPERM -> PermissionDenied,
 * ETIMEDOUT -> TimeoutError, EINVAL -> InvalidParameter, everything else
 * -> CommunicationError carrying the context and strerror text.
 */
HardwareError errnoToHardwareError(int error_number, const std::string& context);

} // namespace transport
} // namespace payload_hal
