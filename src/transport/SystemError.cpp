#include "transport/SystemError.hpp"
#include <cerrno>
#include <cstring>

namespace payload_hal {
namespace transport {

HardwareError errnoToHardwareError(int error_number, const std::string& context) {
    switch (error_number) {
        case ENOENT:
        case ENODEV:
        case ENXIO:
            return HardwareError::deviceNotFound();
        case EACCES:
        case EPERM:
            return HardwareError::permissionDenied();
        case ETIMEDOUT:
            return HardwareError::timeout();
        case EINVAL:
            return HardwareError::invalidParameter(context + ": " + std::strerror(error_number));
        default:
            return HardwareError::communication(context + ": " + std::strerror(error_number));
    }
}

} // namespace transport
} // namespace payload_hal
