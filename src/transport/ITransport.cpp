#include "transport/ITransport.hpp"

namespace payload_hal {
namespace transport {

HardwareResult<void> IReadable::readExact(uint8_t* data, size_t size,
                                          std::chrono::milliseconds timeout) {
    auto bytes_read = read(data, size, timeout);
    if (!bytes_read) {
        return bytes_read.error();
    }

    if (bytes_read.value() != size) {
        auto error = HardwareError::communication("Failed to read exact number of bytes");
        recordFailure(error);
        return error;
    }
    return {};
}

HardwareResult<void> IWritable::writeAll(const uint8_t* data, size_t size) {
    auto bytes_written = write(data, size);
    if (!bytes_written) {
        return bytes_written.error();
    }

    if (bytes_written.value() != size) {
        auto error = HardwareError::communication("Failed to write all bytes");
        recordFailure(error);
        return error;
    }
    return {};
}

} // namespace transport
} // namespace payload_hal
