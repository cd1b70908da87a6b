#include "transport/TransportBase.hpp"
#include "utils/Logger.hpp"

namespace payload_hal {
namespace transport {

TransportBase::TransportBase(std::string name, bool requires_equal_transfer_lengths)
    : name_(std::move(name))
    , requires_equal_transfer_lengths_(requires_equal_transfer_lengths) {
}

HardwareResult<void> TransportBase::initialize() {
    auto device = exclusiveDeviceLock();
    if (isInitialized()) {
        return {};
    }

    auto opened = openDevice();
    if (!opened) {
        recordFailure(opened.error());
        return opened;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.setInitialized(true);
    }
    LOG_INFO(name_, ": Initialized");
    return {};
}

HardwareResult<void> TransportBase::deinitialize() {
    auto device = exclusiveDeviceLock();
    if (!isInitialized()) {
        return {};
    }

    auto closed = closeDevice();
    if (!closed) {
        recordFailure(closed.error());
        return closed;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.setInitialized(false);
    }
    LOG_INFO(name_, ": Deinitialized");
    return {};
}

bool TransportBase::isInitialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.isInitialized();
}

InterfaceStatus TransportBase::getStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.toStatus();
}

void TransportBase::recordFailure(const HardwareError& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.recordError(error.toString());
    }
    LOG_ERROR(name_, ": ", error);
}

void TransportBase::recordWarning(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.recordWarning(message);
    }
    LOG_WARN(name_, ": ", message);
}

HardwareResult<void> TransportBase::ensureInitialized() {
    if (!isInitialized()) {
        auto error = HardwareError::notInitialized();
        recordFailure(error);
        return error;
    }
    return {};
}

HardwareResult<void> TransportBase::checkTransfer(size_t tx_size, size_t rx_size) {
    auto ready = ensureInitialized();
    if (!ready) {
        return ready;
    }

    if (requires_equal_transfer_lengths_ && tx_size != rx_size) {
        auto error = HardwareError::invalidParameter("TX and RX buffers must be the same size");
        recordFailure(error);
        return error;
    }
    return {};
}

} // namespace transport
} // namespace payload_hal
