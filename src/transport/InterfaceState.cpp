#include "transport/InterfaceState.hpp"

namespace payload_hal {
namespace transport {

InterfaceState::InterfaceState()
    : initialized_(false)
    , error_count_(0)
    , warning_count_(0)
    , start_time_(std::chrono::steady_clock::now()) {
}

void InterfaceState::recordError(const std::string& description) {
    ++error_count_;
    last_error_ = description;
}

void InterfaceState::recordWarning(const std::string& description) {
    ++warning_count_;
    last_warning_ = description;
}

std::chrono::milliseconds InterfaceState::uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
}

InterfaceStatus InterfaceState::toStatus() const {
    InterfaceStatus status;
    status.initialized = initialized_;
    status.error_count = error_count_;
    status.warning_count = warning_count_;
    status.last_error = last_error_;
    status.uptime = uptime();
    return status;
}

} // namespace transport
} // namespace payload_hal
