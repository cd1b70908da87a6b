#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace payload_hal {
namespace transport {

/**
 * @brief Immutable snapshot of a transport's lifecycle and error accounting
 */
struct InterfaceStatus {
    bool initialized{false};
    uint32_t error_count{0};
    uint32_t warning_count{0};
    std::optional<std::string> last_error;
    std::chrono::milliseconds uptime{0};
};

/**
 * @brief Lifecycle/error record owned by exactly one transport
 *
 * Counters only ever increase; last_error holds the most recent failure.
 */
class InterfaceState {
public:
    InterfaceState();

    bool isInitialized() const { return initialized_; }
    void setInitialized(bool initialized) { initialized_ = initialized; }

    void recordError(const std::string& description);
    void recordWarning(const std::string& description);

    uint32_t errorCount() const { return error_count_; }
    uint32_t warningCount() const { return warning_count_; }
    const std::optional<std::string>& lastError() const { return last_error_; }
    const std::optional<std::string>& lastWarning() const { return last_warning_; }

    std::chrono::milliseconds uptime() const;

    InterfaceStatus toStatus() const;

private:
    bool initialized_;
    uint32_t error_count_;
    uint32_t warning_count_;
    std::optional<std::string> last_error_;
    std::optional<std::string> last_warning_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace transport
} // namespace payload_hal
