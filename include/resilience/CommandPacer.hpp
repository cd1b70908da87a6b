#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace payload_hal {
namespace resilience {

/**
 * @brief Fixed inter-command delay for devices that need settle time
 *
 * pace() sleeps the full delay before every command, whether or not the
 * previous command was recent.
 */
class CommandPacer {
public:
    explicit CommandPacer(std::chrono::milliseconds delay);
    CommandPacer();

    void pace();

    std::chrono::milliseconds delay() const { return delay_; }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    uint64_t pacedCommands() const { return paced_commands_.load(); }

private:
    std::chrono::milliseconds delay_;
    std::atomic<uint64_t> paced_commands_;
};

} // namespace resilience
} // namespace payload_hal
