#include "resilience/CommandPacer.hpp"
#include "utils/Logger.hpp"
#include <thread>

namespace payload_hal {
namespace resilience {

CommandPacer::CommandPacer(std::chrono::milliseconds delay)
    : delay_(delay)
    , paced_commands_(0) {
}

CommandPacer::CommandPacer()
    : CommandPacer(std::chrono::milliseconds{0}) {
}

void CommandPacer::pace() {
    if (delay_.count() > 0) {
        LOG_TRACE("CommandPacer: Waiting ", delay_.count(), " ms");
        std::this_thread::sleep_for(delay_);
    }
    ++paced_commands_;
}

} // namespace resilience
} // namespace payload_hal
