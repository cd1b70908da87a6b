#pragma once

#include "protocol/Command.hpp"
#include "resilience/CommandPacer.hpp"
#include "resilience/Resilience.hpp"
#include "transport/ITransport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace payload_hal {
namespace protocol {

enum class TimeoutScope {
    PER_ATTEMPT,    // every attempt gets the full timeout
    OVERALL         // one deadline covers all attempts and retry delays
};

/**
 * @brief Sends commands to one device and collects the raw replies
 *
 * Combines a transport with pacing, timeout and retry. Commands are
 * single-flight: concurrent callers are serialized in arrival order.
 *
 * Over a bidirectional bus each attempt is one transfer() of
 * [opcode][payload] that reads exactly response_length bytes. Over a
 * stream (UART) each attempt is writeAll() followed by readExact().
 */
class CommandChannel {
public:
    struct Config {
        std::chrono::milliseconds timeout{1000};
        resilience::RetryPolicy retry;
        std::chrono::milliseconds inter_command_delay{0};
        TimeoutScope timeout_scope = TimeoutScope::PER_ATTEMPT;
    };

    CommandChannel(std::shared_ptr<transport::IBidirectional> transport, const Config& config);
    explicit CommandChannel(std::shared_ptr<transport::IBidirectional> transport);

    CommandChannel(std::shared_ptr<transport::IReadable> reader,
                   std::shared_ptr<transport::IWritable> writer,
                   const Config& config);

    /**
     * @brief Pace, send and receive under the configured resilience policy
     * @return Raw reply bytes; their length is checked by the caller's decoder
     */
    transport::HardwareResult<std::vector<uint8_t>> execute(const CommandRequest& request);

    /**
     * @brief Lifecycle of the underlying transport
     */
    transport::IHardwareInterface& hardware();
    const transport::IHardwareInterface& hardware() const;

    const Config& getConfig() const { return config_; }

    uint64_t commandsSent() const { return commands_sent_.load(); }

private:
    using Attempt = std::function<transport::HardwareResult<std::vector<uint8_t>>()>;

    Attempt makeAttempt(const CommandRequest& request) const;

    std::shared_ptr<transport::IBidirectional> bidirectional_;
    std::shared_ptr<transport::IReadable> reader_;
    std::shared_ptr<transport::IWritable> writer_;
    Config config_;
    resilience::CommandPacer pacer_;
    std::mutex command_mutex_;
    std::atomic<uint64_t> commands_sent_;
};

} // namespace protocol
} // namespace payload_hal
