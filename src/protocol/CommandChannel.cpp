#include "protocol/CommandChannel.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace payload_hal {
namespace protocol {

using transport::HardwareError;
using transport::HardwareResult;

CommandChannel::CommandChannel(std::shared_ptr<transport::IBidirectional> transport,
                               const Config& config)
    : bidirectional_(std::move(transport))
    , config_(config)
    , pacer_(config.inter_command_delay)
    , commands_sent_(0) {
    if (!bidirectional_) {
        throw std::invalid_argument("CommandChannel: transport cannot be null");
    }
}

CommandChannel::CommandChannel(std::shared_ptr<transport::IBidirectional> transport)
    : CommandChannel(std::move(transport), Config{}) {
}

CommandChannel::CommandChannel(std::shared_ptr<transport::IReadable> reader,
                               std::shared_ptr<transport::IWritable> writer,
                               const Config& config)
    : reader_(std::move(reader))
    , writer_(std::move(writer))
    , config_(config)
    , pacer_(config.inter_command_delay)
    , commands_sent_(0) {
    if (!reader_ || !writer_) {
        throw std::invalid_argument("CommandChannel: reader and writer cannot be null");
    }
}

transport::IHardwareInterface& CommandChannel::hardware() {
    if (bidirectional_) {
        return *bidirectional_;
    }
    return *reader_;
}

const transport::IHardwareInterface& CommandChannel::hardware() const {
    if (bidirectional_) {
        return *bidirectional_;
    }
    return *reader_;
}

CommandChannel::Attempt CommandChannel::makeAttempt(const CommandRequest& request) const {
    const auto tx = request.command.serialize();
    const size_t rx_size = request.response_length;
    const auto timeout = config_.timeout;

    // Captures own everything: an attempt abandoned on timeout may outlive this call
    if (bidirectional_) {
        auto transport = bidirectional_;
        return [transport, tx, rx_size, timeout]() -> HardwareResult<std::vector<uint8_t>> {
            std::vector<uint8_t> rx(rx_size);
            auto received = transport->transfer(tx.data(), tx.size(), rx.data(), rx.size(), timeout);
            if (!received) return received.error();

            rx.resize(std::min(received.value(), rx_size));
            return rx;
        };
    }

    auto reader = reader_;
    auto writer = writer_;
    return [reader, writer, tx, rx_size, timeout]() -> HardwareResult<std::vector<uint8_t>> {
        auto sent = writer->writeAll(tx.data(), tx.size());
        if (!sent) return sent.error();

        std::vector<uint8_t> rx(rx_size);
        if (rx_size > 0) {
            auto received = reader->readExact(rx.data(), rx.size(), timeout);
            if (!received) return received.error();
        }
        return rx;
    };
}

HardwareResult<std::vector<uint8_t>> CommandChannel::execute(const CommandRequest& request) {
    std::lock_guard<std::mutex> lock(command_mutex_);

    pacer_.pace();

    LOG_DEBUG("CommandChannel: Sending ", request.command, ", expecting ",
              request.response_length, " bytes");

    auto attempt = makeAttempt(request);
    ++commands_sent_;

    HardwareResult<std::vector<uint8_t>> reply =
        config_.timeout_scope == TimeoutScope::OVERALL
            ? resilience::withRetriesAndTimeout(attempt, config_.retry, config_.timeout)
            : resilience::withPerAttemptTimeout(attempt, config_.retry, config_.timeout);

    if (!reply) {
        LOG_ERROR("CommandChannel: ", request.command, " failed: ", reply.error());
    }
    return reply;
}

} // namespace protocol
} // namespace payload_hal
