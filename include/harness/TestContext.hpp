#pragma once

#include "harness/SharedInterface.hpp"
#include "resilience/Resilience.hpp"
#include "transport/ITransport.hpp"

#include <chrono>
#include <memory>

namespace payload_hal {
namespace harness {

/**
 * @brief Setup/teardown wrapper around a shared interface
 *
 * setup() and teardown() run under the context's timeout and retry
 * policy, each attempt with its own deadline. A timed-out transition is
 * abandoned, not rolled back: it finishes under the interface lock.
 */
template<typename T>
class TestContext {
public:
    struct Config {
        std::chrono::milliseconds timeout{1000};
        resilience::RetryPolicy retry{1, std::chrono::milliseconds{100}};
    };

    TestContext(std::shared_ptr<T> interface, const Config& config)
        : interface_(std::move(interface))
        , config_(config) {
    }

    explicit TestContext(std::shared_ptr<T> interface)
        : TestContext(std::move(interface), Config{}) {
    }

    transport::HardwareResult<void> setup() {
        auto shared = interface_;
        return resilience::withPerAttemptTimeout(
            [shared]() { return shared.lock()->initialize(); },
            config_.retry, config_.timeout);
    }

    transport::HardwareResult<void> teardown() {
        auto shared = interface_;
        return resilience::withPerAttemptTimeout(
            [shared]() { return shared.lock()->deinitialize(); },
            config_.retry, config_.timeout);
    }

    transport::InterfaceStatus getStatus() const {
        return interface_.lock()->getStatus();
    }

    SharedInterface<T>& interface() { return interface_; }
    const Config& getConfig() const { return config_; }

private:
    SharedInterface<T> interface_;
    Config config_;
};

} // namespace harness
} // namespace payload_hal
