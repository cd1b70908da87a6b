#pragma once

#include "transport/HardwareError.hpp"
#include "transport/TransportBase.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <thread>

namespace payload_hal {
namespace resilience {

/**
 * @brief How many times to attempt an operation and how long to wait between attempts
 *
 * retry_count includes the first attempt; 0 is treated as 1.
 */
struct RetryPolicy {
    uint32_t retry_count{3};
    std::chrono::milliseconds retry_delay{100};

    static RetryPolicy fromParams(const transport::InterfaceParams& params) {
        return RetryPolicy{params.retry_count, params.retry_delay};
    }

    uint32_t attempts() const { return std::max<uint32_t>(retry_count, 1); }
};

/**
 * @brief Run operation, giving up after timeout
 *
 * The operation runs on a detached worker thread. If it has not finished
 * by the deadline the caller gets TimeoutError and the eventual result is
 * discarded; the worker keeps running to completion. Anything the
 * operation touches must therefore be owned by its captures (capture
 * shared_ptrs by value, never raw references to the caller's stack).
 *
 * A non-positive timeout disables the deadline and runs inline.
 *
 * @tparam Operation Callable returning transport::HardwareResult<T>
 */
template<typename Operation>
auto withTimeout(Operation operation, std::chrono::milliseconds timeout) -> decltype(operation()) {
    using ResultType = decltype(operation());

    if (timeout.count() <= 0) {
        return operation();
    }

    auto promise = std::make_shared<std::promise<ResultType>>();
    auto future = promise->get_future();

    std::thread([promise, operation]() mutable {
        try {
            promise->set_value(operation());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("Resilience: Operation abandoned after ", timeout.count(), " ms");
        return transport::HardwareError::timeout();
    }
    return future.get();
}

/**
 * @brief Run operation until it succeeds or the policy is exhausted
 *
 * Only transient errors (communication, timeout, operation failed) are
 * retried. Usage and environment errors return immediately. The last
 * error is returned when every attempt fails.
 */
template<typename Operation>
auto withRetries(Operation operation, const RetryPolicy& policy) -> decltype(operation()) {
    const uint32_t attempts = policy.attempts();

    for (uint32_t attempt = 1; ; ++attempt) {
        auto result = operation();
        if (result) {
            if (attempt > 1) {
                LOG_DEBUG("Resilience: Succeeded on attempt ", attempt, "/", attempts);
            }
            return result;
        }

        if (!result.error().isTransient()) {
            return result;
        }

        if (attempt >= attempts) {
            LOG_WARN("Resilience: Giving up after ", attempts, " attempts: ", result.error());
            return result;
        }

        LOG_DEBUG("Resilience: Attempt ", attempt, "/", attempts, " failed (",
                  result.error(), "), retrying in ", policy.retry_delay.count(), " ms");
        std::this_thread::sleep_for(policy.retry_delay);
    }
}

/**
 * @brief Retries bounded by one overall deadline
 *
 * The retry loop runs on the calling thread; each attempt gets whatever
 * is left of the budget. Once the deadline passes no further attempt is
 * started, so at most the one attempt that was in flight at expiry keeps
 * running after the caller has its TimeoutError. A retry whose delay
 * would end past the deadline is not started either.
 */
template<typename Operation>
auto withRetriesAndTimeout(Operation operation, const RetryPolicy& policy,
                           std::chrono::milliseconds timeout) -> decltype(operation()) {
    if (timeout.count() <= 0) {
        return withRetries(operation, policy);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const uint32_t attempts = policy.attempts();

    auto remaining = [deadline]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    };

    for (uint32_t attempt = 1; ; ++attempt) {
        const auto budget = remaining();
        if (budget.count() <= 0) {
            LOG_WARN("Resilience: Deadline of ", timeout.count(), " ms reached before attempt ",
                     attempt, "/", attempts);
            return transport::HardwareError::timeout();
        }

        auto result = withTimeout(operation, budget);
        if (result || !result.error().isTransient() || attempt >= attempts) {
            return result;
        }

        if (policy.retry_delay >= remaining()) {
            LOG_WARN("Resilience: No time left for attempt ", attempt + 1, "/", attempts,
                     " within ", timeout.count(), " ms: ", result.error());
            return transport::HardwareError::timeout();
        }

        LOG_DEBUG("Resilience: Attempt ", attempt, "/", attempts, " failed (",
                  result.error(), "), retrying in ", policy.retry_delay.count(), " ms");
        std::this_thread::sleep_for(policy.retry_delay);
    }
}

/**
 * @brief Retries where each attempt gets its own deadline
 */
template<typename Operation>
auto withPerAttemptTimeout(Operation operation, const RetryPolicy& policy,
                           std::chrono::milliseconds timeout) -> decltype(operation()) {
    return withRetries([operation, timeout]() { return withTimeout(operation, timeout); }, policy);
}

} // namespace resilience
} // namespace payload_hal
