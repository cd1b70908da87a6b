#pragma once

#include "harness/SharedInterface.hpp"
#include "harness/TestResult.hpp"
#include "resilience/Resilience.hpp"
#include "transport/ITransport.hpp"
#include "utils/Logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace payload_hal {
namespace harness {

/**
 * @brief Runs hardware tests against one shared interface
 *
 * A test is a function that receives the shared interface and returns
 * success or an error. After it returns the runner reads the interface
 * status: any error recorded so far turns a successful test into FAILED.
 *
 * @tparam T Interface type, must provide getStatus()
 */
template<typename T>
class TestRunner {
public:
    using TestFunction = std::function<transport::HardwareResult<void>(SharedInterface<T>)>;

    struct Config {
        std::chrono::milliseconds timeout{1000};
        resilience::RetryPolicy retry{1, std::chrono::milliseconds{100}};
    };

    struct TestCase {
        std::string name;
        TestFunction function;
        std::optional<std::string> skip_reason;

        static TestCase skipped(std::string name, std::string reason) {
            return TestCase{std::move(name), nullptr, std::move(reason)};
        }
    };

    TestRunner(SharedInterface<T> interface, const Config& config)
        : interface_(std::move(interface))
        , config_(config) {
    }

    explicit TestRunner(std::shared_ptr<T> interface)
        : TestRunner(SharedInterface<T>(std::move(interface)), Config{}) {
    }

    TestRunner(std::shared_ptr<T> interface, const Config& config)
        : TestRunner(SharedInterface<T>(std::move(interface)), config) {
    }

    /**
     * @brief Run one test under the runner's timeout and retry policy
     */
    TestResult runTest(const std::string& name, TestFunction function) {
        LOG_INFO("TestRunner: Running ", name);

        const auto start = std::chrono::steady_clock::now();
        TestResult result;
        result.name = name;

        if (!function) {
            result.status = TestStatus::error("Test failed: no test function");
            return result;
        }

        auto shared = interface_;
        auto outcome = resilience::withRetriesAndTimeout(
            [shared, function]() { return function(shared); },
            config_.retry, config_.timeout);

        if (!outcome) {
            result.status = TestStatus::error("Test failed: " + outcome.error().toString());
        } else {
            const auto status = interface_.lock()->getStatus();
            result.error_count = status.error_count;
            result.warning_count = status.warning_count;
            if (status.error_count == 0) {
                result.status = TestStatus::passed();
            } else {
                result.status = TestStatus::failed(std::to_string(status.error_count) +
                                                   " errors reported");
            }
        }

        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        LOG_INFO("TestRunner: ", name, " -> ", result.status);
        return result;
    }

    TestResult skipTest(const std::string& name, const std::string& reason) {
        LOG_INFO("TestRunner: Skipping ", name, ": ", reason);

        TestResult result;
        result.name = name;
        result.status = TestStatus::skipped(reason);
        return result;
    }

    /**
     * @brief Run cases in submission order and total the outcomes
     */
    TestSuiteResult runTestSuite(const std::string& name, const std::vector<TestCase>& cases) {
        LOG_INFO("TestRunner: Suite ", name, " (", cases.size(), " tests)");

        const auto start = std::chrono::steady_clock::now();
        TestSuiteResult suite;
        suite.name = name;

        for (const auto& test_case : cases) {
            if (test_case.skip_reason) {
                suite.add(skipTest(test_case.name, *test_case.skip_reason));
            } else {
                suite.add(runTest(test_case.name, test_case.function));
            }
        }

        suite.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return suite;
    }

    SharedInterface<T>& interface() { return interface_; }
    const Config& getConfig() const { return config_; }

private:
    SharedInterface<T> interface_;
    Config config_;
};

} // namespace harness
} // namespace payload_hal
