#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace payload_hal {
namespace harness {

/**
 * @brief Outcome of one hardware test
 *
 * FAILED means the test ran but the interface reported errors;
 * ERROR means the test function itself returned an error.
 */
class TestStatus {
public:
    enum class Kind {
        PASSED,
        FAILED,
        SKIPPED,
        ERROR
    };

    static TestStatus passed() { return TestStatus(Kind::PASSED, ""); }
    static TestStatus failed(std::string reason) { return TestStatus(Kind::FAILED, std::move(reason)); }
    static TestStatus skipped(std::string reason) { return TestStatus(Kind::SKIPPED, std::move(reason)); }
    static TestStatus error(std::string reason) { return TestStatus(Kind::ERROR, std::move(reason)); }

    Kind kind() const { return kind_; }
    const std::string& reason() const { return reason_; }

    bool operator==(const TestStatus& other) const {
        return kind_ == other.kind_ && reason_ == other.reason_;
    }
    bool operator!=(const TestStatus& other) const { return !(*this == other); }

private:
    TestStatus(Kind kind, std::string reason) : kind_(kind), reason_(std::move(reason)) {}

    Kind kind_;
    std::string reason_;
};

struct TestResult {
    std::string name;
    TestStatus status = TestStatus::passed();
    std::chrono::milliseconds duration{0};
    uint32_t error_count = 0;
    uint32_t warning_count = 0;
};

struct TestSuiteResult {
    std::string name;
    std::vector<TestResult> results;
    size_t total_tests = 0;
    size_t passed_tests = 0;
    size_t failed_tests = 0;
    size_t skipped_tests = 0;
    size_t error_tests = 0;
    std::chrono::milliseconds total_duration{0};

    /**
     * @brief Append a result and update the totals
     */
    void add(TestResult result);

    bool allPassed() const { return failed_tests == 0 && error_tests == 0; }
};

const char* statusKindToString(TestStatus::Kind kind);

std::ostream& operator<<(std::ostream& os, const TestStatus& status);
std::ostream& operator<<(std::ostream& os, const TestResult& result);
std::ostream& operator<<(std::ostream& os, const TestSuiteResult& suite);

} // namespace harness
} // namespace payload_hal
