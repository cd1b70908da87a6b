#include "harness/TestResult.hpp"

namespace payload_hal {
namespace harness {

void TestSuiteResult::add(TestResult result) {
    switch (result.status.kind()) {
        case TestStatus::Kind::PASSED:  ++passed_tests; break;
        case TestStatus::Kind::FAILED:  ++failed_tests; break;
        case TestStatus::Kind::SKIPPED: ++skipped_tests; break;
        case TestStatus::Kind::ERROR:   ++error_tests; break;
    }
    results.push_back(std::move(result));
    total_tests = results.size();
}

const char* statusKindToString(TestStatus::Kind kind) {
    switch (kind) {
        case TestStatus::Kind::PASSED:  return "Passed";
        case TestStatus::Kind::FAILED:  return "Failed";
        case TestStatus::Kind::SKIPPED: return "Skipped";
        case TestStatus::Kind::ERROR:   return "Error";
        default: return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const TestStatus& status) {
    os << statusKindToString(status.kind());
    if (status.kind() != TestStatus::Kind::PASSED) {
        os << "(\"" << status.reason() << "\")";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const TestResult& result) {
    return os << "Test: " << result.name << "\n"
              << "Status: " << result.status << "\n"
              << "Duration: " << result.duration.count() << "ms\n"
              << "Errors: " << result.error_count << "\n"
              << "Warnings: " << result.warning_count << "\n";
}

std::ostream& operator<<(std::ostream& os, const TestSuiteResult& suite) {
    os << "Test Suite: " << suite.name << "\n"
       << "Total Tests: " << suite.total_tests << "\n"
       << "Passed: " << suite.passed_tests << "\n"
       << "Failed: " << suite.failed_tests << "\n"
       << "Skipped: " << suite.skipped_tests << "\n"
       << "Errors: " << suite.error_tests << "\n"
       << "Total Duration: " << suite.total_duration.count() << "ms\n"
       << "\nResults:\n";

    for (const auto& result : suite.results) {
        os << result;
    }
    return os;
}

} // namespace harness
} // namespace payload_hal
