#include <gtest/gtest.h>
#include "harness/SharedInterface.hpp"
#include "harness/TestContext.hpp"
#include "harness/TestData.hpp"
#include "harness/TestRunner.hpp"
#include "transport/MockTransports.hpp"
#include <atomic>
#include <sstream>
#include <thread>

using namespace payload_hal;
using namespace payload_hal::harness;
using transport::HardwareError;
using transport::HardwareResult;
using transport::MockI2CTransport;

using I2CRunner = TestRunner<MockI2CTransport>;
using I2CInterface = SharedInterface<MockI2CTransport>;

class TestRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock = std::make_shared<MockI2CTransport>();

        I2CRunner::Config config;
        config.timeout = std::chrono::milliseconds(100);
        runner = std::make_unique<I2CRunner>(mock, config);
    }

    std::shared_ptr<MockI2CTransport> mock;
    std::unique_ptr<I2CRunner> runner;
};

TEST_F(TestRunnerTest, DefaultRetryIsSingleAttempt) {
    I2CRunner::Config config;
    EXPECT_EQ(config.retry.attempts(), 1u);
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(1000));
}

TEST_F(TestRunnerTest, PassedWhenNoErrors) {
    auto result = runner->runTest("initialize", [](I2CInterface iface) {
        return iface.lock()->initialize();
    });

    EXPECT_EQ(result.name, "initialize");
    EXPECT_EQ(result.status, TestStatus::passed());
    EXPECT_EQ(result.error_count, 0u);
    EXPECT_EQ(result.warning_count, 0u);
}

TEST_F(TestRunnerTest, ErrorWhenTestFunctionFails) {
    auto result = runner->runTest("uninitialized_read", [](I2CInterface iface) -> HardwareResult<void> {
        uint8_t buffer[2];
        auto read = iface.lock()->read(buffer, 2, std::chrono::milliseconds(10));
        if (!read) return read.error();
        return {};
    });

    EXPECT_EQ(result.status.kind(), TestStatus::Kind::ERROR);
    EXPECT_EQ(result.status.reason(), "Test failed: Device not initialized");
}

TEST_F(TestRunnerTest, FailedWhenStatusReportsErrors) {
    mock->expectRead().fails(HardwareError::communication("nak"));

    auto result = runner->runTest("tolerant_read", [](I2CInterface iface) -> HardwareResult<void> {
        auto guard = iface.lock();
        auto initialized = guard->initialize();
        if (!initialized) return initialized;

        uint8_t buffer[2];
        auto read = guard->read(buffer, 2, std::chrono::milliseconds(10));
        (void)read;  // the test tolerates the failure, the status does not
        return {};
    });

    EXPECT_EQ(result.status, TestStatus::failed("1 errors reported"));
    EXPECT_EQ(result.error_count, 1u);
}

TEST_F(TestRunnerTest, TimeoutIsError) {
    auto result = runner->runTest("hang", [](I2CInterface) -> HardwareResult<void> {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return {};
    });

    EXPECT_EQ(result.status, TestStatus::error("Test failed: Operation timed out"));
    EXPECT_LT(result.duration.count(), 190);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
}

TEST_F(TestRunnerTest, SkipTest) {
    auto result = runner->skipTest("dma", "not supported");

    EXPECT_EQ(result.status, TestStatus::skipped("not supported"));
    EXPECT_EQ(result.duration.count(), 0);
}

TEST_F(TestRunnerTest, SuiteRunsInOrderAndTotals) {
    std::vector<std::string> order;

    std::vector<I2CRunner::TestCase> cases = {
        {"initialize", [&order](I2CInterface iface) {
            order.push_back("initialize");
            return iface.lock()->initialize();
        }, std::nullopt},
        I2CRunner::TestCase::skipped("eeprom_dump", "no eeprom fitted"),
        {"deinitialize", [&order](I2CInterface iface) {
            order.push_back("deinitialize");
            return iface.lock()->deinitialize();
        }, std::nullopt},
    };

    auto suite = runner->runTestSuite("i2c_suite", cases);

    EXPECT_EQ(suite.name, "i2c_suite");
    EXPECT_EQ(suite.total_tests, 3u);
    EXPECT_EQ(suite.passed_tests, 2u);
    EXPECT_EQ(suite.skipped_tests, 1u);
    EXPECT_EQ(suite.failed_tests, 0u);
    EXPECT_EQ(suite.error_tests, 0u);
    EXPECT_TRUE(suite.allPassed());

    ASSERT_EQ(suite.results.size(), 3u);
    EXPECT_EQ(suite.results[0].name, "initialize");
    EXPECT_EQ(suite.results[1].name, "eeprom_dump");
    EXPECT_EQ(suite.results[2].name, "deinitialize");
    EXPECT_EQ(order, (std::vector<std::string>{"initialize", "deinitialize"}));
}

TEST_F(TestRunnerTest, ReportLayout) {
    TestResult result;
    result.name = "loopback";
    result.status = TestStatus::failed("2 errors reported");
    result.duration = std::chrono::milliseconds(12);
    result.error_count = 2;

    std::ostringstream oss;
    oss << result;
    EXPECT_EQ(oss.str(),
              "Test: loopback\n"
              "Status: Failed(\"2 errors reported\")\n"
              "Duration: 12ms\n"
              "Errors: 2\n"
              "Warnings: 0\n");

    TestSuiteResult suite;
    suite.name = "bus";
    suite.add(result);

    std::ostringstream suite_oss;
    suite_oss << suite;
    EXPECT_NE(suite_oss.str().find("Test Suite: bus\nTotal Tests: 1\nPassed: 0\nFailed: 1\n"),
              std::string::npos);
    EXPECT_NE(suite_oss.str().find("Results:\nTest: loopback\n"), std::string::npos);
}

class SharedInterfaceTest : public ::testing::Test {};

TEST_F(SharedInterfaceTest, LockIsExclusive) {
    I2CInterface shared(std::make_shared<MockI2CTransport>());
    std::atomic<bool> acquired{false};

    std::thread waiter;
    {
        auto guard = shared.lock();
        waiter = std::thread([shared, &acquired]() {
            auto inner = shared.lock();
            acquired = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        EXPECT_FALSE(acquired.load());
    }
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(SharedInterfaceTest, CopiesShareInterface) {
    auto mock = std::make_shared<MockI2CTransport>();
    I2CInterface first(mock);
    I2CInterface second = first;

    EXPECT_EQ(first.get(), second.get());
    EXPECT_TRUE(second.lock()->initialize());
    EXPECT_TRUE(first.lock()->isInitialized());
}

TEST_F(SharedInterfaceTest, NullInterfaceThrows) {
    EXPECT_THROW(I2CInterface shared(nullptr), std::invalid_argument);
}

class TestContextTest : public ::testing::Test {};

TEST_F(TestContextTest, SetupAndTeardown) {
    auto mock = std::make_shared<MockI2CTransport>();
    TestContext<MockI2CTransport> context(mock);

    ASSERT_TRUE(context.setup());
    EXPECT_TRUE(context.getStatus().initialized);

    ASSERT_TRUE(context.teardown());
    EXPECT_FALSE(context.getStatus().initialized);
    EXPECT_EQ(mock->openCount(), 1u);
    EXPECT_EQ(mock->closeCount(), 1u);
}

TEST_F(TestContextTest, SetupFailurePropagates) {
    auto mock = std::make_shared<MockI2CTransport>();
    mock->expectOpen().fails(HardwareError::deviceNotFound());
    TestContext<MockI2CTransport> context(mock);

    auto result = context.setup();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), HardwareError::deviceNotFound());
    EXPECT_EQ(context.getStatus().error_count, 1u);
}

TEST_F(TestContextTest, SetupTimesOut) {
    auto mock = std::make_shared<MockI2CTransport>();
    mock->expectOpen().after(std::chrono::milliseconds(150));

    TestContext<MockI2CTransport>::Config config;
    config.timeout = std::chrono::milliseconds(30);
    TestContext<MockI2CTransport> context(mock, config);

    auto result = context.setup();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), HardwareError::timeout());

    // Blocks on the interface lock until the abandoned open completes
    EXPECT_TRUE(context.getStatus().initialized);
    EXPECT_EQ(mock->openCount(), 1u);
}

TEST_F(TestContextTest, SetupRetriesTransientOpenFailure) {
    auto mock = std::make_shared<MockI2CTransport>();
    mock->expectOpen().fails(HardwareError::communication("bus busy"));

    TestContext<MockI2CTransport>::Config config;
    config.retry = {2, std::chrono::milliseconds(0)};
    TestContext<MockI2CTransport> context(mock, config);

    ASSERT_TRUE(context.setup());
    EXPECT_EQ(mock->openCount(), 2u);
    EXPECT_EQ(context.getStatus().error_count, 1u);
}

class TestDataTest : public ::testing::Test {};

TEST_F(TestDataTest, CountingPattern) {
    auto data = createTestData(5);
    EXPECT_EQ(data, (std::vector<uint8_t>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(verifyTestData(data));

    data[3] = 0xFF;
    EXPECT_FALSE(verifyTestData(data));
}

TEST_F(TestDataTest, PatternWraps) {
    auto data = createTestData(300);
    EXPECT_EQ(data[256], 0);
    EXPECT_EQ(data[299], 43);
    EXPECT_TRUE(verifyTestData(data));
}
