#include <gtest/gtest.h>
#include "transport/InterfaceState.hpp"
#include <thread>

using namespace payload_hal::transport;

class InterfaceStateTest : public ::testing::Test {
protected:
    InterfaceState state;
};

TEST_F(InterfaceStateTest, StartsClean) {
    auto status = state.toStatus();
    EXPECT_FALSE(status.initialized);
    EXPECT_EQ(status.error_count, 0u);
    EXPECT_EQ(status.warning_count, 0u);
    EXPECT_FALSE(status.last_error.has_value());
}

TEST_F(InterfaceStateTest, ErrorsAccumulate) {
    state.recordError("first");
    state.recordError("second");

    EXPECT_EQ(state.errorCount(), 2u);
    ASSERT_TRUE(state.lastError().has_value());
    EXPECT_EQ(*state.lastError(), "second");
}

TEST_F(InterfaceStateTest, ErrorsDoNotChangeLifecycle) {
    state.setInitialized(true);
    state.recordError("degraded");

    auto status = state.toStatus();
    EXPECT_TRUE(status.initialized);
    EXPECT_EQ(status.error_count, 1u);
}

TEST_F(InterfaceStateTest, WarningsCountedSeparately) {
    state.recordWarning("short read");

    EXPECT_EQ(state.warningCount(), 1u);
    EXPECT_EQ(state.errorCount(), 0u);
    EXPECT_FALSE(state.lastError().has_value());
    ASSERT_TRUE(state.lastWarning().has_value());
    EXPECT_EQ(*state.lastWarning(), "short read");
}

TEST_F(InterfaceStateTest, UptimeAdvances) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_GE(state.toStatus().uptime.count(), 20);
}
