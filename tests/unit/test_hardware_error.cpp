#include <gtest/gtest.h>
#include "transport/HardwareError.hpp"
#include "transport/SystemError.hpp"
#include <cerrno>
#include <sstream>

using namespace payload_hal::transport;

class HardwareErrorTest : public ::testing::Test {};

TEST_F(HardwareErrorTest, DescriptionText) {
    EXPECT_EQ(HardwareError::communication("bus stuck").toString(), "Communication error: bus stuck");
    EXPECT_EQ(HardwareError::timeout().toString(), "Operation timed out");
    EXPECT_EQ(HardwareError::invalidParameter("mode 4").toString(), "Invalid parameter: mode 4");
    EXPECT_EQ(HardwareError::deviceNotFound().toString(), "Device not found");
    EXPECT_EQ(HardwareError::permissionDenied().toString(), "Permission denied");
    EXPECT_EQ(HardwareError::notInitialized().toString(), "Device not initialized");
    EXPECT_EQ(HardwareError::alreadyInitialized().toString(), "Device already initialized");
    EXPECT_EQ(HardwareError::operationFailed("nak").toString(), "Operation failed: nak");
}

TEST_F(HardwareErrorTest, Classification) {
    EXPECT_TRUE(HardwareError::notInitialized().isUsageError());
    EXPECT_TRUE(HardwareError::alreadyInitialized().isUsageError());
    EXPECT_TRUE(HardwareError::invalidParameter("x").isUsageError());

    EXPECT_TRUE(HardwareError::deviceNotFound().isEnvironmentError());
    EXPECT_TRUE(HardwareError::permissionDenied().isEnvironmentError());

    EXPECT_TRUE(HardwareError::communication("x").isTransient());
    EXPECT_TRUE(HardwareError::timeout().isTransient());
    EXPECT_TRUE(HardwareError::operationFailed("x").isTransient());

    EXPECT_FALSE(HardwareError::invalidParameter("x").isTransient());
    EXPECT_FALSE(HardwareError::deviceNotFound().isTransient());
    EXPECT_FALSE(HardwareError::timeout().isUsageError());
}

TEST_F(HardwareErrorTest, Equality) {
    EXPECT_EQ(HardwareError::timeout(), HardwareError::timeout());
    EXPECT_NE(HardwareError::communication("a"), HardwareError::communication("b"));
    EXPECT_NE(HardwareError::timeout(), HardwareError::deviceNotFound());
}

TEST_F(HardwareErrorTest, StreamIncludesKind) {
    std::ostringstream oss;
    oss << HardwareError::invalidParameter("mode 4");
    EXPECT_EQ(oss.str(), "InvalidParameter (Invalid parameter: mode 4)");
}

TEST_F(HardwareErrorTest, ResultCarriesValueOrError) {
    HardwareResult<int> good = 42;
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), 42);
    EXPECT_EQ(good.valueOr(7), 42);

    HardwareResult<int> bad = HardwareError::timeout();
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind(), HardwareError::Kind::TIMEOUT_ERROR);
    EXPECT_EQ(bad.valueOr(7), 7);

    HardwareResult<void> done;
    EXPECT_TRUE(done.ok());

    HardwareResult<void> failed = HardwareError::notInitialized();
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error(), HardwareError::notInitialized());
}

TEST_F(HardwareErrorTest, ErrnoMapping) {
    EXPECT_EQ(errnoToHardwareError(ENOENT, "open").kind(), HardwareError::Kind::DEVICE_NOT_FOUND);
    EXPECT_EQ(errnoToHardwareError(ENODEV, "open").kind(), HardwareError::Kind::DEVICE_NOT_FOUND);
    EXPECT_EQ(errnoToHardwareError(ENXIO, "open").kind(), HardwareError::Kind::DEVICE_NOT_FOUND);
    EXPECT_EQ(errnoToHardwareError(EACCES, "open").kind(), HardwareError::Kind::PERMISSION_DENIED);
    EXPECT_EQ(errnoToHardwareError(EPERM, "open").kind(), HardwareError::Kind::PERMISSION_DENIED);
    EXPECT_EQ(errnoToHardwareError(ETIMEDOUT, "read").kind(), HardwareError::Kind::TIMEOUT_ERROR);
    EXPECT_EQ(errnoToHardwareError(EINVAL, "ioctl").kind(), HardwareError::Kind::INVALID_PARAMETER);

    auto io = errnoToHardwareError(EIO, "write");
    EXPECT_EQ(io.kind(), HardwareError::Kind::COMMUNICATION_ERROR);
    EXPECT_NE(io.reason().find("write"), std::string::npos);
}
