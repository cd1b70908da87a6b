#include <gtest/gtest.h>
#include "driver/EmagDevice.hpp"
#include "transport/MockTransports.hpp"
#include <memory>
#include <stdexcept>

using namespace payload_hal;
using namespace payload_hal::driver;
using protocol::Axis;
using protocol::EmagProtocol;
using transport::HardwareError;

class EmagDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock = std::make_shared<transport::MockI2CTransport>();

        // Keep the tests fast; the production channel paces at 60 ms
        auto config = EmagDevice::defaultConfig();
        config.inter_command_delay = std::chrono::milliseconds(0);
        emag = std::make_unique<EmagDevice>(mock, config);

        ASSERT_TRUE(emag->initialize());
    }

    void TearDown() override {
        EXPECT_TRUE(mock->verify());
    }

    std::shared_ptr<transport::MockI2CTransport> mock;
    std::unique_ptr<EmagDevice> emag;
};

TEST_F(EmagDeviceTest, DefaultConfigMatchesFirmwareTiming) {
    auto config = EmagDevice::defaultConfig();

    EXPECT_EQ(config.inter_command_delay, std::chrono::milliseconds(60));
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(50));
    EXPECT_EQ(config.retry.attempts(), 1u);
}

TEST_F(EmagDeviceTest, GetSystemStatus) {
    mock->expectTransfer()
        .withTx({0x01, 0x00})
        .withRxLength(20)
        .returns({
            0x00, 0x00, 0x80, 0x3F,
            0x00, 0x00, 0x00, 0x40,
            0x00, 0x00, 0x40, 0x40,
            0x00, 0x00, 0x80, 0x40,
            0x00, 0x00, 0x40, 0x41,
        });

    EXPECT_FALSE(emag->lastSystemStatus().has_value());

    auto status = emag->getSystemStatus();
    ASSERT_TRUE(status);
    EXPECT_FLOAT_EQ(status.value().sys_current, 1.0f);
    EXPECT_FLOAT_EQ(status.value().x_hall, 2.0f);
    EXPECT_FLOAT_EQ(status.value().y_hall, 3.0f);
    EXPECT_FLOAT_EQ(status.value().z_hall, 4.0f);
    EXPECT_FLOAT_EQ(status.value().cap_volt, 12.0f);

    ASSERT_TRUE(emag->lastSystemStatus().has_value());
    EXPECT_FLOAT_EQ(emag->lastSystemStatus()->cap_volt, 12.0f);
}

TEST_F(EmagDeviceTest, TruncatedStatusIsError) {
    mock->expectTransfer().returns(std::vector<uint8_t>(12, 0x00));

    auto status = emag->getSystemStatus();
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
    EXPECT_FALSE(emag->lastSystemStatus().has_value());
}

TEST_F(EmagDeviceTest, SetChargeVoltage) {
    mock->expectTransfer().withTx({0x02, 80}).withRxLength(2).returns({0x00, 0x50});

    auto charge = emag->setChargeVoltage(80);
    ASSERT_TRUE(charge);
    EXPECT_EQ(charge.value(), 80);
}

TEST_F(EmagDeviceTest, ChargeAboveHundredPercentRejected) {
    int callbacks = 0;
    emag->setErrorCallback([&callbacks](const HardwareError& error, const std::string&) {
        EXPECT_EQ(error.kind(), HardwareError::Kind::INVALID_PARAMETER);
        ++callbacks;
    });

    auto charge = emag->setChargeVoltage(150);
    ASSERT_FALSE(charge);
    EXPECT_EQ(charge.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
    EXPECT_EQ(callbacks, 1);
    EXPECT_EQ(mock->callCount(transport::MockOperation::TRANSFER), 0u);
}

TEST_F(EmagDeviceTest, ActuateSendsAxisByte) {
    mock->expectTransfer().withTx({0x03, 0b1000}).withRxLength(1).returns({0x01});

    EXPECT_TRUE(emag->actuate(Axis::Z_PLUS));
}

TEST_F(EmagDeviceTest, WipeSendsAxisByte) {
    mock->expectTransfer().withTx({0x04, 0b0001}).withRxLength(1).returns({0x01});

    EXPECT_TRUE(emag->wipe(Axis::X_MINUS));
}

TEST_F(EmagDeviceTest, WrongAcknowledgeIsError) {
    mock->expectTransfer().returns({0x00});

    auto result = emag->actuate(Axis::Y_PLUS);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
}

TEST_F(EmagDeviceTest, ActuateNotRetried) {
    mock->expectTransfer().fails(HardwareError::communication("arbitration lost"));

    auto result = emag->actuate(Axis::Z_MINUS);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), HardwareError::Kind::COMMUNICATION_ERROR);
    EXPECT_EQ(mock->callCount(transport::MockOperation::TRANSFER), 1u);
    EXPECT_EQ(emag->getStatus().error_count, 1u);
}

TEST_F(EmagDeviceTest, DeinitializedDeviceRejectsCommands) {
    ASSERT_TRUE(emag->deinitialize());

    auto result = emag->wipe(Axis::X_PLUS);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), HardwareError::Kind::NOT_INITIALIZED);
}

TEST(EmagDeviceConstructionTest, NullTransportThrows) {
    std::shared_ptr<transport::IBidirectional> none;
    EXPECT_THROW(EmagDevice device(none), std::invalid_argument);
}

TEST(EmagDevicePacingTest, DefaultPacingDelaysCommands) {
    auto mock = std::make_shared<transport::MockI2CTransport>();
    EmagDevice emag(mock);
    ASSERT_TRUE(emag.initialize());

    mock->expectTransfer().times(2).returns({0x01});

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(emag.actuate(Axis::X_PLUS));
    ASSERT_TRUE(emag.actuate(Axis::X_PLUS));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_GE(elapsed.count(), 120);
    EXPECT_EQ(emag.commandsSent(), 2u);
}
