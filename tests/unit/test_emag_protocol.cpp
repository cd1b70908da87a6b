#include <gtest/gtest.h>
#include "protocol/EmagProtocol.hpp"
#include <sstream>

using namespace payload_hal::protocol;
using payload_hal::transport::HardwareError;

class EmagProtocolTest : public ::testing::Test {};

TEST_F(EmagProtocolTest, AxisBitPatterns) {
    EXPECT_EQ(encodeAxis(Axis::X_PLUS), 0b0000);
    EXPECT_EQ(encodeAxis(Axis::X_MINUS), 0b0001);
    EXPECT_EQ(encodeAxis(Axis::Y_PLUS), 0b0100);
    EXPECT_EQ(encodeAxis(Axis::Y_MINUS), 0b0101);
    EXPECT_EQ(encodeAxis(Axis::Z_PLUS), 0b1000);
    EXPECT_EQ(encodeAxis(Axis::Z_MINUS), 0b1001);
}

TEST_F(EmagProtocolTest, AxisDecode) {
    auto axis = decodeAxis(0b1000);
    ASSERT_TRUE(axis);
    EXPECT_EQ(axis.value(), Axis::Z_PLUS);

    for (auto candidate : {Axis::X_PLUS, Axis::Y_PLUS, Axis::Z_PLUS,
                           Axis::X_MINUS, Axis::Y_MINUS, Axis::Z_MINUS}) {
        auto decoded = decodeAxis(encodeAxis(candidate));
        ASSERT_TRUE(decoded);
        EXPECT_EQ(decoded.value(), candidate);
    }
}

TEST_F(EmagProtocolTest, AxisDecodeRejectsUnknownPatterns) {
    EXPECT_FALSE(decodeAxis(0b1100));   // channel 3
    EXPECT_FALSE(decodeAxis(0b0010));   // polarity 2
    EXPECT_FALSE(decodeAxis(0x18));     // high bits set

    auto error = decodeAxis(0xFF);
    ASSERT_FALSE(error);
    EXPECT_EQ(error.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
}

TEST_F(EmagProtocolTest, AxisNames) {
    EXPECT_STREQ(axisName(Axis::Z_PLUS), "Z_plus");
    EXPECT_STREQ(axisName(Axis::X_MINUS), "X_minus");

    auto parsed = parseAxis("Y_minus");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value(), Axis::Y_MINUS);
    EXPECT_FALSE(parseAxis("W_plus"));

    std::ostringstream oss;
    oss << Axis::Y_PLUS;
    EXPECT_EQ(oss.str(), "Y_plus");
}

TEST_F(EmagProtocolTest, SystemStatusRequest) {
    auto request = EmagProtocol::createSystemStatusRequest();

    EXPECT_EQ(request.command.serialize(), (std::vector<uint8_t>{0x01, 0x00}));
    EXPECT_EQ(request.response_length, 20u);
}

TEST_F(EmagProtocolTest, ChargeVoltageRequest) {
    auto request = EmagProtocol::createChargeVoltageRequest(75);
    ASSERT_TRUE(request);
    EXPECT_EQ(request.value().command.serialize(), (std::vector<uint8_t>{0x02, 75}));
    EXPECT_EQ(request.value().response_length, 2u);

    EXPECT_TRUE(EmagProtocol::createChargeVoltageRequest(0));
    EXPECT_TRUE(EmagProtocol::createChargeVoltageRequest(100));

    auto rejected = EmagProtocol::createChargeVoltageRequest(101);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
}

TEST_F(EmagProtocolTest, ActuateAndWipeRequests) {
    auto actuate = EmagProtocol::createActuateRequest(Axis::Z_PLUS);
    EXPECT_EQ(actuate.command.serialize(), (std::vector<uint8_t>{0x03, 0x08}));
    EXPECT_EQ(actuate.response_length, 1u);

    auto wipe = EmagProtocol::createWipeRequest(Axis::Y_MINUS);
    EXPECT_EQ(wipe.command.serialize(), (std::vector<uint8_t>{0x04, 0x05}));
    EXPECT_EQ(wipe.response_length, 1u);
}

TEST_F(EmagProtocolTest, ParseSystemStatus) {
    std::vector<uint8_t> reply = {
        0x00, 0x00, 0x80, 0x3F,   // sys_current 1.0
        0x00, 0x00, 0x00, 0x40,   // x_hall 2.0
        0x00, 0x00, 0x40, 0x40,   // y_hall 3.0
        0x00, 0x00, 0x80, 0x40,   // z_hall 4.0
        0x00, 0x00, 0x40, 0x41,   // cap_volt 12.0
    };

    auto status = EmagProtocol::parseSystemStatus(reply);
    ASSERT_TRUE(status);
    EXPECT_FLOAT_EQ(status.value().sys_current, 1.0f);
    EXPECT_FLOAT_EQ(status.value().x_hall, 2.0f);
    EXPECT_FLOAT_EQ(status.value().y_hall, 3.0f);
    EXPECT_FLOAT_EQ(status.value().z_hall, 4.0f);
    EXPECT_FLOAT_EQ(status.value().cap_volt, 12.0f);
}

TEST_F(EmagProtocolTest, ParseSystemStatusWrongLength) {
    std::vector<uint8_t> reply(16, 0x00);
    auto status = EmagProtocol::parseSystemStatus(reply);

    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().kind(), HardwareError::Kind::INVALID_PARAMETER);
}

TEST_F(EmagProtocolTest, EncodedStatusParsesBack) {
    SystemStatus original;
    original.sys_current = 0.25f;
    original.cap_volt = 11.5f;

    auto reply = EmagProtocol::encodeSystemStatus(original);
    ASSERT_EQ(reply.size(), EmagProtocol::SYSTEM_STATUS_REPLY_LENGTH);

    auto parsed = EmagProtocol::parseSystemStatus(reply);
    ASSERT_TRUE(parsed);
    EXPECT_FLOAT_EQ(parsed.value().sys_current, 0.25f);
    EXPECT_FLOAT_EQ(parsed.value().cap_volt, 11.5f);
}

TEST_F(EmagProtocolTest, ParseChargeVoltage) {
    auto charge = EmagProtocol::parseChargeVoltage({0x00, 0x4B});
    ASSERT_TRUE(charge);
    EXPECT_EQ(charge.value(), 75);

    EXPECT_FALSE(EmagProtocol::parseChargeVoltage({0x4B}));
}

TEST_F(EmagProtocolTest, ParseAcknowledge) {
    EXPECT_TRUE(EmagProtocol::parseAcknowledge({0x01}));
    EXPECT_FALSE(EmagProtocol::parseAcknowledge({0x00}));
    EXPECT_FALSE(EmagProtocol::parseAcknowledge({0x01, 0x00}));
}
