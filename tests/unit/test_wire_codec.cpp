#include <gtest/gtest.h>
#include "protocol/Command.hpp"
#include "protocol/WireCodec.hpp"

using namespace payload_hal::protocol;
using payload_hal::transport::HardwareError;

class WireCodecTest : public ::testing::Test {};

TEST_F(WireCodecTest, FloatFromLittleEndianBytes) {
    std::vector<uint8_t> reply = {0x00, 0x00, 0x80, 0x3F};

    auto fields = WireCodec::decodeFloatFields(reply, 1);
    ASSERT_TRUE(fields);
    EXPECT_FLOAT_EQ(fields.value()[0], 1.0f);
}

TEST_F(WireCodecTest, FloatFieldsInOrder) {
    std::vector<uint8_t> reply = {
        0x00, 0x00, 0x80, 0x3F,   // 1.0
        0x00, 0x00, 0x00, 0xC0,   // -2.0
        0x00, 0x00, 0x00, 0x00,   // 0.0
    };

    auto fields = WireCodec::decodeFloatFields(reply, 3);
    ASSERT_TRUE(fields);
    EXPECT_FLOAT_EQ(fields.value()[0], 1.0f);
    EXPECT_FLOAT_EQ(fields.value()[1], -2.0f);
    EXPECT_FLOAT_EQ(fields.value()[2], 0.0f);
}

TEST_F(WireCodecTest, FloatFieldsExactLength) {
    std::vector<uint8_t> short_reply(19, 0x00);
    auto fields = WireCodec::decodeFloatFields(short_reply, 5);

    ASSERT_FALSE(fields);
    EXPECT_EQ(fields.error().kind(), HardwareError::Kind::INVALID_PARAMETER);

    std::vector<uint8_t> long_reply(21, 0x00);
    EXPECT_FALSE(WireCodec::decodeFloatFields(long_reply, 5));
}

TEST_F(WireCodecTest, EncodeFloatFields) {
    auto bytes = WireCodec::encodeFloatFields({1.0f});
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x00, 0x00, 0x80, 0x3F}));
}

TEST_F(WireCodecTest, Uint32LittleEndian) {
    uint8_t data[] = {0x78, 0x56, 0x34, 0x12};
    EXPECT_EQ(WireCodec::readUint32LE(data), 0x12345678u);
}

TEST_F(WireCodecTest, Uint16BigEndian) {
    auto value = WireCodec::decodeUint16BE({0x01, 0x2C});
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value(), 300);

    EXPECT_FALSE(WireCodec::decodeUint16BE({0x01}));
    EXPECT_FALSE(WireCodec::decodeUint16BE({0x01, 0x02, 0x03}));
    EXPECT_EQ(WireCodec::encodeUint16BE(300), (std::vector<uint8_t>{0x01, 0x2C}));
}

TEST_F(WireCodecTest, AcknowledgeMustBeExactlyOneSentinel) {
    EXPECT_TRUE(WireCodec::decodeAcknowledge({0x01}));

    auto wrong_value = WireCodec::decodeAcknowledge({0x00});
    ASSERT_FALSE(wrong_value);
    EXPECT_EQ(wrong_value.error().kind(), HardwareError::Kind::INVALID_PARAMETER);

    EXPECT_FALSE(WireCodec::decodeAcknowledge({}));
    EXPECT_FALSE(WireCodec::decodeAcknowledge({0x01, 0x01}));
    EXPECT_FALSE(WireCodec::decodeAcknowledge({0xFF}));
}

TEST_F(WireCodecTest, BitFields) {
    uint8_t byte = 0;
    byte = WireCodec::packField(byte, 0x02, 2, 2);
    byte = WireCodec::packField(byte, 0x01, 0, 2);
    EXPECT_EQ(byte, 0b1001);

    EXPECT_EQ(WireCodec::extractField(byte, 2, 2), 0x02);
    EXPECT_EQ(WireCodec::extractField(byte, 0, 2), 0x01);

    // Oversized values are masked to the field
    EXPECT_EQ(WireCodec::packField(0, 0x07, 2, 2), 0b1100);
    // Neighbouring bits are preserved
    EXPECT_EQ(WireCodec::packField(0xFF, 0x00, 2, 2), 0xF3);
}

TEST_F(WireCodecTest, CommandSerialize) {
    Command command;
    command.opcode = 0x03;
    command.payload = {0x08};

    EXPECT_EQ(command.serialize(), (std::vector<uint8_t>{0x03, 0x08}));

    Command bare;
    bare.opcode = 0x7E;
    EXPECT_EQ(bare.serialize(), (std::vector<uint8_t>{0x7E}));
}
