// GemGame Protocol Tests
// byte_buffer_test.cpp - Binary writer and reader unit tests

#include <gtest/gtest.h>
#include <gemgame/protocol/byte_buffer.hpp>

#include <vector>

using namespace gemgame::protocol;

class ByteBufferTest : public ::testing::Test {
protected:
    ByteWriter writer_;
};

TEST_F(ByteBufferTest, IntegersAreLittleEndian) {
    writer_.write_u16(0x1234);
    writer_.write_u32(0xA1B2C3D4);

    const std::vector<uint8_t> expected = {0x34, 0x12, 0xD4, 0xC3, 0xB2, 0xA1};
    EXPECT_EQ(writer_.data(), expected);
}

TEST_F(ByteBufferTest, ReadsBackEveryWidth) {
    writer_.write_u8(0xFE);
    writer_.write_u16(65000);
    writer_.write_u32(4000000000u);
    writer_.write_u64(0x0123456789ABCDEFull);
    writer_.write_i32(-14);
    writer_.write_f32(0.25f);
    writer_.write_bool(true);

    ByteReader reader(writer_.data());
    EXPECT_EQ(reader.read_u8(), 0xFE);
    EXPECT_EQ(reader.read_u16(), 65000);
    EXPECT_EQ(reader.read_u32(), 4000000000u);
    EXPECT_EQ(reader.read_u64(), 0x0123456789ABCDEFull);
    EXPECT_EQ(reader.read_i32(), -14);
    EXPECT_FLOAT_EQ(reader.read_f32(), 0.25f);
    EXPECT_TRUE(reader.read_bool());
    EXPECT_TRUE(reader.ok());
    EXPECT_TRUE(reader.at_end());
}

TEST_F(ByteBufferTest, ShortReadFailsAndStaysFailed) {
    writer_.write_u16(7);

    ByteReader reader(writer_.data());
    EXPECT_EQ(reader.read_u32(), 0u);
    EXPECT_FALSE(reader.ok());

    // Later reads keep failing even if bytes would suffice
    EXPECT_EQ(reader.read_u8(), 0);
    EXPECT_FALSE(reader.ok());
    EXPECT_EQ(reader.position(), 0u);
}

TEST_F(ByteBufferTest, InvalidBoolFails) {
    writer_.write_u8(2);

    ByteReader reader(writer_.data());
    EXPECT_FALSE(reader.read_bool());
    EXPECT_FALSE(reader.ok());
}

TEST_F(ByteBufferTest, StringsAndBlobs) {
    writer_.write_string("gems");
    writer_.write_blob(std::vector<uint8_t>{1, 2, 3});
    EXPECT_EQ(writer_.size(), 4u + 4u + 4u + 3u);

    ByteReader reader(writer_.data());
    EXPECT_EQ(reader.read_string(), "gems");
    EXPECT_EQ(reader.read_blob(), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_TRUE(reader.at_end());
}

TEST_F(ByteBufferTest, BlobLongerThanDataFails) {
    writer_.write_u32(100);
    writer_.write_u8(1);

    ByteReader reader(writer_.data());
    EXPECT_TRUE(reader.read_blob().empty());
    EXPECT_FALSE(reader.ok());
}

TEST_F(ByteBufferTest, TakeMovesBuffer) {
    writer_.write_u32(1);
    auto bytes = writer_.take();
    EXPECT_EQ(bytes.size(), 4u);
}

TEST_F(ByteBufferTest, ExplicitFail) {
    writer_.write_u8(1);
    ByteReader reader(writer_.data());
    EXPECT_EQ(reader.read_u8(), 1);
    reader.fail();
    EXPECT_FALSE(reader.ok());
    EXPECT_EQ(reader.remaining(), 0u);
}
