#include <gtest/gtest.h>
#include <emtls/protocol/alert.h>
#include <emtls/protocol/wire.h>
#include "../test_infrastructure/test_utilities.h"
#include <array>

using namespace emtls::v13;
using namespace emtls::v13::memory;
using namespace emtls::v13::protocol;
using emtls::test::Bytes;
using emtls::test::from_hex;

class AlertTest : public ::testing::Test {};

TEST_F(AlertTest, CloseNotify) {
    Alert alert = Alert::close_notify();
    EXPECT_TRUE(alert.is_close_notify());
    EXPECT_TRUE(alert.is_warning());
    EXPECT_FALSE(alert.is_fatal());

    std::array<uint8_t, 2> out{};
    auto written = alert.serialize(out);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, 2u);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(out[1], 0);
}

TEST_F(AlertTest, ParseFatal) {
    auto alert = Alert::parse(from_hex("0228"));
    ASSERT_TRUE(alert);
    EXPECT_TRUE(alert->is_fatal());
    EXPECT_EQ(alert->description(), AlertDescription::HANDSHAKE_FAILURE);
    EXPECT_EQ(*alert, Alert(AlertLevel::FATAL, AlertDescription::HANDSHAKE_FAILURE));
    EXPECT_NE(*alert, Alert::close_notify());
}

TEST_F(AlertTest, ParseRejectsMalformed) {
    EXPECT_EQ(Alert::parse(from_hex("01")).error(), TLSError::DECODE_ERROR);
    EXPECT_EQ(Alert::parse(from_hex("010000")).error(), TLSError::DECODE_ERROR);
    EXPECT_EQ(Alert::parse(from_hex("0300")).error(), TLSError::DECODE_ERROR);
}

TEST_F(AlertTest, SerializeNeedsRoom) {
    std::array<uint8_t, 1> out{};
    EXPECT_EQ(Alert::close_notify().serialize(out).error(), TLSError::ENCODE_ERROR);
}

class WireTest : public ::testing::Test {};

TEST_F(WireTest, ReadIntegers) {
    Bytes data = from_hex("01020304050607080910");
    WireReader reader(data);
    EXPECT_EQ(*reader.read_u8(), 0x01);
    EXPECT_EQ(*reader.read_u16(), 0x0203);
    EXPECT_EQ(*reader.read_u24(), 0x040506u);
    EXPECT_EQ(*reader.read_u32(), 0x07080910u);
    EXPECT_TRUE(reader.empty());
    EXPECT_EQ(reader.read_u8().error(), TLSError::DECODE_ERROR);
}

TEST_F(WireTest, VectorsRewindOnShortData) {
    Bytes data = from_hex("0003aabb");
    WireReader reader(data);
    EXPECT_EQ(reader.read_vector16().error(), TLSError::DECODE_ERROR);
    EXPECT_EQ(reader.position(), 0u);

    auto byte_vector = reader.read_vector8();
    ASSERT_TRUE(byte_vector);
    EXPECT_TRUE(byte_vector->empty());
    EXPECT_EQ(reader.remaining(), 3u);
}

TEST_F(WireTest, Vector24) {
    Bytes data = from_hex("000002cafe");
    WireReader reader(data);
    auto vec = reader.read_vector24();
    ASSERT_TRUE(vec);
    EXPECT_EQ(*vec, BufferView(from_hex("cafe")));
}

TEST_F(WireTest, WriterLengthPrefixes) {
    std::array<uint8_t, 16> storage{};
    WireWriter writer(storage);

    auto outer = writer.begin_length(2);
    ASSERT_TRUE(outer);
    auto inner = writer.begin_length(1);
    ASSERT_TRUE(inner);
    ASSERT_TRUE(writer.write_u16(0x0304));
    ASSERT_TRUE(writer.end_length(*inner, 1));
    ASSERT_TRUE(writer.write_u24(0x010203));
    ASSERT_TRUE(writer.end_length(*outer, 2));

    EXPECT_EQ(writer.written(), BufferView(from_hex("0006020304010203")));
}

TEST_F(WireTest, WriterOverflow) {
    std::array<uint8_t, 3> storage{};
    WireWriter writer(storage);
    ASSERT_TRUE(writer.write_u16(1));
    EXPECT_EQ(writer.write_u16(2).error(), TLSError::ENCODE_ERROR);
    EXPECT_EQ(writer.write_bytes(from_hex("0102")).error(), TLSError::ENCODE_ERROR);
    EXPECT_TRUE(writer.write_u8(3));
    EXPECT_EQ(writer.remaining(), 0u);

    std::array<uint8_t, 8> small{};
    WireWriter bounded(small);
    EXPECT_EQ(bounded.write_u24(0x01000000).error(), TLSError::ENCODE_ERROR);
}

TEST_F(WireTest, LengthFieldTooNarrow) {
    std::array<uint8_t, 300> storage{};
    WireWriter writer(storage);
    auto marker = writer.begin_length(1);
    ASSERT_TRUE(marker);
    ASSERT_TRUE(writer.write_bytes(Bytes(256, 0xee)));
    EXPECT_EQ(writer.end_length(*marker, 1).error(), TLSError::ENCODE_ERROR);
}
