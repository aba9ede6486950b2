#include <gtest/gtest.h>
#include <pickler/buffer.hpp>
#include <pickler/errors.hpp>

#include <array>
#include <cstdint>
#include <vector>

using namespace pickler;

TEST(BufferTest, BigEndianLayout) {
    WriteBuffer buffer(32);
    buffer.put_i16(0x0102);
    buffer.put_i32(0x03040506);
    buffer.put_i64(0x0708090A0B0C0D0E);

    auto bytes = buffer.written();
    const std::vector<uint8_t> expected = {
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
        0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E
    };
    EXPECT_EQ(std::vector<uint8_t>(bytes.begin(), bytes.end()), expected);
}

TEST(BufferTest, ScalarRoundTrip) {
    WriteBuffer buffer(64);
    buffer.put_u8(0xAB);
    buffer.put_i16(-2);
    buffer.put_i32(-123456);
    buffer.put_i64(-9876543210);
    buffer.put_f32(1.5f);
    buffer.put_f64(-0.25);
    buffer.put_bytes("hi", 2);

    ReadBuffer in(buffer.flip());
    EXPECT_EQ(in.get_u8(), 0xAB);
    EXPECT_EQ(in.get_i16(), -2);
    EXPECT_EQ(in.get_i32(), -123456);
    EXPECT_EQ(in.get_i64(), -9876543210);
    EXPECT_FLOAT_EQ(in.get_f32(), 1.5f);
    EXPECT_DOUBLE_EQ(in.get_f64(), -0.25);
    EXPECT_EQ(in.get_string(2), "hi");
    EXPECT_FALSE(in.has_remaining());
}

TEST(BufferTest, OverflowIsEncodeError) {
    WriteBuffer buffer(3);
    buffer.put_u8(1);
    EXPECT_THROW(buffer.put_i32(7), EncodeError);
    EXPECT_EQ(buffer.position(), 1u);
}

TEST(BufferTest, CallerProvidedStorage) {
    std::array<uint8_t, 4> storage{};
    WriteBuffer buffer{std::span<uint8_t>(storage)};
    buffer.put_i32(0x11223344);
    EXPECT_EQ(storage[0], 0x11);
    EXPECT_EQ(storage[3], 0x44);
    EXPECT_THROW(buffer.put_u8(0), EncodeError);
}

TEST(BufferTest, FlipClosesBuffer) {
    WriteBuffer buffer(8);
    buffer.put_u8(1);
    auto bytes = buffer.flip();
    EXPECT_EQ(bytes.size(), 1u);
    EXPECT_TRUE(buffer.is_closed());
    EXPECT_THROW(buffer.put_u8(2), EncodeError);
    EXPECT_THROW(buffer.interning(), EncodeError);
}

TEST(BufferTest, UnderflowIsDecodeError) {
    const std::vector<uint8_t> bytes = {0x00, 0x01};
    ReadBuffer in(bytes);
    EXPECT_THROW(in.get_i32(), DecodeError);
    EXPECT_EQ(in.position(), 0u);
    EXPECT_EQ(in.get_i16(), 1);
    EXPECT_THROW(in.get_u8(), DecodeError);
}

TEST(BufferTest, SeekAndSkip) {
    const std::vector<uint8_t> bytes = {1, 2, 3, 4};
    ReadBuffer in(bytes);
    in.skip(2);
    EXPECT_EQ(in.get_u8(), 3);
    in.seek(0);
    EXPECT_EQ(in.get_u8(), 1);
    in.seek(4);
    EXPECT_FALSE(in.has_remaining());
    EXPECT_THROW(in.seek(5), DecodeError);
    in.seek(3);
    EXPECT_THROW(in.skip(2), DecodeError);
}

TEST(BufferTest, Markers) {
    WriteBuffer buffer(8);
    buffer.put_marker(Marker::Record);
    buffer.put_marker(Marker::Null);
    // zig-zag of -21
    EXPECT_EQ(buffer.written()[0], 41);

    ReadBuffer in(buffer.flip());
    EXPECT_EQ(in.peek_marker(), static_cast<int32_t>(Marker::Record));
    EXPECT_EQ(in.position(), 0u);
    in.expect_marker(Marker::Record, "test");
    EXPECT_THROW(in.expect_marker(Marker::List, "test"), DecodeError);
}

TEST(BufferTest, NonMarkerIsDecodeError) {
    // zig-zag 2 == +1, and -24 is past the last marker
    const std::vector<uint8_t> positive = {0x02};
    ReadBuffer a(positive);
    EXPECT_THROW(a.get_marker(), DecodeError);

    const std::vector<uint8_t> below = {47};
    ReadBuffer b(below);
    EXPECT_THROW(b.get_marker(), DecodeError);
}

TEST(BufferTest, DepthGuard) {
    uint32_t depth = 0;
    {
        DepthGuard a(depth, 2);
        DepthGuard b(depth, 2);
        EXPECT_EQ(depth, 2u);
        EXPECT_THROW(DepthGuard(depth, 2), DepthExceededError);
        EXPECT_EQ(depth, 2u);
    }
    EXPECT_EQ(depth, 0u);
}
