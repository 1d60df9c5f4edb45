#include "cdnet/protocol/wire.hpp"

#include <gtest/gtest.h>

#include <array>
#include <vector>

using namespace cdnet::protocol;

TEST(WireDecoder, U64IsBigEndian) {
    const std::array<uint8_t, 8> buf = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0xE8};
    uint64_t v = 0;
    ASSERT_TRUE(decode_u64(buf, v));
    EXPECT_EQ(v, 1000u);
}

TEST(WireDecoder, U64FullWidth) {
    const std::array<uint8_t, 8> buf = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
    uint64_t v = 0;
    ASSERT_TRUE(decode_u64(buf, v));
    EXPECT_EQ(v, 0x0123456789ABCDEFull);
}

TEST(WireDecoder, U64RejectsWrongLength) {
    uint64_t v = 7;
    const std::array<uint8_t, 7> short_buf{};
    const std::array<uint8_t, 9> long_buf{};
    EXPECT_FALSE(decode_u64(short_buf, v));
    EXPECT_FALSE(decode_u64(long_buf, v));
    EXPECT_FALSE(decode_u64({}, v));
    EXPECT_EQ(v, 7u);
}

TEST(WireDecoder, StringStripsTerminator) {
    const std::vector<uint8_t> buf = {'c', 'p', 'u', 0};
    std::string s;
    ASSERT_TRUE(decode_string(buf, s));
    EXPECT_EQ(s, "cpu");
}

TEST(WireDecoder, StringOnlyTerminatorIsEmpty) {
    const std::vector<uint8_t> buf = {0};
    std::string s = "previous";
    ASSERT_TRUE(decode_string(buf, s));
    EXPECT_TRUE(s.empty());
}

TEST(WireDecoder, StringKeepsEmbeddedBytesVerbatim) {
    const std::vector<uint8_t> buf = {'a', 0, 0xFF, 'b', 0};
    std::string s;
    ASSERT_TRUE(decode_string(buf, s));
    ASSERT_EQ(s.size(), 4u);
    EXPECT_EQ(s[1], '\0');
    EXPECT_EQ(static_cast<uint8_t>(s[2]), 0xFF);
}

TEST(WireDecoder, StringWithoutTerminatorFails) {
    const std::vector<uint8_t> buf = {'h', 'o', 's', 't'};
    std::string s = "unchanged";
    EXPECT_FALSE(decode_string(buf, s));
    EXPECT_EQ(s, "unchanged");
}

TEST(WireDecoder, EmptyStringPayloadFails) {
    std::string s;
    EXPECT_FALSE(decode_string({}, s));
}

TEST(ByteReader, ReadsAndAdvances) {
    const std::vector<uint8_t> buf = {0x12, 0x34, 0xAA, 0xBB, 0xCC};
    ByteReader reader(buf);

    uint16_t v = 0;
    ASSERT_TRUE(reader.read_u16(v));
    EXPECT_EQ(v, 0x1234);
    EXPECT_EQ(reader.offset(), 2u);
    EXPECT_EQ(reader.remaining(), 3u);

    std::span<const uint8_t> slice;
    ASSERT_TRUE(reader.take(3, slice));
    ASSERT_EQ(slice.size(), 3u);
    EXPECT_EQ(slice[0], 0xAA);
    EXPECT_EQ(slice[2], 0xCC);
    EXPECT_TRUE(reader.empty());
}

TEST(ByteReader, OverreadLeavesCursorInPlace) {
    const std::vector<uint8_t> buf = {0x01, 0x02, 0x03};
    ByteReader reader(buf);

    std::span<const uint8_t> slice;
    EXPECT_FALSE(reader.take(4, slice));
    EXPECT_EQ(reader.offset(), 0u);

    uint16_t v = 0;
    ASSERT_TRUE(reader.read_u16(v));
    EXPECT_FALSE(reader.read_u16(v));
    EXPECT_EQ(reader.offset(), 2u);
    EXPECT_EQ(v, 0x0102);
}

TEST(ByteOrder, LittleAndBigEndianLoads) {
    const std::array<uint8_t, 8> buf = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(load_be64(buf.data()), 0x0102030405060708ull);
    EXPECT_EQ(load_le64(buf.data()), 0x0807060504030201ull);
    EXPECT_EQ(load_be16(buf.data()), 0x0102);
}
