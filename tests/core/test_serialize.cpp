// QUORUMFEED - Serialization Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>
#include "quorumfeed/core/abi.h"
#include "quorumfeed/core/serialize.h"
#include "quorumfeed/core/types.h"
#include <ios>
#include <limits>
#include <string>
#include <vector>

using namespace quorumfeed;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());

    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    std::vector<uint8_t> data = {0x01, 0x02};
    DataStream ds(data);

    uint32_t value = 0;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, DataKeepsConsumedBytes) {
    DataStream ds;
    ds << uint32_t(7);
    uint8_t first = 0;
    ds >> first;

    EXPECT_EQ(ds.size(), 3u);
    EXPECT_EQ(ds.Data().size(), 4u);
}

// ============================================================================
// Integer Serialization Tests (Little-Endian)
// ============================================================================

TEST(SerializeTest, Uint32LittleEndian) {
    DataStream ds;
    ds << uint32_t(0x12345678);

    const auto& data = ds.Data();
    ASSERT_EQ(data.size(), 4u);
    EXPECT_EQ(data[0], 0x78);
    EXPECT_EQ(data[3], 0x12);

    uint32_t result = 0;
    ds >> result;
    EXPECT_EQ(result, 0x12345678u);
}

TEST(SerializeTest, NegativeInt64) {
    DataStream ds;
    int64_t value = -123456789012345LL;
    ds << value;
    EXPECT_EQ(ds.size(), 8u);

    int64_t result = 0;
    ds >> result;
    EXPECT_EQ(result, value);
}

TEST(SerializeTest, Int64Extremes) {
    DataStream ds;
    ds << std::numeric_limits<int64_t>::min() << std::numeric_limits<int64_t>::max();

    int64_t lo = 0, hi = 0;
    ds >> lo >> hi;
    EXPECT_EQ(lo, std::numeric_limits<int64_t>::min());
    EXPECT_EQ(hi, std::numeric_limits<int64_t>::max());
}

TEST(SerializeTest, Bool) {
    DataStream ds;
    ds << true << false;

    bool a = false, b = true;
    ds >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

// ============================================================================
// CompactSize Tests
// ============================================================================

TEST(CompactSizeTest, Encodings) {
    struct Case { uint64_t value; size_t bytes; };
    for (const auto& c : {Case{0, 1}, Case{252, 1}, Case{253, 5},
                          Case{0xFFFFFFFFull, 5}, Case{0x100000000ull, 9}}) {
        DataStream ds;
        WriteCompactSize(ds, c.value);
        EXPECT_EQ(ds.size(), c.bytes) << c.value;
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds;
    ds << uint8_t(254) << uint32_t(10);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Container Tests
// ============================================================================

TEST(SerializeTest, StringAndVector) {
    DataStream ds;
    std::string text = "DTO / USD";
    std::vector<int64_t> prices = {100, -200, 300};
    ds << text << prices;

    std::string textOut;
    std::vector<int64_t> pricesOut;
    ds >> textOut >> pricesOut;
    EXPECT_EQ(textOut, text);
    EXPECT_EQ(pricesOut, prices);
    EXPECT_TRUE(ds.empty());
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address addr = Address::FromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    DataStream ds;
    ds << addr;
    EXPECT_EQ(ds.size(), 20u);
    EXPECT_EQ(ds.Data()[0], 0x7e);

    Address out;
    ds >> out;
    EXPECT_EQ(out, addr);
}

// ============================================================================
// Packed Encoding Tests
// ============================================================================

TEST(PackedEncoderTest, Uint32IsBigEndian) {
    PackedEncoder enc;
    enc.WriteUint32(0x01020304);
    ASSERT_EQ(enc.size(), 4u);
    EXPECT_EQ(enc.Data()[0], 0x01);
    EXPECT_EQ(enc.Data()[3], 0x04);
}

TEST(PackedEncoderTest, Int256SignExtends) {
    PackedEncoder enc;
    enc.WriteInt256(-1).WriteInt256(255);
    ASSERT_EQ(enc.size(), 64u);

    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(enc.Data()[i], 0xFF);
    }
    for (size_t i = 32; i < 63; ++i) {
        EXPECT_EQ(enc.Data()[i], 0x00);
    }
    EXPECT_EQ(enc.Data()[63], 0xFF);
}

TEST(PackedEncoderTest, Uint256ZeroExtends) {
    PackedEncoder enc;
    enc.WriteUint256(0x0102);
    ASSERT_EQ(enc.size(), 32u);
    EXPECT_EQ(enc.Data()[30], 0x01);
    EXPECT_EQ(enc.Data()[31], 0x02);
    EXPECT_EQ(enc.Data()[0], 0x00);
}

TEST(PackedEncoderTest, ArrayAndStringHaveNoLengthPrefix) {
    PackedEncoder enc;
    enc.WriteInt256Array({1, 2, 3}).WriteString("abc");
    EXPECT_EQ(enc.size(), 3u * 32 + 3);
    EXPECT_EQ(enc.Data()[96], 'a');
}

TEST(PackedEncoderTest, AddressIsTwentyBytes) {
    Address addr = Address::FromHex("2b5ad5c4795c026514f8317c7a215e218dccd6cf");
    PackedEncoder enc;
    enc.WriteAddress(addr);
    ASSERT_EQ(enc.size(), 20u);
    EXPECT_EQ(enc.Data()[0], 0x2b);
    EXPECT_EQ(enc.Data()[19], 0xcf);
}
