// QUORUMFEED - Hex and Core Types Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>
#include "quorumfeed/core/hex.h"
#include "quorumfeed/core/types.h"
#include <set>
#include <stdexcept>

using namespace quorumfeed;

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHexIsLowercase) {
    std::vector<uint8_t> data = {0x00, 0xAB, 0xCD, 0xEF};
    EXPECT_EQ(BytesToHex(data), "00abcdef");
}

TEST(HexTest, HexToBytesAcceptsPrefixAndMixedCase) {
    std::vector<uint8_t> expected = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("0xDeAdBeEf"), expected);
    EXPECT_EQ(HexToBytes("0X"), std::vector<uint8_t>{});
}

TEST(HexTest, HexToBytesRejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("0x00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("0x0"));
    EXPECT_FALSE(IsValidHex("g0"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xabc"), "abc");
    EXPECT_EQ(StripHexPrefix("abc"), "abc");
    EXPECT_EQ(StripHexPrefix("0"), "0");
}

// ============================================================================
// Address and Hash Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.ToString(), "0x0000000000000000000000000000000000000000");
}

TEST(AddressTest, FromHexRoundTripsToString) {
    const std::string text = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
    Address addr = Address::FromHex(text);
    EXPECT_FALSE(addr.IsNull());
    EXPECT_EQ(addr.ToString(), text);
    EXPECT_EQ(Address::FromHex("7E5F4552091A69125D5DFCB7B8C2659029395BDF"), addr);
}

TEST(AddressTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Address::FromHex("0x1234"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(42, 'a')), std::invalid_argument);
}

TEST(AddressTest, OrderingIsBytewise) {
    Address a = Address::FromHex("0x0000000000000000000000000000000000000001");
    Address b = Address::FromHex("0x0100000000000000000000000000000000000000");
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);

    std::set<Address> set = {b, a, a};
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(*set.begin(), a);
}

TEST(Hash256Test, FromHex) {
    Hash256 h = Hash256::FromHex(
        "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    EXPECT_EQ(h[0], 0xc5);
    EXPECT_EQ(h[31], 0x70);
    EXPECT_EQ(h.ToHex(), "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(TypesTest, RoundMax) {
    EXPECT_EQ(ROUND_MAX, 4294967295ull);
}
