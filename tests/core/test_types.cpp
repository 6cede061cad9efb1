// EQUORUM - Core Types Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/core/hex.h"
#include "equorum/core/types.h"

#include <map>
#include <stdexcept>

namespace equorum {
namespace test {

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, RoundTrip) {
    std::vector<Byte> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "0001abff");
    EXPECT_EQ(HexToBytes("0001abff"), bytes);
    EXPECT_EQ(HexToBytes("0001ABFF"), bytes);
}

TEST(HexTest, RejectsMalformedInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0xab"));
}

// ============================================================================
// Hashes and Addresses
// ============================================================================

TEST(HashTest, DefaultIsNull) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 32u);

    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
}

TEST(HashTest, FromHexAcceptsPrefix) {
    std::string hex = "0102030405060708090a0b0c0d0e0f1011121314";
    Address a = Address::FromHex(hex);
    Address b = Address::FromHex("0x" + hex);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.ToHex(), hex);
    EXPECT_EQ(a[0], 0x01);
    EXPECT_EQ(a[19], 0x14);
    EXPECT_FALSE(a.IsNull());
}

TEST(HashTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Address::FromHex("0x0102"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex("0102030405060708090a0b0c0d0e0f1011121314"),
                 std::invalid_argument);
}

TEST(HashTest, ShortInputIsZeroPadded) {
    Byte raw[] = {0xaa, 0xbb};
    Address addr(raw, sizeof(raw));
    EXPECT_EQ(addr.ToHex(), "aabb000000000000000000000000000000000000");
}

TEST(HashTest, OrderingIsLexicographic) {
    Address low = Address::FromHex("0000000000000000000000000000000000000001");
    Address high = Address::FromHex("0100000000000000000000000000000000000000");
    EXPECT_TRUE(low < high);
    EXPECT_FALSE(high < low);
    EXPECT_NE(low, high);

    std::map<Address, int> ordered{{high, 2}, {low, 1}};
    EXPECT_EQ(ordered.begin()->second, 1);
}

TEST(HashTest, SetNull) {
    Address addr = Address::FromHex("ffffffffffffffffffffffffffffffffffffffff");
    addr.SetNull();
    EXPECT_TRUE(addr.IsNull());
}

TEST(HashTest, ShortAddress) {
    Address addr = Address::FromHex("1234abcd00000000000000000000000000000000");
    EXPECT_EQ(ShortAddress(addr), "0x1234abcd...");
}

TEST(AmountTest, CoinScale) {
    EXPECT_EQ(COIN, 100000000);
    EXPECT_EQ(SECONDS_PER_DAY, 86400);
}

} // namespace test
} // namespace equorum
