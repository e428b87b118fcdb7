// MILESCROW - Core Types Tests
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <gtest/gtest.h>
#include "milescrow/core/types.h"

#include <map>
#include <stdexcept>

namespace milescrow {
namespace test {

// ============================================================================
// Fixed-Point Tests
// ============================================================================

TEST(MulDivTest, ExactDivision) {
    EXPECT_EQ(MulDiv(10, 30, 100), 3u);
    EXPECT_EQ(MulDiv(PRECISION, 77, 100), 770000000000000000ULL);
}

TEST(MulDivTest, FloorsResult) {
    EXPECT_EQ(MulDiv(10, 1, 3), 3u);
    EXPECT_EQ(MulDiv(PRECISION, 1, 3), 333333333333333333ULL);
}

TEST(MulDivTest, NoIntermediateOverflow) {
    // PRECISION * PRECISION overflows 64 bits
    EXPECT_EQ(MulDiv(PRECISION, PRECISION, PRECISION), PRECISION);
    EXPECT_EQ(MulDiv(UINT64_MAX, 2, 4), UINT64_MAX / 2);
}

TEST(MulDivTest, ZeroDivisorYieldsZero) {
    EXPECT_EQ(MulDiv(5, 5, 0), 0u);
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
}

TEST(Hash256Test, Equality) {
    std::array<Byte, 32> data;
    data.fill(0x42);
    EXPECT_EQ(Hash256(data), Hash256(data));
    EXPECT_NE(Hash256(data), Hash256());
    EXPECT_FALSE(Hash256(data).IsNull());
}

TEST(Hash256Test, HexInStorageOrder) {
    std::array<Byte, 32> data{};
    data[0] = 0xAB;
    data[31] = 0xCD;

    const std::string hex = Hash256(data).ToHex();
    ASSERT_EQ(hex.length(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(62, 2), "cd");
    EXPECT_EQ(Hash256::FromHex(hex), Hash256(data));
}

TEST(Hash256Test, ShortInputIsZeroFilled) {
    const Byte bytes[] = {0x01, 0x02};
    Hash256 h(bytes, sizeof(bytes));
    EXPECT_EQ(h[0], 0x01);
    EXPECT_EQ(h[1], 0x02);
    EXPECT_EQ(h[2], 0x00);
}

TEST(Hash256Test, ParseRejectsBadInput) {
    EXPECT_FALSE(Hash256::ParseHex("abcd").has_value());
    EXPECT_FALSE(Hash256::ParseHex(std::string(64, 'z')).has_value());
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, ParseAcceptsPrefix) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    auto plain = Address::ParseHex(hex);
    auto prefixed = Address::ParseHex("0x" + hex);
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(*plain, *prefixed);
    EXPECT_EQ(plain->ToHex(), hex);
    EXPECT_EQ((*plain)[1], 0x11);

    EXPECT_FALSE(Address::ParseHex("0x" + hex + "44").has_value());
    EXPECT_FALSE(Address::ParseHex("0x").has_value());
}

TEST(AddressTest, ShortAddressIsPrefixedHead) {
    EXPECT_EQ(ShortAddress(Address::FromHex("deadbeef" + std::string(32, '0'))),
              "0xdeadbeef");
    EXPECT_EQ(ShortAddress(Address()), "0x00000000");
}

TEST(AddressTest, OrderedByLeadingBytes) {
    std::array<Byte, 20> a{};
    std::array<Byte, 20> b{};
    a[0] = 1;
    a[19] = 0xFF;
    b[0] = 2;

    EXPECT_LT(Address(a), Address(b));

    std::map<Address, int> m;
    m[Address(b)] = 2;
    m[Address(a)] = 1;
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m.begin()->second, 1);
}

} // namespace test
} // namespace milescrow
