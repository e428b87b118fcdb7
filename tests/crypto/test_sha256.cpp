// MILESCROW - SHA256 Tests
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <gtest/gtest.h>
#include "milescrow/crypto/sha256.h"
#include "milescrow/core/types.h"

#include <array>
#include <string>
#include <vector>

namespace milescrow {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

std::string DigestHex(const std::array<Byte, SHA256::OUTPUT_SIZE>& out) {
    return Hash256(out.data(), out.size()).ToHex();
}

std::string HashString(const std::string& input) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Write(input).Finalize(out.data());
    return DigestHex(out);
}

// ============================================================================
// Known Vectors
// ============================================================================

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(HashString(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(HashString("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(HashString("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Write("a").Write("b").Write("c").Finalize(out.data());
    EXPECT_EQ(DigestHex(out), HashString("abc"));
}

TEST(SHA256Test, FinalizeResetsState) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> first;
    std::array<Byte, SHA256::OUTPUT_SIZE> second;

    hasher.Write("abc").Finalize(first.data());
    hasher.Write("abc").Finalize(second.data());
    EXPECT_EQ(first, second);
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Write("garbage").Reset().Write("abc").Finalize(out.data());
    EXPECT_EQ(DigestHex(out), HashString("abc"));
}

TEST(SHA256Test, WriteUInt64IsLittleEndian) {
    SHA256 viaInt;
    std::array<Byte, SHA256::OUTPUT_SIZE> a;
    viaInt.WriteUInt64(0x0102030405060708ULL).Finalize(a.data());

    const Byte raw[8] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    SHA256 viaBytes;
    std::array<Byte, SHA256::OUTPUT_SIZE> b;
    viaBytes.Write(raw, sizeof(raw)).Finalize(b.data());

    EXPECT_EQ(a, b);
}

TEST(SHA256Test, HashFunctionMatchesHasher) {
    const std::string msg = "milestone plan";
    std::vector<Byte> bytes(msg.begin(), msg.end());
    Hash256 h = SHA256Hash(bytes);
    EXPECT_EQ(h.ToHex(), HashString(msg));
}

} // namespace test
} // namespace milescrow
