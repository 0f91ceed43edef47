/**
 * @file test_hashing.cpp
 * @brief Unit tests for the BLAKE3 hashing front-end
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <string>

using namespace Twinscan;

TEST(HashingTest, Determinism) {
    std::string data = "function sum(values) { return values.reduce(add, 0); }";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, IncrementalMatchesOneShot) {
    BLAKE3Pipeline::Hasher hasher;
    hasher.update("Identifier").update("$0");

    EXPECT_EQ(hasher.finalize(), BLAKE3Pipeline::hash("Identifier$0"));
}

TEST(HashingTest, FieldSeparatorMatters) {
    // "ab" + "c" and "a" + "bc" must not collide once a separator is hashed
    BLAKE3Pipeline::Hasher h1;
    h1.update("ab").update_u8(0).update("c");
    BLAKE3Pipeline::Hasher h2;
    h2.update("a").update_u8(0).update("bc");

    EXPECT_NE(h1.finalize(), h2.finalize());
}

TEST(HashingTest, ExtendedOutputPrefixIsStable) {
    // 64-bit fingerprints read a prefix of the 128-bit projection
    BLAKE3Pipeline::Hasher hasher;
    hasher.update_u64(42).update("shingle");

    uint8_t short_out[8];
    uint8_t long_out[16];
    hasher.finalize_into(short_out, sizeof(short_out));
    hasher.finalize_into(long_out, sizeof(long_out));

    for (int i = 0; i < 8; ++i) EXPECT_EQ(short_out[i], long_out[i]);
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);

    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(hex, BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("hex_test")));
    EXPECT_NE(hex, BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("hex_test2")));
}
