/**
 * @file test_simhash_lsh.cpp
 * @brief SimHash fingerprints, Hamming similarity and the LSH band index
 */

#include <gtest/gtest.h>
#include <representation/simhash.hpp>
#include <detectors/lsh_fingerprint_detector.hpp>
#include <core/errors.hpp>
#include "test_fixtures.hpp"

using namespace Twinscan;
using namespace fixtures;

static FunctionRepresentation rep_with(const std::string& id, uint64_t low, uint64_t high = 0, uint32_t bits = 64) {
    FunctionRepresentation r;
    r.function_id = id;
    r.file_path = id + ".ts";
    r.line_count = 10;
    r.fingerprint.words = {low, high};
    r.fingerprint.bits = bits;
    return r;
}

// ============================================================================
// Fingerprint primitives
// ============================================================================

TEST(FingerprintTest, HammingAndSimilarity) {
    Fingerprint a, b;
    a.words = {0b1011, 0};
    b.words = {0b0001, 0};

    EXPECT_EQ(hamming_distance(a, b), 2u);
    EXPECT_DOUBLE_EQ(fingerprint_similarity(a, b), 1.0 - 2.0 / 64.0);
    EXPECT_DOUBLE_EQ(fingerprint_similarity(a, a), 1.0);
}

TEST(FingerprintTest, BandExtraction) {
    Fingerprint fp;
    fp.bits = 128;
    fp.words = {0xF000000000000000ULL, 0x0FULL};

    EXPECT_EQ(fp.band(0, 4), 0u);
    EXPECT_EQ(fp.band(60, 4), 0xFu);
    EXPECT_EQ(fp.band(60, 8), 0xFFu);   // straddles both words
    EXPECT_EQ(fp.band(64, 64), 0x0Fu);
    EXPECT_EQ(fp.band(0, 64), 0xF000000000000000ULL);
}

// ============================================================================
// SimHash
// ============================================================================

TEST(SimHashTest, ShingleCount) {
    SimHasher hasher;
    std::vector<std::string> tokens = {"a", "b", "c", "d", "e", "f"};
    // 4 trigrams + 3 four-grams + 2 five-grams
    EXPECT_EQ(hasher.shingles(tokens).size(), 9u);
    EXPECT_TRUE(hasher.shingles({"a", "b"}).empty());
}

TEST(SimHashTest, IdenticalStreamsIdenticalFingerprints) {
    SimHasher hasher;
    auto a = hasher.fingerprint(sum_tokens());
    auto b = hasher.fingerprint(sum_tokens());

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.bits, 64u);
    EXPECT_EQ(a.words[1], 0u);
}

TEST(SimHashTest, NearDuplicateCloserThanUnrelated) {
    SimHasher hasher;
    auto base = hasher.fingerprint(sum_tokens());

    auto edited_tokens = sum_tokens();
    edited_tokens.push_back("}");
    auto edited = hasher.fingerprint(edited_tokens);
    auto unrelated = hasher.fingerprint(classify_tokens());

    EXPECT_LT(hamming_distance(base, edited), hamming_distance(base, unrelated));
}

TEST(SimHashTest, WideFingerprintUsesBothWords) {
    FingerprintConfig config;
    config.bits = 128;
    SimHasher hasher(config);

    auto fp = hasher.fingerprint(classify_tokens());
    EXPECT_EQ(fp.bits, 128u);
    // 64 random hyperplanes per word: an all-zero word is vanishingly unlikely
    EXPECT_NE(fp.words[0], 0u);
    EXPECT_NE(fp.words[1], 0u);
}

TEST(SimHashTest, ShortStreamFallsBack) {
    SimHasher hasher;
    std::vector<std::string> canonical = {"Block", "ReturnStatement", "$0", "NUMBER"};

    EXPECT_EQ(hasher.fingerprint({"x"}, canonical), hasher.fingerprint(canonical));
    EXPECT_EQ(hasher.fingerprint({}, {}), Fingerprint{});
}

TEST(SimHashTest, SeedChangesHyperplanes) {
    FingerprintConfig other;
    other.hyperplane_seed = 1;
    SimHasher a;
    SimHasher b(other);

    EXPECT_NE(a.fingerprint(sum_tokens()), b.fingerprint(sum_tokens()));
}

TEST(SimHashTest, RejectsBadConfig) {
    FingerprintConfig bad_bits;
    bad_bits.bits = 32;
    EXPECT_THROW(SimHasher{bad_bits}, InvalidOptionsError);

    FingerprintConfig bad_range;
    bad_range.min_ngram = 6;
    EXPECT_THROW(SimHasher{bad_range}, InvalidOptionsError);
}

// ============================================================================
// LSH band index
// ============================================================================

TEST(LshBandIndexTest, RejectsInvalidBanding) {
    EXPECT_THROW(LshBandIndex(64, 3), InvalidOptionsError);
    EXPECT_THROW(LshBandIndex(64, 0), InvalidOptionsError);
    EXPECT_THROW(LshBandIndex(128, 1), InvalidOptionsError);
    EXPECT_NO_THROW(LshBandIndex(128, 2));
}

TEST(LshBandIndexTest, CandidatesShareABand) {
    auto r0 = rep_with("r0", 0x00000000FFFFFFFFULL);
    auto r1 = rep_with("r1", 0x12345678FFFFFFFFULL);
    auto r2 = rep_with("r2", 0xAAAAAAAA00000000ULL);

    LshBandIndex index(64, 2);
    index.build({&r0, &r1, &r2});
    EXPECT_EQ(index.band_width(), 32u);

    auto c0 = index.candidates(0);
    ASSERT_EQ(c0.size(), 1u);
    EXPECT_EQ(c0[0].first, 1u);
    EXPECT_EQ(c0[0].second, 1u);   // one band in common
    EXPECT_TRUE(index.candidates(1).empty());
    EXPECT_TRUE(index.candidates(2).empty());
}

TEST(LshBandIndexTest, OversizedBucketsAreSkipped) {
    auto r0 = rep_with("r0", 42);
    auto r1 = rep_with("r1", 42);
    auto r2 = rep_with("r2", 42);

    LshBandIndex index(64, 4, 2);
    index.build({&r0, &r1, &r2});

    for (uint32_t b = 0; b < 4; ++b) {
        EXPECT_EQ(index.skipped_buckets(b), 1u);
        EXPECT_EQ(index.largest_bucket(b), 3u);
    }
    EXPECT_TRUE(index.candidates(0).empty());
}

TEST(LshBandIndexTest, RejectsFingerprintWidthMismatch) {
    auto r0 = rep_with("r0", 1, 0, 128);
    LshBandIndex index(64, 8);
    EXPECT_THROW(index.build({&r0}), InvalidOptionsError);
}

TEST(LshFingerprintDetectorTest, ScoreIsFingerprintSimilarity) {
    // Two bits apart, both inside band 0
    std::vector<FunctionRepresentation> reps = {rep_with("a", 0x0ULL), rep_with("b", 0x3ULL)};
    DetectorOptions o;
    o.threshold = 0.9;
    o.min_lines = 1;

    auto result = LshFingerprintDetector{}.detect(reps, o);
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(result.pairs[0].score, fingerprint_similarity(reps[0].fingerprint, reps[1].fingerprint));
    EXPECT_DOUBLE_EQ(result.pairs[0].score, 1.0 - 2.0 / 64.0);
    EXPECT_EQ(result.pairs[0].metadata.at("hamming_distance"), "2");
    EXPECT_EQ(result.pairs[0].metadata.at("bands_matched"), "7");

    o.threshold = 0.97;
    EXPECT_TRUE(LshFingerprintDetector{}.detect(reps, o).pairs.empty());
}
