/**
 * @file test_detectors.cpp
 * @brief Exact-hash, canonical-merkle, structural-weighted and LSH detectors
 */

#include <gtest/gtest.h>
#include <detectors/exact_hash_detector.hpp>
#include <detectors/canonical_merkle_detector.hpp>
#include <detectors/lsh_fingerprint_detector.hpp>
#include <detectors/structural_weighted_detector.hpp>
#include <representation/representation_builder.hpp>
#include "test_fixtures.hpp"
#include <algorithm>
#include <set>

using namespace Twinscan;
using namespace fixtures;

static std::vector<FunctionRepresentation> build(const std::vector<FunctionInfo>& fns) {
    RepresentationBuilder builder(SimilarityOptions{});
    auto result = builder.build(fns);
    EXPECT_TRUE(result.skipped.empty());
    return result.representations;
}

static DetectorOptions opts(double threshold, uint32_t min_lines = 1, bool cross_file = true) {
    DetectorOptions o;
    o.threshold = threshold;
    o.min_lines = min_lines;
    o.cross_file = cross_file;
    return o;
}

static std::set<std::pair<std::string, std::string>> keys(const DetectorResult& r) {
    std::set<std::pair<std::string, std::string>> out;
    for (const auto& p : r.pairs) out.insert(p.key());
    return out;
}

static std::vector<FunctionInfo> mixed_corpus() {
    auto longer = sum_function("sum-long", "e.ts");
    longer.ast.children.insert(longer.ast.children.begin(),
                               node("ExpressionStatement", {node("CallExpression", {ident("check"), ident("values")})}));
    longer.tokens.insert(longer.tokens.begin(), {"check", "(", "values", ")", ";"});

    return {
        sum_function("sum-a", "a.ts"),
        sum_function("sum-b", "b.ts", "acc", "x", "xs"),
        classify_function("classify", "c.ts"),
        declarations_function("decl-1", "d.ts", false),
        declarations_function("decl-2", "d.ts", true),
        longer,
    };
}

// ============================================================================
// Common contract
// ============================================================================

TEST(DetectorFactoryTest, EveryIdHasADetector) {
    for (DetectorId id : ALL_DETECTORS) {
        auto detector = make_detector(id);
        ASSERT_NE(detector, nullptr);
        EXPECT_EQ(detector->id(), id);
        EXPECT_STREQ(detector->name(), to_string(id));
    }
}

TEST(DetectorFactoryTest, DetectorNamesRoundTrip) {
    for (DetectorId id : ALL_DETECTORS) {
        EXPECT_EQ(parse_detector_id(to_string(id)), id);
    }
    EXPECT_FALSE(parse_detector_id("fuzzy").has_value());
}

TEST(SimilarityPairTest, MakeOrdersIds) {
    auto p = SimilarityPair::make("zeta", "alpha", DetectorId::ExactHash, 1.0, "identical-structure");
    EXPECT_EQ(p.first, "alpha");
    EXPECT_EQ(p.second, "zeta");
}

TEST(DetectorContractTest, OutputSortedAndMonotoneInThreshold) {
    auto reps = build(mixed_corpus());

    for (DetectorId id : {DetectorId::ExactHash, DetectorId::CanonicalMerkle,
                          DetectorId::StructuralWeighted, DetectorId::LshFingerprint}) {
        auto detector = make_detector(id);
        auto loose = detector->detect(reps, opts(0.5));
        auto tight = detector->detect(reps, opts(0.9));

        EXPECT_TRUE(std::is_sorted(loose.pairs.begin(), loose.pairs.end(), pair_order)) << to_string(id);
        EXPECT_LE(tight.pairs.size(), loose.pairs.size()) << to_string(id);

        auto loose_keys = keys(loose);
        for (const auto& k : keys(tight)) {
            EXPECT_TRUE(loose_keys.count(k)) << to_string(id) << " " << k.first << "/" << k.second;
        }
        for (const auto& p : loose.pairs) {
            EXPECT_GE(p.score, 0.5);
            EXPECT_LE(p.score, 1.0);
            EXPECT_LT(p.first, p.second);
            EXPECT_EQ(p.detector, id);
        }
    }
}

TEST(DetectorContractTest, SelfSimilarityOfCopies) {
    auto copy = sum_function("sum-copy", "z.ts");
    auto reps = build({sum_function("sum-a", "a.ts"), copy});

    for (DetectorId id : {DetectorId::ExactHash, DetectorId::CanonicalMerkle,
                          DetectorId::StructuralWeighted, DetectorId::LshFingerprint}) {
        auto result = make_detector(id)->detect(reps, opts(0.99));
        ASSERT_EQ(result.pairs.size(), 1u) << to_string(id);
        EXPECT_DOUBLE_EQ(result.pairs[0].score, 1.0) << to_string(id);
    }
}

TEST(DetectorContractTest, MinLinesExcludesShortFunctions) {
    auto shortie = sum_function("sum-short", "b.ts");
    shortie.end_line = 3;
    auto reps = build({sum_function("sum-a", "a.ts"), shortie});

    ExactHashDetector detector;
    EXPECT_EQ(detector.detect(reps, opts(0.8, 1)).pairs.size(), 1u);
    EXPECT_TRUE(detector.detect(reps, opts(0.8, 5)).pairs.empty());
}

TEST(DetectorContractTest, CrossFileOffKeepsSameFilePairsOnly) {
    auto reps = build({
        sum_function("sum-a", "a.ts"),
        sum_function("sum-b", "b.ts"),
        sum_function("sum-a2", "a.ts", "acc"),
    });

    CanonicalMerkleDetector detector;
    EXPECT_EQ(detector.detect(reps, opts(0.8, 1, true)).pairs.size(), 3u);

    auto same_file = detector.detect(reps, opts(0.8, 1, false));
    ASSERT_EQ(same_file.pairs.size(), 1u);
    EXPECT_EQ(same_file.pairs[0].first, "sum-a");
    EXPECT_EQ(same_file.pairs[0].second, "sum-a2");
}

// ============================================================================
// Exact-hash / canonical-merkle
// ============================================================================

TEST(ExactHashDetectorTest, StructureBeatsSignature) {
    // Same signature as sum(), unrelated body
    auto impostor = make_function("sum-impostor", "sum", "d.ts", classify_ast(), classify_tokens(), {"number[]"});
    auto reps = build({sum_function("sum-a", "a.ts"), sum_function("sum-b", "b.ts", "acc", "x", "xs"), impostor});

    ExactHashDetector detector;
    auto loose = detector.detect(reps, opts(0.5));
    ASSERT_EQ(loose.pairs.size(), 3u);
    EXPECT_EQ(loose.pairs[0].first, "sum-a");
    EXPECT_EQ(loose.pairs[0].second, "sum-b");
    EXPECT_DOUBLE_EQ(loose.pairs[0].score, 1.0);
    EXPECT_EQ(loose.pairs[0].explanation, "identical-structure");
    for (size_t i = 1; i < loose.pairs.size(); ++i) {
        EXPECT_DOUBLE_EQ(loose.pairs[i].score, ExactHashDetector::SIGNATURE_SCORE);
        EXPECT_EQ(loose.pairs[i].explanation, "identical-signature");
    }

    // 0.6 is below the default threshold: signature matches disappear
    auto strict = detector.detect(reps, opts(0.8));
    ASSERT_EQ(strict.pairs.size(), 1u);
    EXPECT_EQ(strict.pairs[0].explanation, "identical-structure");
}

TEST(CanonicalMerkleDetectorTest, RenamedCloneMatches) {
    auto reps = build({sum_function("sum-a", "a.ts"), sum_function("sum-b", "b.ts", "acc", "x", "xs"),
                       classify_function("classify", "c.ts")});

    CanonicalMerkleDetector detector;
    auto result = detector.detect(reps, opts(0.8));
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_EQ(result.pairs[0].explanation, "merkle-root-match");
    EXPECT_EQ(result.pairs[0].metadata.at("merkle_root"), BLAKE3Pipeline::to_hex(reps[0].structural_hash));

    EXPECT_TRUE(CanonicalMerkleDetector::confirms(reps[0], reps[1]));
    EXPECT_FALSE(CanonicalMerkleDetector::confirms(reps[0], reps[2]));
}

TEST(CanonicalMerkleDetectorTest, ReorderedStatementsDoNotMatch) {
    auto reps = build({declarations_function("decl-1", "d.ts", false), declarations_function("decl-2", "d.ts", true)});

    EXPECT_TRUE(CanonicalMerkleDetector{}.detect(reps, opts(0.8)).pairs.empty());
    EXPECT_TRUE(ExactHashDetector{}.detect(reps, opts(0.8)).pairs.empty());
}

// ============================================================================
// Structural-weighted
// ============================================================================

TEST(StructuralWeightedDetectorTest, ScoreFormula) {
    StructuralFeatures sum{0, 1, 1, 5, 1};
    StructuralFeatures cls{3, 0, 2, 6, 2};
    StructuralConfig config;

    // 0.25*1 + 0.25*1 + 0.15*0.5 + 0.25*(1/6) + 0.10*0.5
    const double distance = 0.25 + 0.25 + 0.075 + 0.25 / 6.0 + 0.05;
    EXPECT_NEAR(StructuralWeightedDetector::score(sum, cls, config.weights), 1.0 - distance, 1e-12);
    EXPECT_DOUBLE_EQ(StructuralWeightedDetector::score(sum, sum, config.weights), 1.0);

    // All-zero features compare as identical
    EXPECT_DOUBLE_EQ(StructuralWeightedDetector::score({}, {}, config.weights), 1.0);
}

TEST(StructuralWeightedDetectorTest, SizeBuckets) {
    EXPECT_EQ(StructuralWeightedDetector::size_bucket(0, 1.5), 0);
    EXPECT_EQ(StructuralWeightedDetector::size_bucket(1, 1.5), 0);
    EXPECT_EQ(StructuralWeightedDetector::size_bucket(21, 1.5), 7);
    EXPECT_EQ(StructuralWeightedDetector::size_bucket(31, 1.5), 8);
}

TEST(StructuralWeightedDetectorTest, ReorderedStatementsScoreHigh) {
    auto reps = build({declarations_function("decl-1", "d.ts", false), declarations_function("decl-2", "d.ts", true)});

    auto result = StructuralWeightedDetector{}.detect(reps, opts(0.8));
    ASSERT_EQ(result.pairs.size(), 1u);
    EXPECT_GE(result.pairs[0].score, 0.8);
    EXPECT_EQ(result.pairs[0].explanation, "similar-structure");
}

TEST(StructuralWeightedDetectorTest, DistantSizeBucketsAreNotCompared) {
    auto small = sum_function("small", "a.ts");
    small.tokens.assign(10, "x");
    auto big = sum_function("big", "b.ts");
    big.tokens.assign(100, "x");
    auto reps = build({small, big});

    // Identical features, but buckets 5 and 11
    EXPECT_TRUE(StructuralWeightedDetector{}.detect(reps, opts(0.5)).pairs.empty());
}

// ============================================================================
// LSH-fingerprint
// ============================================================================

TEST(LshFingerprintDetectorTest, IdenticalStreamsMatchInEveryBand) {
    auto reps = build({sum_function("sum-a", "a.ts"), sum_function("sum-b", "b.ts"),
                       classify_function("classify", "c.ts")});

    auto result = LshFingerprintDetector{}.detect(reps, opts(0.8));
    ASSERT_EQ(result.pairs.size(), 1u);
    const auto& p = result.pairs[0];
    EXPECT_EQ(p.first, "sum-a");
    EXPECT_EQ(p.second, "sum-b");
    EXPECT_DOUBLE_EQ(p.score, 1.0);
    EXPECT_EQ(p.metadata.at("hamming_distance"), "0");
    EXPECT_EQ(p.metadata.at("bands_matched"), "8");
    EXPECT_EQ(p.metadata.at("merkle_confirmed"), "true");
    EXPECT_TRUE(result.warnings.empty());
}

TEST(LshFingerprintDetectorTest, OversizedBucketWarns) {
    std::vector<FunctionInfo> fns;
    for (int i = 0; i < 4; ++i) fns.push_back(sum_function("sum-" + std::to_string(i), "f.ts"));
    auto reps = build(fns);

    auto o = opts(0.8);
    o.lsh.max_bucket_size = 3;
    auto result = LshFingerprintDetector{}.detect(reps, o);

    EXPECT_TRUE(result.pairs.empty());
    ASSERT_EQ(result.warnings.size(), 8u);
    EXPECT_EQ(result.warnings[0].kind, WarningKind::BucketSkipped);
    EXPECT_EQ(result.warnings[0].detector, DetectorId::LshFingerprint);
}
