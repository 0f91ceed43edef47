/**
 * @file options.hpp
 * @brief Tunables for representation building, detectors and the manager
 *
 * Defaults are the values the pipeline was tuned with; every field can be
 * overridden from JSON through OptionsLoader.
 */

#pragma once

#include <core/consensus_strategy.hpp>
#include <string>
#include <vector>
#include <set>
#include <array>
#include <algorithm>
#include <cstdint>

namespace Twinscan {

struct CanonicalizerConfig {
    std::set<std::string> identifier_kinds = {"Identifier"};
    std::set<std::string> literal_kinds = {
        "StringLiteral", "NoSubstitutionTemplateLiteral", "NumericLiteral",
        "BigIntLiteral", "RegularExpressionLiteral"
    };
    // Names that keep their spelling (library members, globals)
    std::set<std::string> preserved_names = {
        "console", "log", "error", "warn", "info",
        "Array", "Object", "String", "Number", "Boolean",
        "Math", "Date", "JSON", "Promise",
        "setTimeout", "setInterval", "clearTimeout", "clearInterval",
        "parseInt", "parseFloat", "isNaN", "isFinite",
        "push", "pop", "shift", "unshift", "slice", "splice",
        "map", "filter", "reduce", "forEach", "find", "includes",
        "length", "indexOf", "toString", "valueOf"
    };
    bool normalize_literals = true;
    uint32_t max_depth = 2048;
};

struct FingerprintConfig {
    uint32_t bits = 64;            // 64 or 128
    uint32_t min_ngram = 3;
    uint32_t max_ngram = 5;
    uint64_t hyperplane_seed = 0x7477696e7363616eULL;
};

struct FeatureKinds {
    std::set<std::string> branch_kinds = {
        "IfStatement", "SwitchStatement", "CaseClause", "ConditionalExpression", "CatchClause"
    };
    std::set<std::string> loop_kinds = {
        "ForStatement", "ForInStatement", "ForOfStatement", "WhileStatement", "DoStatement"
    };
    // Kinds ending in "Statement" always count; these are the extras
    std::set<std::string> extra_statement_kinds = {"VariableDeclarationList"};
};

/**
 * @brief LSH banding over the fingerprint. bands must divide the fingerprint width.
 */
struct LshConfig {
    uint32_t bands = 8;
    size_t max_bucket_size = 512;  // 0 = unbounded
};

struct StructuralConfig {
    // branch, loop, nesting, statements, parameters
    std::array<double, 5> weights = {0.25, 0.25, 0.15, 0.25, 0.10};
    double bucket_growth = 1.5;    // geometric width of tokenCount size buckets
};

struct HnswParams {
    size_t M = 16;
    size_t ef_construction = 200;
    size_t ef_search = 64;
};

struct AnnConfig {
    size_t top_k = 10;
    HnswParams hnsw;
};

struct ConfidenceConfig {
    double same_name_bonus = 0.05;
    double overload_penalty = 0.10;
    double large_group_penalty = 0.05;
    size_t large_group_size = 8;
};

/**
 * @brief What every detector sees: the uniform filters plus its own tuning
 */
struct DetectorOptions {
    double threshold = 0.8;
    uint32_t min_lines = 5;
    bool cross_file = true;

    uint32_t fingerprint_bits = 64;
    LshConfig lsh;
    StructuralConfig structural;
    AnnConfig ann;
};

struct SimilarityOptions {
    double threshold = 0.8;
    int64_t min_lines = 5;
    bool cross_file = true;
    std::vector<std::string> enabled_detectors;  // empty = every available detector
    ConsensusStrategy consensus = ConsensusStrategy::union_all();

    CanonicalizerConfig canonicalizer;
    FingerprintConfig fingerprint;
    FeatureKinds feature_kinds;
    LshConfig lsh;
    StructuralConfig structural;
    AnnConfig ann;
    ConfidenceConfig confidence;

    DetectorOptions detector_options() const {
        DetectorOptions d;
        d.threshold = threshold;
        d.min_lines = min_lines <= 0 ? 0 : static_cast<uint32_t>(std::min<int64_t>(min_lines, UINT32_MAX));
        d.cross_file = cross_file;
        d.fingerprint_bits = fingerprint.bits;
        d.lsh = lsh;
        d.structural = structural;
        d.ann = ann;
        return d;
    }
};

} // namespace Twinscan
