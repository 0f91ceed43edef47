/**
 * @file representation.hpp
 * @brief Comparable per-function artifacts produced by the RepresentationBuilder
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <array>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace Twinscan {

/**
 * @brief B-bit SimHash fingerprint, B ∈ {64, 128}
 *
 * Bit i lives in words[i / 64], bit position i % 64. Bits past `bits` are zero.
 */
struct Fingerprint {
    std::array<uint64_t, 2> words = {0, 0};
    uint32_t bits = 64;

    bool get(uint32_t i) const { return (words[i >> 6] >> (i & 63)) & 1ULL; }
    void set(uint32_t i) { words[i >> 6] |= (1ULL << (i & 63)); }

    /**
     * @brief Extract `width` bits starting at `offset` (width ≤ 64)
     */
    uint64_t band(uint32_t offset, uint32_t width) const;

    bool operator==(const Fingerprint& other) const {
        return bits == other.bits && words == other.words;
    }
};

uint32_t hamming_distance(const Fingerprint& a, const Fingerprint& b);

/**
 * @brief Fingerprint similarity: 1 - distance / B
 */
double fingerprint_similarity(const Fingerprint& a, const Fingerprint& b);

struct StructuralFeatures {
    uint32_t branch_count = 0;
    uint32_t loop_count = 0;
    uint32_t nesting_depth = 0;
    uint32_t statement_count = 0;
    uint32_t parameter_count = 0;

    static constexpr size_t SIZE = 5;
    std::array<double, SIZE> as_array() const {
        return {double(branch_count), double(loop_count), double(nesting_depth),
                double(statement_count), double(parameter_count)};
    }
};

struct FunctionRepresentation {
    std::string function_id;
    std::string name;
    std::string file_path;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    uint32_t line_count = 0;
    uint32_t token_count = 0;
    uint32_t complexity = 0;

    BLAKE3Pipeline::Hash structural_hash{};
    Fingerprint fingerprint;
    BLAKE3Pipeline::Hash signature_hash{};
    StructuralFeatures features;
    std::optional<std::vector<float>> embedding;
};

/**
 * @brief Why a function was left out of the representation set
 */
struct SkipRecord {
    std::string function_id;
    std::string reason;      // empty-ast, malformed-ast, ast-too-deep, missing-id, duplicate-id
    std::string detail;
};

} // namespace Twinscan
