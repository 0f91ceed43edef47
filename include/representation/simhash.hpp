/**
 * @file simhash.hpp
 * @brief Weighted n-gram SimHash over token streams
 */

#pragma once

#include <core/options.hpp>
#include <core/representation.hpp>
#include <string>
#include <vector>

namespace Twinscan {

/**
 * @brief Charikar SimHash with BLAKE3 hyperplanes
 *
 * Each distinct shingle is hashed (seeded) to B bits; bit i is the sign of the
 * shingle on hyperplane i. Shingle multiplicity is its weight. Bit i of the
 * fingerprint is set when the weighted sum on hyperplane i is positive.
 */
class TWINSCAN_API SimHasher {
public:
    explicit SimHasher(FingerprintConfig config = {});

    /**
     * @brief Fingerprint a token stream
     * @param tokens Lexical tokens of the function body
     * @param fallback Canonical AST tokens, used when `tokens` is too short to shingle
     */
    Fingerprint fingerprint(const std::vector<std::string>& tokens,
                            const std::vector<std::string>& fallback = {}) const;

    /**
     * @brief All n-gram shingles (min_ngram..max_ngram) of a sequence, joined by 0x1F
     */
    std::vector<std::string> shingles(const std::vector<std::string>& tokens) const;

    const FingerprintConfig& config() const { return config_; }

private:
    FingerprintConfig config_;
};

} // namespace Twinscan
