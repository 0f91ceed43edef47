/**
 * @file simhash.cpp
 * @brief Token shingles and SimHash fingerprints over BLAKE3 projections
 */

#include <representation/simhash.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <array>
#include <unordered_map>

namespace Twinscan {

static constexpr char SHINGLE_SEP = '\x1F';

SimHasher::SimHasher(FingerprintConfig config) : config_(std::move(config)) {
    if (config_.bits != 64 && config_.bits != 128)
        throw InvalidOptionsError("fingerprint bits must be 64 or 128, got " + std::to_string(config_.bits));
    if (config_.min_ngram == 0 || config_.min_ngram > config_.max_ngram)
        throw InvalidOptionsError("n-gram range must satisfy 1 <= min <= max");
}

std::vector<std::string> SimHasher::shingles(const std::vector<std::string>& tokens) const {
    std::vector<std::string> out;
    const size_t n_tok = tokens.size();

    for (uint32_t n = config_.min_ngram; n <= config_.max_ngram; ++n) {
        if (n > n_tok) break;
        for (size_t i = 0; i + n <= n_tok; ++i) {
            std::string s;
            for (size_t j = 0; j < n; ++j) {
                if (j) s.push_back(SHINGLE_SEP);
                s += tokens[i + j];
            }
            out.push_back(std::move(s));
        }
    }
    return out;
}

Fingerprint SimHasher::fingerprint(const std::vector<std::string>& tokens,
                                   const std::vector<std::string>& fallback) const {
    Fingerprint fp;
    fp.bits = config_.bits;

    const std::vector<std::string>* source = &tokens;
    if (tokens.size() < config_.min_ngram && !fallback.empty()) source = &fallback;

    std::unordered_map<std::string, int64_t> weights;
    for (auto& s : shingles(*source)) weights[std::move(s)]++;

    // Too short for even one n-gram: the whole sequence is the only shingle
    if (weights.empty() && !source->empty()) {
        std::string s;
        for (size_t j = 0; j < source->size(); ++j) {
            if (j) s.push_back(SHINGLE_SEP);
            s += (*source)[j];
        }
        weights[s] = 1;
    }
    if (weights.empty()) return fp;

    const size_t n_bytes = config_.bits / 8;
    std::array<int64_t, 128> sums{};
    uint8_t digest[16];

    for (const auto& [shingle, w] : weights) {
        BLAKE3Pipeline::Hasher hasher;
        hasher.update_u64(config_.hyperplane_seed).update(shingle);
        hasher.finalize_into(digest, n_bytes);

        for (uint32_t i = 0; i < config_.bits; ++i) {
            const bool positive = (digest[i >> 3] >> (i & 7)) & 1;
            sums[i] += positive ? w : -w;
        }
    }

    for (uint32_t i = 0; i < config_.bits; ++i) {
        if (sums[i] > 0) fp.set(i);
    }
    return fp;
}

} // namespace Twinscan
