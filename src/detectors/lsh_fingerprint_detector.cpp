/**
 * @file lsh_fingerprint_detector.cpp
 * @brief SimHash band index and candidate scoring
 */

#include <detectors/lsh_fingerprint_detector.hpp>
#include <detectors/canonical_merkle_detector.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <map>

namespace Twinscan {

LshBandIndex::LshBandIndex(uint32_t bits, uint32_t bands, size_t max_bucket_size)
    : bits_(bits), bands_(bands), width_(0), max_bucket_size_(max_bucket_size) {
    if (bands_ == 0 || bits_ % bands_ != 0)
        throw InvalidOptionsError("LSH bands (" + std::to_string(bands_) + ") must divide fingerprint bits (" +
                                  std::to_string(bits_) + ")");
    width_ = bits_ / bands_;
    if (width_ > 64)
        throw InvalidOptionsError("LSH band width " + std::to_string(width_) + " exceeds 64 bits");
}

void LshBandIndex::build(const std::vector<const FunctionRepresentation*>& reps) {
    tables_.assign(bands_, {});
    keys_.assign(reps.size(), std::vector<uint64_t>(bands_));
    skipped_.assign(bands_, 0);
    largest_.assign(bands_, 0);

    for (uint32_t i = 0; i < reps.size(); ++i) {
        if (reps[i]->fingerprint.bits != bits_)
            throw InvalidOptionsError("fingerprint of " + reps[i]->function_id + " has " +
                                      std::to_string(reps[i]->fingerprint.bits) + " bits, index expects " +
                                      std::to_string(bits_));
        for (uint32_t b = 0; b < bands_; ++b) {
            uint64_t key = reps[i]->fingerprint.band(b * width_, width_);
            keys_[i][b] = key;
            tables_[b][key].push_back(i);
        }
    }

    for (uint32_t b = 0; b < bands_; ++b) {
        for (const auto& [key, bucket] : tables_[b]) {
            largest_[b] = std::max(largest_[b], bucket.size());
            if (!usable(bucket.size())) skipped_[b]++;
        }
    }
}

std::vector<std::pair<uint32_t, uint32_t>> LshBandIndex::candidates(uint32_t i) const {
    std::map<uint32_t, uint32_t> counts;
    for (uint32_t b = 0; b < bands_; ++b) {
        const auto& bucket = tables_[b].at(keys_[i][b]);
        if (bucket.size() < 2 || !usable(bucket.size())) continue;
        for (uint32_t j : bucket) {
            if (j > i) counts[j]++;
        }
    }
    return {counts.begin(), counts.end()};
}

DetectorResult LshFingerprintDetector::detect(const std::vector<FunctionRepresentation>& reps,
                                              const DetectorOptions& options) const {
    DetectorResult result;
    const auto pool = eligible(reps, options);
    const uint32_t bits = options.fingerprint_bits;

    LshBandIndex index(bits, options.lsh.bands, options.lsh.max_bucket_size);
    index.build(pool);

    for (uint32_t b = 0; b < index.bands(); ++b) {
        if (index.skipped_buckets(b) == 0) continue;
        result.warnings.push_back(warning(WarningKind::BucketSkipped,
            "band " + std::to_string(b) + ": " + std::to_string(index.skipped_buckets(b)) +
            " bucket(s) over " + std::to_string(options.lsh.max_bucket_size) +
            " entries skipped (largest " + std::to_string(index.largest_bucket(b)) + ")"));
    }

    std::vector<std::vector<SimilarityPair>> slots(pool.size());

    #pragma omp parallel for schedule(dynamic, 256)
    for (int64_t i = 0; i < static_cast<int64_t>(pool.size()); ++i) {
        const auto& a = *pool[i];
        for (const auto& [j, bands_matched] : index.candidates(static_cast<uint32_t>(i))) {
            const auto& b = *pool[j];
            if (!pair_allowed(a, b, options)) continue;

            const uint32_t distance = hamming_distance(a.fingerprint, b.fingerprint);
            const double score = fingerprint_similarity(a.fingerprint, b.fingerprint);
            if (score < options.threshold) continue;

            slots[i].push_back(SimilarityPair::make(a.function_id, b.function_id, id(), score,
                "near-duplicate-fingerprint", {
                    {"hamming_distance", std::to_string(distance)},
                    {"bands_matched", std::to_string(bands_matched)},
                    {"merkle_confirmed", CanonicalMerkleDetector::confirms(a, b) ? "true" : "false"}
                }));
        }
    }

    for (auto& slot : slots) {
        for (auto& p : slot) result.pairs.push_back(std::move(p));
    }
    sort_pairs(result.pairs);
    return result;
}

} // namespace Twinscan
