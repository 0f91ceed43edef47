/**
 * @file exact_hash_detector.cpp
 * @brief Structural and signature digest buckets
 */

#include <detectors/exact_hash_detector.hpp>
#include <map>

namespace Twinscan {

using Bucket = std::vector<const FunctionRepresentation*>;

template <typename KeyFn>
static std::map<BLAKE3Pipeline::Hash, Bucket> bucket_by(const Bucket& reps, KeyFn key) {
    std::map<BLAKE3Pipeline::Hash, Bucket> buckets;
    for (const auto* rep : reps) buckets[key(*rep)].push_back(rep);
    return buckets;
}

DetectorResult ExactHashDetector::detect(const std::vector<FunctionRepresentation>& reps,
                                         const DetectorOptions& options) const {
    const Bucket pool = eligible(reps, options);
    std::map<std::pair<std::string, std::string>, SimilarityPair> found;

    auto by_structure = bucket_by(pool, [](const FunctionRepresentation& r) { return r.structural_hash; });
    for (const auto& [hash, bucket] : by_structure) {
        if (bucket.size() < 2) continue;
        const std::string hex = BLAKE3Pipeline::to_hex(hash);
        for (size_t i = 0; i < bucket.size(); ++i) {
            for (size_t j = i + 1; j < bucket.size(); ++j) {
                if (!pair_allowed(*bucket[i], *bucket[j], options)) continue;
                auto p = SimilarityPair::make(bucket[i]->function_id, bucket[j]->function_id, id(),
                                              STRUCTURE_SCORE, "identical-structure", {{"structural_hash", hex}});
                found.emplace(p.key(), std::move(p));
            }
        }
    }

    if (SIGNATURE_SCORE >= options.threshold) {
        auto by_signature = bucket_by(pool, [](const FunctionRepresentation& r) { return r.signature_hash; });
        for (const auto& [hash, bucket] : by_signature) {
            if (bucket.size() < 2) continue;
            const std::string hex = BLAKE3Pipeline::to_hex(hash);
            for (size_t i = 0; i < bucket.size(); ++i) {
                for (size_t j = i + 1; j < bucket.size(); ++j) {
                    if (!pair_allowed(*bucket[i], *bucket[j], options)) continue;
                    auto p = SimilarityPair::make(bucket[i]->function_id, bucket[j]->function_id, id(),
                                                  SIGNATURE_SCORE, "identical-signature", {{"signature_hash", hex}});
                    // emplace keeps an existing structural match
                    found.emplace(p.key(), std::move(p));
                }
            }
        }
    }

    DetectorResult result;
    result.pairs.reserve(found.size());
    for (auto& [key, pair] : found) result.pairs.push_back(std::move(pair));
    sort_pairs(result.pairs);
    return result;
}

} // namespace Twinscan
