/**
 * @file canonical_merkle_detector.cpp
 * @brief Merkle-root buckets over canonical ASTs
 */

#include <detectors/canonical_merkle_detector.hpp>
#include <map>

namespace Twinscan {

DetectorResult CanonicalMerkleDetector::detect(const std::vector<FunctionRepresentation>& reps,
                                               const DetectorOptions& options) const {
    std::map<BLAKE3Pipeline::Hash, std::vector<const FunctionRepresentation*>> buckets;
    for (const auto* rep : eligible(reps, options)) buckets[rep->structural_hash].push_back(rep);

    DetectorResult result;
    for (const auto& [root, bucket] : buckets) {
        if (bucket.size() < 2) continue;
        const std::string hex = BLAKE3Pipeline::to_hex(root);
        for (size_t i = 0; i < bucket.size(); ++i) {
            for (size_t j = i + 1; j < bucket.size(); ++j) {
                if (!pair_allowed(*bucket[i], *bucket[j], options)) continue;
                result.pairs.push_back(SimilarityPair::make(
                    bucket[i]->function_id, bucket[j]->function_id, id(), 1.0, "merkle-root-match",
                    {{"merkle_root", hex}, {"bucket_size", std::to_string(bucket.size())}}));
            }
        }
    }
    sort_pairs(result.pairs);
    return result;
}

} // namespace Twinscan
