/**
 * @file similarity_detector.cpp
 * @brief Shared detector filters, pair ordering and the detector factory
 */

#include <detectors/similarity_detector.hpp>
#include <detectors/exact_hash_detector.hpp>
#include <detectors/canonical_merkle_detector.hpp>
#include <detectors/lsh_fingerprint_detector.hpp>
#include <detectors/structural_weighted_detector.hpp>
#include <detectors/semantic_ann_detector.hpp>
#include <algorithm>

namespace Twinscan {

std::vector<const FunctionRepresentation*> SimilarityDetector::eligible(const std::vector<FunctionRepresentation>& reps,
                                                                        const DetectorOptions& options) {
    std::vector<const FunctionRepresentation*> out;
    out.reserve(reps.size());
    for (const auto& rep : reps) {
        if (rep.line_count >= options.min_lines) out.push_back(&rep);
    }
    return out;
}

void SimilarityDetector::sort_pairs(std::vector<SimilarityPair>& pairs) {
    std::sort(pairs.begin(), pairs.end(), pair_order);
}

std::unique_ptr<SimilarityDetector> make_detector(DetectorId id) {
    switch (id) {
        case DetectorId::ExactHash:          return std::make_unique<ExactHashDetector>();
        case DetectorId::StructuralWeighted: return std::make_unique<StructuralWeightedDetector>();
        case DetectorId::CanonicalMerkle:    return std::make_unique<CanonicalMerkleDetector>();
        case DetectorId::LshFingerprint:     return std::make_unique<LshFingerprintDetector>();
        case DetectorId::SemanticAnn:        return std::make_unique<SemanticAnnDetector>();
    }
    return nullptr;
}

} // namespace Twinscan
