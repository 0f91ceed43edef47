/**
 * @file structural_weighted_detector.hpp
 * @brief Weighted distance over structural feature vectors, bucketed by size
 */

#pragma once

#include <detectors/similarity_detector.hpp>

namespace Twinscan {

/**
 * @brief Weighted distance over branch/loop/nesting/statement/parameter counts
 *
 * Functions are binned geometrically by token count and only compared within
 * their own bin and the next one up, which keeps the search sub-quadratic on
 * corpora with a wide size spread.
 */
class TWINSCAN_API StructuralWeightedDetector : public SimilarityDetector {
public:
    DetectorId id() const override { return DetectorId::StructuralWeighted; }

    DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                          const DetectorOptions& options) const override;

    /**
     * @brief 1 - sum(w_i * |a_i - b_i| / max(a_i, b_i, 1)) / sum(w_i)
     */
    static double score(const StructuralFeatures& a, const StructuralFeatures& b,
                        const std::array<double, StructuralFeatures::SIZE>& weights);

    static int32_t size_bucket(uint32_t token_count, double growth);
};

} // namespace Twinscan
