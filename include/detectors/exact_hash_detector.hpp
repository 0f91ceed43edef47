/**
 * @file exact_hash_detector.hpp
 * @brief Identical-structure and identical-signature matching by digest
 */

#pragma once

#include <detectors/similarity_detector.hpp>

namespace Twinscan {

/**
 * @brief Identical structure (score 1.0) or identical signature (score 0.6)
 *
 * At most one pair per function pair; a structural match wins over a
 * signature match. Signature matches are only emitted when 0.6 meets the
 * threshold.
 */
class TWINSCAN_API ExactHashDetector : public SimilarityDetector {
public:
    static constexpr double STRUCTURE_SCORE = 1.0;
    static constexpr double SIGNATURE_SCORE = 0.6;

    DetectorId id() const override { return DetectorId::ExactHash; }

    DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                          const DetectorOptions& options) const override;
};

} // namespace Twinscan
