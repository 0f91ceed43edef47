/**
 * @file canonical_merkle_detector.hpp
 * @brief Clones up to renaming: equal Merkle roots of the canonical AST
 */

#pragma once

#include <detectors/similarity_detector.hpp>

namespace Twinscan {

/**
 * @brief Pairs sharing a canonical Merkle root (renaming-insensitive clones)
 */
class TWINSCAN_API CanonicalMerkleDetector : public SimilarityDetector {
public:
    DetectorId id() const override { return DetectorId::CanonicalMerkle; }

    DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                          const DetectorOptions& options) const override;

    /**
     * @brief Exact structural confirmation for a candidate pair
     */
    static bool confirms(const FunctionRepresentation& a, const FunctionRepresentation& b) {
        return a.structural_hash == b.structural_hash;
    }
};

} // namespace Twinscan
