/**
 * @file semantic_ann_detector.hpp
 * @brief Cosine top-k neighbours over function embeddings (HNSW)
 */

#pragma once

#include <detectors/similarity_detector.hpp>
#include <Eigen/Core>

namespace Twinscan {

/**
 * @brief Embedding nearest-neighbour detector
 *
 * Embeddings are L2-normalized with Eigen and inserted serially into an
 * hnswlib inner-product index, so the graph (and the result) is the same on
 * every run. Queries fan out over OpenMP. Vectors of the wrong dimension or
 * with zero norm are excluded with a warning; no embeddings at all yields an
 * empty result and a warning, never an error.
 */
class TWINSCAN_API SemanticAnnDetector : public SimilarityDetector {
public:
    using Matrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    DetectorId id() const override { return DetectorId::SemanticAnn; }

    bool is_available(const std::vector<FunctionRepresentation>& reps) const override;

    DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                          const DetectorOptions& options) const override;
};

} // namespace Twinscan
