/**
 * @file consensus_aggregator.hpp
 * @brief Multigraph of detector pairs -> connected similarity groups
 */

#pragma once

#include <core/consensus_strategy.hpp>
#include <core/similarity_types.hpp>
#include <map>
#include <vector>

namespace Twinscan {

using PairsByDetector = std::map<DetectorId, std::vector<SimilarityPair>>;

/**
 * @brief Union-find over the edges a strategy keeps
 *
 * The detector set is the key set of the input map: Intersection requires
 * every one of them, Majority(t) at least ceil(t * n).
 */
class TWINSCAN_API ConsensusAggregator {
public:
    /**
     * @throws AggregationError when weighted keys name detectors absent from the map
     */
    std::vector<SimilarityGroup> aggregate(const PairsByDetector& pairs, const ConsensusStrategy& strategy) const;

    /**
     * @brief Whether an edge seen by `present` detectors survives the strategy
     */
    static bool keeps(const ConsensusStrategy& strategy, const std::vector<DetectorId>& present,
                      size_t detector_count);

    static size_t majority_quorum(double threshold, size_t detector_count);
};

} // namespace Twinscan
