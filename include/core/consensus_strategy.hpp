/**
 * @file consensus_strategy.hpp
 * @brief Rule deciding which cross-detector agreements become groups
 *
 * The core only accepts an already-parsed strategy value; turning a compact
 * string like "weighted:exact-hash=0.5,..." into one belongs to the caller.
 */

#pragma once

#include <core/similarity_types.hpp>
#include <map>
#include <string>

namespace Twinscan {

class TWINSCAN_API ConsensusStrategy {
public:
    enum class Kind { Majority, Intersection, Union, Weighted };

    static ConsensusStrategy majority(double threshold = 0.5);
    static ConsensusStrategy intersection();
    static ConsensusStrategy union_all();
    static ConsensusStrategy weighted(std::map<DetectorId, double> weights, double threshold);

    Kind kind() const { return kind_; }
    double threshold() const { return threshold_; }
    const std::map<DetectorId, double>& weights() const { return weights_; }

    /**
     * @brief "majority", "intersection", "union" or "weighted"
     */
    std::string name() const;

    /**
     * @brief Same strategy restricted to the given detectors' weights
     */
    ConsensusStrategy with_weights(std::map<DetectorId, double> weights) const;

private:
    ConsensusStrategy(Kind kind, double threshold) : kind_(kind), threshold_(threshold) {}

    Kind kind_;
    double threshold_;
    std::map<DetectorId, double> weights_;
};

} // namespace Twinscan
