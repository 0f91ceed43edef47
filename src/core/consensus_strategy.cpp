/**
 * @file consensus_strategy.cpp
 * @brief Consensus strategy construction, quorum and keep rules
 */

#include <core/consensus_strategy.hpp>

namespace Twinscan {

ConsensusStrategy ConsensusStrategy::majority(double threshold) {
    return ConsensusStrategy(Kind::Majority, threshold);
}

ConsensusStrategy ConsensusStrategy::intersection() {
    return ConsensusStrategy(Kind::Intersection, 1.0);
}

ConsensusStrategy ConsensusStrategy::union_all() {
    return ConsensusStrategy(Kind::Union, 1.0);
}

ConsensusStrategy ConsensusStrategy::weighted(std::map<DetectorId, double> weights, double threshold) {
    ConsensusStrategy s(Kind::Weighted, threshold);
    s.weights_ = std::move(weights);
    return s;
}

std::string ConsensusStrategy::name() const {
    switch (kind_) {
        case Kind::Majority:     return "majority";
        case Kind::Intersection: return "intersection";
        case Kind::Union:        return "union";
        case Kind::Weighted:     return "weighted";
    }
    return "union";
}

ConsensusStrategy ConsensusStrategy::with_weights(std::map<DetectorId, double> weights) const {
    ConsensusStrategy s = *this;
    s.weights_ = std::move(weights);
    return s;
}

} // namespace Twinscan
