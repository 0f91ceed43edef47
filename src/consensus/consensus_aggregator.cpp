/**
 * @file consensus_aggregator.cpp
 * @brief Strategy vote per edge, union-find grouping, group ordering
 */

#include <consensus/consensus_aggregator.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

namespace Twinscan {

static constexpr double EPS = 1e-9;

namespace {

struct EdgeAccum {
    std::map<DetectorId, double> scores;
    std::set<std::string> explanations;
};

class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) rank_[a]++;
    }

private:
    std::vector<size_t> parent_;
    std::vector<uint8_t> rank_;
};

} // namespace

size_t ConsensusAggregator::majority_quorum(double threshold, size_t detector_count) {
    const auto q = static_cast<size_t>(std::ceil(threshold * static_cast<double>(detector_count) - EPS));
    return std::max<size_t>(q, 1);
}

bool ConsensusAggregator::keeps(const ConsensusStrategy& strategy, const std::vector<DetectorId>& present,
                                size_t detector_count) {
    if (present.empty()) return false;
    switch (strategy.kind()) {
        case ConsensusStrategy::Kind::Union:
            return true;
        case ConsensusStrategy::Kind::Intersection:
            return present.size() >= detector_count;
        case ConsensusStrategy::Kind::Majority:
            return present.size() >= majority_quorum(strategy.threshold(), detector_count);
        case ConsensusStrategy::Kind::Weighted: {
            double total = 0.0;
            for (DetectorId d : present) {
                auto it = strategy.weights().find(d);
                if (it != strategy.weights().end()) total += it->second;
            }
            return total + EPS >= strategy.threshold();
        }
    }
    return false;
}

std::vector<SimilarityGroup> ConsensusAggregator::aggregate(const PairsByDetector& pairs,
                                                            const ConsensusStrategy& strategy) const {
    if (strategy.kind() == ConsensusStrategy::Kind::Weighted) {
        for (const auto& [detector, weight] : strategy.weights()) {
            if (!pairs.count(detector))
                throw AggregationError(std::string("weight given for detector '") + to_string(detector) +
                                       "' which did not run");
        }
    }

    // Multigraph collapsed to one accumulator per unordered pair
    std::map<std::pair<std::string, std::string>, EdgeAccum> edges;
    for (const auto& [detector, list] : pairs) {
        for (const auto& p : list) {
            auto& acc = edges[p.key()];
            auto it = acc.scores.find(detector);
            if (it == acc.scores.end() || p.score > it->second) acc.scores[detector] = p.score;
            if (!p.explanation.empty()) acc.explanations.insert(p.explanation);
        }
    }

    std::map<std::string, size_t> node_index;
    std::vector<std::string> nodes;
    std::vector<std::pair<const std::pair<std::string, std::string>*, const EdgeAccum*>> kept;

    for (const auto& [key, acc] : edges) {
        std::vector<DetectorId> present;
        for (const auto& [d, s] : acc.scores) present.push_back(d);
        if (!keeps(strategy, present, pairs.size())) continue;

        kept.emplace_back(&key, &acc);
        for (const std::string* id : {&key.first, &key.second}) {
            if (node_index.emplace(*id, nodes.size()).second) nodes.push_back(*id);
        }
    }

    DisjointSet dsu(nodes.size());
    for (const auto& [key, acc] : kept) dsu.unite(node_index[key->first], node_index[key->second]);

    // Component root -> group under construction
    struct Building {
        std::set<std::string> members;
        std::vector<GroupEdge> edges;
        std::set<DetectorId> detectors;
        std::set<std::string> explanations;
        double score_sum = 0.0;
        size_t score_count = 0;
    };
    std::map<size_t, Building> components;

    for (const auto& [key, acc] : kept) {
        auto& g = components[dsu.find(node_index[key->first])];
        g.members.insert(key->first);
        g.members.insert(key->second);

        GroupEdge edge;
        edge.first = key->first;
        edge.second = key->second;
        double sum = 0.0;
        for (const auto& [d, s] : acc->scores) {
            edge.detectors.push_back(d);
            g.detectors.insert(d);
            sum += s;
            g.score_sum += s;
            g.score_count++;
        }
        edge.score = sum / static_cast<double>(acc->scores.size());
        g.explanations.insert(acc->explanations.begin(), acc->explanations.end());
        g.edges.push_back(std::move(edge));
    }

    std::vector<SimilarityGroup> groups;
    groups.reserve(components.size());
    for (auto& [root, b] : components) {
        SimilarityGroup g;
        g.members.assign(b.members.begin(), b.members.end());
        g.similarity = b.score_count ? b.score_sum / static_cast<double>(b.score_count) : 0.0;
        g.detector = "consensus-" + strategy.name();
        g.contributing_detectors.assign(b.detectors.begin(), b.detectors.end());
        for (const auto& e : b.explanations) {
            if (!g.explanation.empty()) g.explanation += ";";
            g.explanation += e;
        }
        g.edges = std::move(b.edges);
        g.metadata["group_size"] = std::to_string(g.members.size());
        g.metadata["edge_count"] = std::to_string(g.edges.size());
        groups.push_back(std::move(g));
    }

    std::sort(groups.begin(), groups.end(), [](const SimilarityGroup& a, const SimilarityGroup& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.members < b.members;
    });
    return groups;
}

} // namespace Twinscan
