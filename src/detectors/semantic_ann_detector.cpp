/**
 * @file semantic_ann_detector.cpp
 * @brief HNSW nearest neighbours over normalized embeddings
 */

#include <detectors/semantic_ann_detector.hpp>
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace Twinscan {

static constexpr size_t HNSW_SEED = 100;

bool SemanticAnnDetector::is_available(const std::vector<FunctionRepresentation>& reps) const {
    return std::any_of(reps.begin(), reps.end(),
                       [](const FunctionRepresentation& r) { return r.embedding && !r.embedding->empty(); });
}

DetectorResult SemanticAnnDetector::detect(const std::vector<FunctionRepresentation>& reps,
                                           const DetectorOptions& options) const {
    DetectorResult result;
    const auto pool = eligible(reps, options);

    // Reference dimension: the first embedding in input order
    size_t dim = 0;
    for (const auto* rep : pool) {
        if (rep->embedding && !rep->embedding->empty()) {
            dim = rep->embedding->size();
            break;
        }
    }
    if (dim == 0) {
        result.warnings.push_back(warning(WarningKind::DetectorUnavailable,
            "no embeddings available for " + std::to_string(pool.size()) + " eligible functions"));
        return result;
    }

    std::vector<const FunctionRepresentation*> indexed;
    std::vector<const float*> sources;
    size_t missing = 0;
    for (const auto* rep : pool) {
        if (!rep->embedding || rep->embedding->empty()) {
            missing++;
            continue;
        }
        const auto& e = *rep->embedding;
        if (e.size() != dim) {
            result.warnings.push_back(warning(WarningKind::InputExcluded,
                rep->function_id + ": embedding dimension " + std::to_string(e.size()) +
                " != " + std::to_string(dim)));
            continue;
        }
        Eigen::Map<const Eigen::VectorXf> v(e.data(), static_cast<Eigen::Index>(dim));
        const float norm = v.norm();
        if (!(norm > 0.0f) || !std::isfinite(norm)) {
            result.warnings.push_back(warning(WarningKind::InputExcluded,
                rep->function_id + ": zero or non-finite embedding"));
            continue;
        }
        indexed.push_back(rep);
        sources.push_back(e.data());
    }
    if (missing > 0) {
        result.warnings.push_back(warning(WarningKind::InputExcluded,
            std::to_string(missing) + " function(s) without embedding left out"));
    }

    const size_t n = indexed.size();
    if (n < 2) return result;

    Matrix vectors(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(dim));
    for (size_t i = 0; i < n; ++i) {
        Eigen::Map<const Eigen::VectorXf> v(sources[i], static_cast<Eigen::Index>(dim));
        vectors.row(static_cast<Eigen::Index>(i)) = v.normalized().transpose();
    }

    const auto& hp = options.ann.hnsw;
    hnswlib::InnerProductSpace space(dim);
    hnswlib::HierarchicalNSW<float> index(&space, n, hp.M, hp.ef_construction, HNSW_SEED);

    // Serial insertion keeps the graph identical across runs
    for (size_t i = 0; i < n; ++i) {
        index.addPoint(vectors.row(static_cast<Eigen::Index>(i)).data(), static_cast<hnswlib::labeltype>(i));
    }
    const size_t k = std::min(options.ann.top_k + 1, n);
    index.setEf(std::max(hp.ef_search, k));

    std::vector<std::vector<std::pair<size_t, double>>> slots(n);

    #pragma omp parallel for schedule(dynamic, 64)
    for (int64_t i = 0; i < static_cast<int64_t>(n); ++i) {
        auto pq = index.searchKnn(vectors.row(i).data(), k);
        while (!pq.empty()) {
            const size_t j = static_cast<size_t>(pq.top().second);
            pq.pop();
            if (j == static_cast<size_t>(i)) continue;
            if (!pair_allowed(*indexed[i], *indexed[j], options)) continue;

            // Exact cosine from the normalized rows, not the approximate graph distance
            const double cosine = std::clamp(
                static_cast<double>(vectors.row(i).dot(vectors.row(static_cast<Eigen::Index>(j)))), -1.0, 1.0);
            if (cosine < options.threshold) continue;
            slots[i].emplace_back(j, cosine);
        }
    }

    // A pair found from both ends is emitted once
    std::map<std::pair<std::string, std::string>, SimilarityPair> found;
    for (size_t i = 0; i < n; ++i) {
        for (const auto& [j, cosine] : slots[i]) {
            std::ostringstream cs;
            cs << std::fixed << std::setprecision(6) << cosine;
            auto p = SimilarityPair::make(indexed[i]->function_id, indexed[j]->function_id, id(), cosine,
                                          "semantic-neighbour", {{"cosine", cs.str()}, {"dimension", std::to_string(dim)}});
            found.emplace(p.key(), std::move(p));
        }
    }

    for (auto& [key, pair] : found) result.pairs.push_back(std::move(pair));
    sort_pairs(result.pairs);
    return result;
}

} // namespace Twinscan
