/**
 * @file structural_weighted_detector.cpp
 * @brief Size-bucketed structural feature comparison
 */

#include <detectors/structural_weighted_detector.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace Twinscan {

double StructuralWeightedDetector::score(const StructuralFeatures& a, const StructuralFeatures& b,
                                         const std::array<double, StructuralFeatures::SIZE>& weights) {
    const auto va = a.as_array();
    const auto vb = b.as_array();

    double weighted = 0.0;
    double total = 0.0;
    for (size_t i = 0; i < StructuralFeatures::SIZE; ++i) {
        const double denom = std::max({va[i], vb[i], 1.0});
        weighted += weights[i] * (std::abs(va[i] - vb[i]) / denom);
        total += weights[i];
    }
    if (total <= 0.0) return 0.0;
    return 1.0 - weighted / total;
}

int32_t StructuralWeightedDetector::size_bucket(uint32_t token_count, double growth) {
    if (token_count <= 1) return 0;
    return static_cast<int32_t>(std::floor(std::log(static_cast<double>(token_count)) / std::log(growth)));
}

static std::string format_score(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

DetectorResult StructuralWeightedDetector::detect(const std::vector<FunctionRepresentation>& reps,
                                                  const DetectorOptions& options) const {
    const auto& cfg = options.structural;
    if (!(cfg.bucket_growth > 1.0))
        throw InvalidOptionsError("structural bucket growth must be > 1");

    const auto pool = eligible(reps, options);

    std::map<int32_t, std::vector<uint32_t>> buckets;
    std::vector<int32_t> bucket_of(pool.size());
    for (uint32_t i = 0; i < pool.size(); ++i) {
        bucket_of[i] = size_bucket(pool[i]->token_count, cfg.bucket_growth);
        buckets[bucket_of[i]].push_back(i);
    }

    std::vector<std::vector<SimilarityPair>> slots(pool.size());

    #pragma omp parallel for schedule(dynamic, 128)
    for (int64_t i = 0; i < static_cast<int64_t>(pool.size()); ++i) {
        const auto& a = *pool[i];
        const int32_t bucket = bucket_of[i];

        auto compare = [&](uint32_t j) {
            const auto& b = *pool[j];
            if (!pair_allowed(a, b, options)) return;
            const double s = score(a.features, b.features, cfg.weights);
            if (s < options.threshold) return;
            slots[i].push_back(SimilarityPair::make(a.function_id, b.function_id, id(), s,
                "similar-structure", {
                    {"size_bucket", std::to_string(std::min(bucket, bucket_of[j]))},
                    {"feature_distance", format_score(1.0 - s)}
                }));
        };

        // Own bucket: only later entries, so each pair is visited once
        for (uint32_t j : buckets.at(bucket)) {
            if (j > i) compare(j);
        }
        auto next = buckets.find(bucket + 1);
        if (next != buckets.end()) {
            for (uint32_t j : next->second) compare(j);
        }
    }

    DetectorResult result;
    for (auto& slot : slots) {
        for (auto& p : slot) result.pairs.push_back(std::move(p));
    }
    sort_pairs(result.pairs);
    return result;
}

} // namespace Twinscan
