/**
 * @file confidence_calculator.hpp
 * @brief Final per-edge confidence with an auditable list of adjustments
 */

#pragma once

#include <core/options.hpp>
#include <core/similarity_types.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Twinscan {

/**
 * @brief Facts about an edge that the pair itself does not carry
 */
struct ConfidenceContext {
    std::string first_name;
    std::string second_name;
    size_t overload_variants = 0;   // extra signature variants of this name in the group
};

struct ConfidenceResult {
    double final_score = 0.0;
    double base_score = 0.0;
    std::vector<ConfidenceAdjustment> adjustments;
};

struct ConfidenceSummary {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    size_t low = 0;      // < 0.7
    size_t medium = 0;   // [0.7, 0.9)
    size_t high = 0;     // >= 0.9
    std::vector<std::pair<std::string, size_t>> top_factors;
};

class TWINSCAN_API ConfidenceCalculator {
public:
    static constexpr double LOW_BOUND = 0.7;
    static constexpr double HIGH_BOUND = 0.9;
    static constexpr size_t TOP_FACTORS = 5;

    explicit ConfidenceCalculator(ConfidenceConfig config = {}) : config_(config) {}

    /**
     * @brief Base score adjusted for naming, overloads and group size, clamped to [0, 1]
     */
    ConfidenceResult score(double base_score, size_t group_size, const ConfidenceContext& context) const;

    ConfidenceResult score(const SimilarityPair& pair, size_t group_size, const ConfidenceContext& context) const {
        return score(pair.score, group_size, context);
    }

    static ConfidenceSummary summarize(const std::vector<ConfidenceResult>& results);

private:
    ConfidenceConfig config_;
};

} // namespace Twinscan
