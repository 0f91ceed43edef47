/**
 * @file confidence_calculator.cpp
 * @brief Edge confidence adjustments and run-wide confidence summary
 */

#include <consensus/confidence_calculator.hpp>
#include <algorithm>
#include <map>

namespace Twinscan {

ConfidenceResult ConfidenceCalculator::score(double base_score, size_t group_size,
                                             const ConfidenceContext& context) const {
    ConfidenceResult result;
    result.base_score = base_score;
    double value = base_score;

    if (!context.first_name.empty() && context.first_name == context.second_name) {
        value += config_.same_name_bonus;
        result.adjustments.push_back({"same-name", config_.same_name_bonus,
                                      "both functions are named '" + context.first_name + "'"});
    }

    if (context.overload_variants > 0) {
        const double penalty = -config_.overload_penalty * static_cast<double>(context.overload_variants);
        value += penalty;
        result.adjustments.push_back({"overload-variants", penalty,
                                      std::to_string(context.overload_variants) +
                                      " additional signature variant(s) share the name"});
    }

    if (group_size > config_.large_group_size) {
        value -= config_.large_group_penalty;
        result.adjustments.push_back({"large-group", -config_.large_group_penalty,
                                      "group of " + std::to_string(group_size) + " members"});
    }

    result.final_score = std::clamp(value, 0.0, 1.0);
    return result;
}

ConfidenceSummary ConfidenceCalculator::summarize(const std::vector<ConfidenceResult>& results) {
    ConfidenceSummary summary;
    summary.count = results.size();
    if (results.empty()) return summary;

    std::vector<double> scores;
    scores.reserve(results.size());
    std::map<std::string, size_t> factors;
    double sum = 0.0;

    for (const auto& r : results) {
        scores.push_back(r.final_score);
        sum += r.final_score;
        if (r.final_score < LOW_BOUND) summary.low++;
        else if (r.final_score < HIGH_BOUND) summary.medium++;
        else summary.high++;
        for (const auto& adj : r.adjustments) factors[adj.factor]++;
    }

    std::sort(scores.begin(), scores.end());
    const size_t n = scores.size();
    summary.mean = sum / static_cast<double>(n);
    summary.median = (n % 2) ? scores[n / 2] : (scores[n / 2 - 1] + scores[n / 2]) / 2.0;
    summary.min = scores.front();
    summary.max = scores.back();

    summary.top_factors.assign(factors.begin(), factors.end());
    std::stable_sort(summary.top_factors.begin(), summary.top_factors.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (summary.top_factors.size() > TOP_FACTORS) summary.top_factors.resize(TOP_FACTORS);
    return summary;
}

} // namespace Twinscan
