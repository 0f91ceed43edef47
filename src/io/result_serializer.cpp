/**
 * @file result_serializer.cpp
 * @brief JSON export of groups, reports and confidence summaries
 */

#include <io/result_serializer.hpp>

namespace Twinscan {

using json = nlohmann::json;

static json detector_list(const std::vector<DetectorId>& ids) {
    json out = json::array();
    for (DetectorId id : ids) out.push_back(to_string(id));
    return out;
}

json ResultSerializer::to_json(const SimilarityGroup& group) {
    json edges = json::array();
    for (const auto& e : group.edges) {
        json adjustments = json::array();
        for (const auto& a : e.adjustments) {
            adjustments.push_back({{"factor", a.factor}, {"adjustment", a.adjustment}, {"reason", a.reason}});
        }
        edges.push_back({
            {"first", e.first},
            {"second", e.second},
            {"detectors", detector_list(e.detectors)},
            {"score", e.score},
            {"confidence", e.confidence},
            {"adjustments", adjustments}
        });
    }

    return {
        {"members", group.members},
        {"similarity", group.similarity},
        {"confidence", group.confidence},
        {"detector", group.detector},
        {"contributingDetectors", detector_list(group.contributing_detectors)},
        {"explanation", group.explanation},
        {"metadata", group.metadata},
        {"refactoringImpact", to_string(group.refactoring_impact)},
        {"priority", group.priority},
        {"edges", edges}
    };
}

json ResultSerializer::to_json(const std::vector<SimilarityGroup>& groups) {
    json out = json::array();
    for (const auto& g : groups) out.push_back(to_json(g));
    return out;
}

json ResultSerializer::to_json(const ConfidenceSummary& summary) {
    json factors = json::array();
    for (const auto& [factor, count] : summary.top_factors) {
        factors.push_back({{"factor", factor}, {"count", count}});
    }
    return {
        {"count", summary.count},
        {"mean", summary.mean},
        {"median", summary.median},
        {"min", summary.min},
        {"max", summary.max},
        {"distribution", {{"low", summary.low}, {"medium", summary.medium}, {"high", summary.high}}},
        {"topFactors", factors}
    };
}

json ResultSerializer::to_json(const DetectionReport& report, bool include_timings) {
    json warnings = json::array();
    for (const auto& w : report.warnings) {
        warnings.push_back({{"detector", to_string(w.detector)}, {"kind", to_string(w.kind)}, {"message", w.message}});
    }

    json skipped = json::array();
    for (const auto& s : report.skipped) {
        skipped.push_back({{"functionId", s.function_id}, {"reason", s.reason}, {"detail", s.detail}});
    }

    json out = {
        {"functionCount", report.function_count},
        {"representationCount", report.representation_count},
        {"detectors", detector_list(report.detectors_run)},
        {"groups", to_json(report.groups)},
        {"warnings", warnings},
        {"skipped", skipped},
        {"confidence", to_json(report.confidence)}
    };

    if (include_timings) {
        json timings = json::object();
        for (const auto& t : report.stage_timings) timings[t.stage] = t.ms;
        out["stageTimings"] = timings;
        out["cache"] = {{"hits", report.cache_stats.hits},
                        {"misses", report.cache_stats.misses},
                        {"entries", report.cache_stats.entries}};
    }
    return out;
}

} // namespace Twinscan
