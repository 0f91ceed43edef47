/**
 * @file result_serializer.hpp
 * @brief Groups and detection reports as deterministic JSON
 */

#pragma once

#include <similarity/similarity_manager.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Twinscan {

/**
 * @brief JSON export of groups and reports
 *
 * Key order is fixed and every collection is already sorted upstream, so two
 * identical runs serialize to identical bytes. Stage timings are the only
 * run-dependent values and are left out unless asked for.
 */
class TWINSCAN_API ResultSerializer {
public:
    static nlohmann::json to_json(const SimilarityGroup& group);
    static nlohmann::json to_json(const std::vector<SimilarityGroup>& groups);
    static nlohmann::json to_json(const DetectionReport& report, bool include_timings = false);
    static nlohmann::json to_json(const ConfidenceSummary& summary);

    static std::string dump(const nlohmann::json& j, int indent = 2) { return j.dump(indent); }
};

} // namespace Twinscan
