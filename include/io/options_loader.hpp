/**
 * @file options_loader.hpp
 * @brief SimilarityOptions from JSON
 *
 * Every key is optional and falls back to the in-class default. The
 * consensus strategy is a structured object, for example
 *
 *   "consensus": {"type": "weighted", "threshold": 0.6,
 *                 "weights": {"exact-hash": 0.5, "lsh-fingerprint": 0.5}}
 */

#pragma once

#include <core/options.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace Twinscan {

class TWINSCAN_API OptionsLoader {
public:
    /**
     * @throws InvalidOptionsError for unknown detector or strategy names
     * @throws std::runtime_error for fields of the wrong type
     */
    static SimilarityOptions from_json(const nlohmann::json& doc);

    static SimilarityOptions load_file(const std::filesystem::path& path);

    static ConsensusStrategy strategy_from_json(const nlohmann::json& j);
};

} // namespace Twinscan
