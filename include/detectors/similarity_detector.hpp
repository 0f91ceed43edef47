/**
 * @file similarity_detector.hpp
 * @brief Common contract of the five detectors and the factory over DetectorId
 */

#pragma once

#include <core/options.hpp>
#include <core/representation.hpp>
#include <core/similarity_types.hpp>
#include <memory>
#include <vector>

namespace Twinscan {

struct DetectorResult {
    std::vector<SimilarityPair> pairs;      // sorted by pair_order
    std::vector<DetectorWarning> warnings;
};

/**
 * @brief One strategy for finding similar function pairs
 *
 * Detectors are stateless between calls and never mutate their input, so the
 * manager may run several of them at once over the same representation set.
 * Every detector applies the same filters before emitting a pair: both sides
 * have at least min_lines lines, and with cross_file off they share a file.
 */
class TWINSCAN_API SimilarityDetector {
public:
    virtual ~SimilarityDetector() = default;

    virtual DetectorId id() const = 0;
    const char* name() const { return to_string(id()); }

    /**
     * @brief Whether the inputs this detector needs are present at all
     */
    virtual bool is_available(const std::vector<FunctionRepresentation>& reps) const {
        (void)reps;
        return true;
    }

    virtual DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                                  const DetectorOptions& options) const = 0;

protected:
    /**
     * @brief Representations passing the min_lines filter, in input order
     */
    static std::vector<const FunctionRepresentation*> eligible(const std::vector<FunctionRepresentation>& reps,
                                                               const DetectorOptions& options);

    static bool pair_allowed(const FunctionRepresentation& a, const FunctionRepresentation& b,
                             const DetectorOptions& options) {
        if (a.function_id == b.function_id) return false;
        return options.cross_file || a.file_path == b.file_path;
    }

    static void sort_pairs(std::vector<SimilarityPair>& pairs);

    DetectorWarning warning(WarningKind kind, std::string message) const {
        return DetectorWarning{id(), kind, std::move(message)};
    }
};

TWINSCAN_API std::unique_ptr<SimilarityDetector> make_detector(DetectorId id);

} // namespace Twinscan
