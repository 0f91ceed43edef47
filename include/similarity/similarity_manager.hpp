/**
 * @file similarity_manager.hpp
 * @brief Entry point: validate -> build -> detect -> aggregate -> score -> rank
 */

#pragma once

#include <consensus/confidence_calculator.hpp>
#include <consensus/consensus_aggregator.hpp>
#include <core/cancellation.hpp>
#include <core/function_info.hpp>
#include <core/options.hpp>
#include <detectors/similarity_detector.hpp>
#include <representation/representation_builder.hpp>
#include <representation/representation_cache.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace Twinscan {

struct StageTiming {
    std::string stage;
    double ms = 0.0;
};

/**
 * @brief What a set of detectors produced over one representation batch
 */
struct DetectorRun {
    PairsByDetector pairs;                  // completed detectors only
    std::vector<DetectorWarning> warnings;
    std::vector<DetectorId> ran;            // detector order
    std::set<DetectorId> degraded;          // threw, or reported unavailable
};

/**
 * @brief Everything one run produced, beyond the groups themselves
 */
struct DetectionReport {
    std::vector<SimilarityGroup> groups;
    std::vector<DetectorWarning> warnings;
    std::vector<SkipRecord> skipped;
    std::vector<DetectorId> detectors_run;      // contributed to aggregation
    std::vector<StageTiming> stage_timings;
    CacheStats cache_stats;
    ConfidenceSummary confidence;
    size_t function_count = 0;
    size_t representation_count = 0;
};

/**
 * @brief Orchestrates a detection run
 *
 * Holds no state between runs apart from what the caller passes in: the
 * optional embedding provider and the optional representation cache. Enabled
 * detectors run concurrently, each into its own result slot; a detector that
 * throws is reported as a warning and left out of aggregation.
 */
class TWINSCAN_API SimilarityManager {
public:
    explicit SimilarityManager(const EmbeddingProvider* provider = nullptr, RepresentationCache* cache = nullptr)
        : provider_(provider), cache_(cache) {}

    /**
     * @brief Groups of similar functions, highest refactoring priority first
     * @throws InvalidOptionsError, AggregationError, OperationCancelled
     */
    std::vector<SimilarityGroup> detect_similarities(const std::vector<FunctionInfo>& functions,
                                                     const SimilarityOptions& options,
                                                     const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Same run, with warnings, skips, timings and cache statistics
     */
    DetectionReport run(const std::vector<FunctionInfo>& functions,
                        const SimilarityOptions& options,
                        const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Fail-fast option checks; nothing has run when this throws
     */
    static void validate(const SimilarityOptions& options);

    /**
     * @brief Enabled detector names -> ids, in canonical order. Empty list = all detectors.
     */
    static std::vector<DetectorId> resolve_detectors(const SimilarityOptions& options);

    /**
     * @brief Run detectors concurrently, one result slot each
     *
     * Nothing a detector throws escapes: any exception, standard or not,
     * becomes a detector-failed warning and the detector counts as degraded.
     */
    static DetectorRun run_detectors(const std::vector<std::unique_ptr<SimilarityDetector>>& detectors,
                                     const std::vector<FunctionRepresentation>& reps,
                                     const DetectorOptions& options);

    static RefactoringImpact refactoring_impact(double average_complexity, uint64_t combined_lines);

private:
    const EmbeddingProvider* provider_;
    RepresentationCache* cache_;
};

} // namespace Twinscan
