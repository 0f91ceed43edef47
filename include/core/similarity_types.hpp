/**
 * @file similarity_types.hpp
 * @brief Detector ids, similarity pairs, groups and warnings
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <array>
#include <utility>

namespace Twinscan {

/**
 * @brief Closed set of detector variants
 */
enum class DetectorId {
    ExactHash,
    StructuralWeighted,
    CanonicalMerkle,
    LshFingerprint,
    SemanticAnn
};

inline constexpr std::array<DetectorId, 5> ALL_DETECTORS = {
    DetectorId::ExactHash,
    DetectorId::StructuralWeighted,
    DetectorId::CanonicalMerkle,
    DetectorId::LshFingerprint,
    DetectorId::SemanticAnn
};

TWINSCAN_API const char* to_string(DetectorId id);
TWINSCAN_API std::optional<DetectorId> parse_detector_id(const std::string& name);

using Metadata = std::map<std::string, std::string>;

/**
 * @brief One detector's opinion that two functions are similar
 *
 * The pair is unordered; construction through make() stores first < second.
 */
struct SimilarityPair {
    std::string first;
    std::string second;
    DetectorId detector = DetectorId::ExactHash;
    double score = 0.0;
    std::string explanation;
    Metadata metadata;

    static SimilarityPair make(const std::string& a, const std::string& b, DetectorId detector,
                               double score, std::string explanation, Metadata metadata = {}) {
        SimilarityPair p;
        if (a < b) { p.first = a; p.second = b; }
        else       { p.first = b; p.second = a; }
        p.detector = detector;
        p.score = score;
        p.explanation = std::move(explanation);
        p.metadata = std::move(metadata);
        return p;
    }

    std::pair<std::string, std::string> key() const { return {first, second}; }
};

/**
 * @brief Ordering used everywhere pairs are emitted: score desc, then ids
 */
inline bool pair_order(const SimilarityPair& a, const SimilarityPair& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.first != b.first) return a.first < b.first;
    return a.second < b.second;
}

struct ConfidenceAdjustment {
    std::string factor;
    double adjustment = 0.0;
    std::string reason;
};

enum class RefactoringImpact { Low, Medium, High };

TWINSCAN_API const char* to_string(RefactoringImpact impact);

/**
 * @brief An internal edge of a consensus group, with its confidence breakdown
 */
struct GroupEdge {
    std::string first;
    std::string second;
    std::vector<DetectorId> detectors;
    double score = 0.0;           // mean of contributing detector scores
    double confidence = 0.0;
    std::vector<ConfidenceAdjustment> adjustments;
};

struct SimilarityGroup {
    std::vector<std::string> members;       // sorted, size >= 2
    double similarity = 0.0;
    double confidence = 0.0;
    std::string detector;                   // "consensus-<strategy>"
    std::vector<DetectorId> contributing_detectors;
    std::string explanation;
    Metadata metadata;
    std::vector<GroupEdge> edges;
    RefactoringImpact refactoring_impact = RefactoringImpact::Low;
    double priority = 0.0;
};

enum class WarningKind {
    DetectorUnavailable,
    DetectorFailed,
    InputExcluded,
    BucketSkipped
};

TWINSCAN_API const char* to_string(WarningKind kind);

struct DetectorWarning {
    DetectorId detector = DetectorId::ExactHash;
    WarningKind kind = WarningKind::DetectorUnavailable;
    std::string message;
};

} // namespace Twinscan
