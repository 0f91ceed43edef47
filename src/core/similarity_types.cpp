/**
 * @file similarity_types.cpp
 * @brief Name tables for detector ids, impacts and warning kinds
 */

#include <core/similarity_types.hpp>

namespace Twinscan {

const char* to_string(DetectorId id) {
    switch (id) {
        case DetectorId::ExactHash:          return "exact-hash";
        case DetectorId::StructuralWeighted: return "structural-weighted";
        case DetectorId::CanonicalMerkle:    return "canonical-merkle";
        case DetectorId::LshFingerprint:     return "lsh-fingerprint";
        case DetectorId::SemanticAnn:        return "semantic-ann";
    }
    return "unknown";
}

std::optional<DetectorId> parse_detector_id(const std::string& name) {
    for (DetectorId id : ALL_DETECTORS) {
        if (name == to_string(id)) return id;
    }
    return std::nullopt;
}

const char* to_string(RefactoringImpact impact) {
    switch (impact) {
        case RefactoringImpact::Low:    return "low";
        case RefactoringImpact::Medium: return "medium";
        case RefactoringImpact::High:   return "high";
    }
    return "low";
}

const char* to_string(WarningKind kind) {
    switch (kind) {
        case WarningKind::DetectorUnavailable: return "detector-unavailable";
        case WarningKind::DetectorFailed:      return "detector-failed";
        case WarningKind::InputExcluded:       return "input-excluded";
        case WarningKind::BucketSkipped:       return "bucket-skipped";
    }
    return "unknown";
}

} // namespace Twinscan
