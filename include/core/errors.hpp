/**
 * @file errors.hpp
 * @brief Configuration-level failures that abort a run
 *
 * Per-function and per-detector failures are never thrown: they are recorded
 * as SkipRecord / DetectorWarning and the run continues.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Twinscan {

/**
 * @brief Bad threshold, min_lines, detector name or strategy. Raised before any detector runs.
 */
class InvalidOptionsError : public std::invalid_argument {
public:
    explicit InvalidOptionsError(const std::string& what)
        : std::invalid_argument("Invalid options: " + what) {}
};

/**
 * @brief Weighted strategy references detectors that are unknown or not enabled.
 */
class AggregationError : public std::runtime_error {
public:
    explicit AggregationError(const std::string& what)
        : std::runtime_error("Aggregation error: " + what) {}
};

class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& stage)
        : std::runtime_error("Detection cancelled before stage: " + stage) {}
};

} // namespace Twinscan
