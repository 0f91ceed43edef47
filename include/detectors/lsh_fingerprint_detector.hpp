/**
 * @file lsh_fingerprint_detector.hpp
 * @brief Banded LSH over SimHash fingerprints
 *
 * Stage 1: the B-bit fingerprint is cut into k bands of B/k bits; two
 * functions become candidates when they land in the same bucket of at least
 * one band. Stage 2: the exact Hamming distance decides.
 */

#pragma once

#include <detectors/similarity_detector.hpp>
#include <unordered_map>
#include <utility>

namespace Twinscan {

/**
 * @brief Per-band bucket tables. Built once per run, read-only afterwards.
 */
class TWINSCAN_API LshBandIndex {
public:
    /**
     * @throws InvalidOptionsError unless bands >= 1, bands divides bits and bits/bands <= 64
     */
    LshBandIndex(uint32_t bits, uint32_t bands, size_t max_bucket_size = 0);

    void build(const std::vector<const FunctionRepresentation*>& reps);

    /**
     * @brief Entries j > i sharing at least one usable bucket with i, with the band count
     */
    std::vector<std::pair<uint32_t, uint32_t>> candidates(uint32_t i) const;

    size_t size() const { return keys_.size(); }
    uint32_t bands() const { return bands_; }
    uint32_t band_width() const { return width_; }

    /**
     * @brief Buckets of this band ignored for exceeding max_bucket_size
     */
    size_t skipped_buckets(uint32_t band) const { return skipped_[band]; }
    size_t largest_bucket(uint32_t band) const { return largest_[band]; }

private:
    bool usable(size_t bucket_size) const {
        return max_bucket_size_ == 0 || bucket_size <= max_bucket_size_;
    }

    uint32_t bits_;
    uint32_t bands_;
    uint32_t width_;
    size_t max_bucket_size_;

    std::vector<std::unordered_map<uint64_t, std::vector<uint32_t>>> tables_;
    std::vector<std::vector<uint64_t>> keys_;
    std::vector<size_t> skipped_;
    std::vector<size_t> largest_;
};

class TWINSCAN_API LshFingerprintDetector : public SimilarityDetector {
public:
    DetectorId id() const override { return DetectorId::LshFingerprint; }

    DetectorResult detect(const std::vector<FunctionRepresentation>& reps,
                          const DetectorOptions& options) const override;
};

} // namespace Twinscan
