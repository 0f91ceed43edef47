/**
 * @file representation_cache.hpp
 * @brief Caller-owned representation cache keyed by function id and content digest
 */

#pragma once

#include <core/representation.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Twinscan {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t entries = 0;
};

/**
 * @brief Caller-owned store of built representations.
 *
 * Keyed by function id; an entry is only reused when the content digest
 * (tokens, AST, signature, builder settings) still matches. Safe to share
 * between the builder's worker threads.
 */
class RepresentationCache {
public:
    RepresentationCache() = default;

    std::optional<FunctionRepresentation> lookup(const std::string& function_id,
                                                 const BLAKE3Pipeline::Hash& digest) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(function_id);
        if (it == entries_.end() || it->second.digest != digest) {
            misses_++;
            return std::nullopt;
        }
        hits_++;
        return it->second.rep;
    }

    void store(const std::string& function_id, const BLAKE3Pipeline::Hash& digest,
               FunctionRepresentation rep) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[function_id] = Entry{digest, std::move(rep)};
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return CacheStats{hits_, misses_, entries_.size()};
    }

private:
    struct Entry {
        BLAKE3Pipeline::Hash digest;
        FunctionRepresentation rep;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace Twinscan
