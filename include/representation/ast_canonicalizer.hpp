/**
 * @file ast_canonicalizer.hpp
 * @brief Alpha-renaming AST walk and BLAKE3 Merkle root
 *
 * Local identifiers become $0, $1, ... in first-seen pre-order, literals
 * collapse to their category, and every node is hashed bottom-up:
 *
 *   leaf     = H('L' || kind || 0x00 || canonical token)
 *   internal = H('N' || kind || 0x00 || child_0 || ... || child_n)
 *
 * Two functions that differ only by a consistent renaming of locals therefore
 * share a root; reordering statements or changing control flow does not.
 */

#pragma once

#include <core/function_info.hpp>
#include <core/options.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace Twinscan {

/**
 * @brief AST the canonicalizer refuses; reason is a SkipRecord reason code
 */
class AstRejected : public std::runtime_error {
public:
    AstRejected(std::string reason, const std::string& detail)
        : std::runtime_error(detail), reason_(std::move(reason)) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

struct CanonicalForm {
    BLAKE3Pipeline::Hash merkle_root{};
    std::vector<std::string> tokens;   // Pre-order canonical token sequence
    uint32_t node_count = 0;
    uint32_t depth = 0;
};

class TWINSCAN_API AstCanonicalizer {
public:
    explicit AstCanonicalizer(CanonicalizerConfig config = {});

    /**
     * @brief Canonicalize and hash one function body
     * @throws AstRejected on empty, malformed or too-deep trees
     */
    CanonicalForm canonicalize(const AstNode& root) const;

    /**
     * @brief "STRING", "NUMBER" or "LITERAL" for a literal node kind
     */
    static std::string literal_category(const std::string& kind);

    const CanonicalizerConfig& config() const { return config_; }

private:
    struct WalkState {
        std::unordered_map<std::string, std::string> renames;
        CanonicalForm form;
    };

    BLAKE3Pipeline::Hash walk(const AstNode& node, uint32_t depth, WalkState& state) const;
    std::string leaf_token(const AstNode& node, WalkState& state) const;

    CanonicalizerConfig config_;
};

} // namespace Twinscan
