/**
 * @file ast_canonicalizer.cpp
 * @brief Alpha-renaming, literal normalization and Merkle hashing of ASTs
 */

#include <representation/ast_canonicalizer.hpp>
#include <vector>

namespace Twinscan {

AstCanonicalizer::AstCanonicalizer(CanonicalizerConfig config) : config_(std::move(config)) {}

std::string AstCanonicalizer::literal_category(const std::string& kind) {
    if (kind.find("String") != std::string::npos || kind.find("Template") != std::string::npos)
        return "STRING";
    if (kind.find("Numeric") != std::string::npos || kind.find("BigInt") != std::string::npos)
        return "NUMBER";
    return "LITERAL";
}

CanonicalForm AstCanonicalizer::canonicalize(const AstNode& root) const {
    if (root.kind.empty() && root.children.empty())
        throw AstRejected("empty-ast", "function has no AST");

    WalkState state;
    state.form.merkle_root = walk(root, 1, state);
    return std::move(state.form);
}

std::string AstCanonicalizer::leaf_token(const AstNode& node, WalkState& state) const {
    if (config_.identifier_kinds.count(node.kind)) {
        if (config_.preserved_names.count(node.text)) return node.text;

        auto it = state.renames.find(node.text);
        if (it != state.renames.end()) return it->second;

        std::string alias = "$" + std::to_string(state.renames.size());
        state.renames.emplace(node.text, alias);
        return alias;
    }

    if (config_.normalize_literals && config_.literal_kinds.count(node.kind))
        return literal_category(node.kind);

    return node.text.empty() ? node.kind : node.text;
}

BLAKE3Pipeline::Hash AstCanonicalizer::walk(const AstNode& node, uint32_t depth, WalkState& state) const {
    if (node.kind.empty())
        throw AstRejected("malformed-ast", "node without kind at depth " + std::to_string(depth));
    if (depth > config_.max_depth)
        throw AstRejected("ast-too-deep", "AST deeper than " + std::to_string(config_.max_depth));

    state.form.node_count++;
    if (depth > state.form.depth) state.form.depth = depth;

    if (node.is_leaf()) {
        // Identifiers without children are the only nodes that get renamed
        std::string token = leaf_token(node, state);
        state.form.tokens.push_back(token);

        BLAKE3Pipeline::Hasher hasher;
        hasher.update_u8('L').update(node.kind).update_u8(0).update(token);
        return hasher.finalize();
    }

    state.form.tokens.push_back(node.kind);

    // Child digests first: no hasher state lives on the stack across the recursion
    std::vector<BLAKE3Pipeline::Hash> child_hashes;
    child_hashes.reserve(node.children.size());
    for (const auto& child : node.children) {
        child_hashes.push_back(walk(child, depth + 1, state));
    }

    BLAKE3Pipeline::Hasher hasher;
    hasher.update_u8('N').update(node.kind).update_u8(0);
    for (const auto& h : child_hashes) hasher.update(h);
    return hasher.finalize();
}

} // namespace Twinscan
