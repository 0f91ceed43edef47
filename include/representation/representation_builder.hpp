/**
 * @file representation_builder.hpp
 * @brief FunctionInfo -> FunctionRepresentation
 *
 * Pure and deterministic: the same functions and settings always produce the
 * same representations, in input order. A function that cannot be represented
 * is skipped with a reason; the batch itself never fails on bad input.
 */

#pragma once

#include <core/function_info.hpp>
#include <core/options.hpp>
#include <core/representation.hpp>
#include <representation/ast_canonicalizer.hpp>
#include <representation/representation_cache.hpp>
#include <representation/simhash.hpp>
#include <vector>

namespace Twinscan {

struct BuildResult {
    std::vector<FunctionRepresentation> representations;
    std::vector<SkipRecord> skipped;
};

class TWINSCAN_API RepresentationBuilder {
public:
    RepresentationBuilder(CanonicalizerConfig canonicalizer, FingerprintConfig fingerprint,
                          FeatureKinds feature_kinds = {});
    explicit RepresentationBuilder(const SimilarityOptions& options);

    /**
     * @brief Build representations for a batch (parallel)
     * @param provider Consulted for functions without an inline embedding; may be null
     * @param cache Reused across runs when the caller keeps it; may be null
     */
    BuildResult build(const std::vector<FunctionInfo>& functions,
                      const EmbeddingProvider* provider = nullptr,
                      RepresentationCache* cache = nullptr) const;

    /**
     * @brief Build a single representation, without embedding lookup
     * @throws AstRejected when the AST cannot be canonicalized
     */
    FunctionRepresentation build_one(const FunctionInfo& fn) const;

    StructuralFeatures extract_features(const AstNode& ast, const FunctionSignature& signature) const;

    /**
     * @brief H(name || '(' || types joined by ',' || ')' || "->" || return type)
     */
    static BLAKE3Pipeline::Hash signature_hash(const FunctionSignature& signature);

    /**
     * @brief Digest of everything build_one reads, plus the builder settings
     */
    BLAKE3Pipeline::Hash content_digest(const FunctionInfo& fn) const;

private:
    void count_features(const AstNode& node, uint32_t nesting, StructuralFeatures& out) const;

    AstCanonicalizer canonicalizer_;
    SimHasher simhasher_;
    FeatureKinds feature_kinds_;
    BLAKE3Pipeline::Hash settings_digest_{};
};

} // namespace Twinscan
