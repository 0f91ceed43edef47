/**
 * @file representation_builder.cpp
 * @brief Parallel FunctionInfo -> FunctionRepresentation build with skip records
 */

#include <representation/representation_builder.hpp>
#include <algorithm>
#include <exception>
#include <unordered_set>

namespace Twinscan {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static void hash_kind_set(BLAKE3Pipeline::Hasher& hasher, const std::set<std::string>& kinds) {
    hasher.update_u64(kinds.size());
    for (const auto& k : kinds) hasher.update(k).update_u8(0);
}

RepresentationBuilder::RepresentationBuilder(CanonicalizerConfig canonicalizer, FingerprintConfig fingerprint,
                                             FeatureKinds feature_kinds)
    : canonicalizer_(std::move(canonicalizer)),
      simhasher_(std::move(fingerprint)),
      feature_kinds_(std::move(feature_kinds)) {
    const auto& cc = canonicalizer_.config();
    const auto& fc = simhasher_.config();

    BLAKE3Pipeline::Hasher hasher;
    hasher.update("twinscan.representation.v1");
    hash_kind_set(hasher, cc.identifier_kinds);
    hash_kind_set(hasher, cc.literal_kinds);
    hash_kind_set(hasher, cc.preserved_names);
    hasher.update_u8(cc.normalize_literals ? 1 : 0).update_u64(cc.max_depth);
    hasher.update_u64(fc.bits).update_u64(fc.min_ngram).update_u64(fc.max_ngram).update_u64(fc.hyperplane_seed);
    hash_kind_set(hasher, feature_kinds_.branch_kinds);
    hash_kind_set(hasher, feature_kinds_.loop_kinds);
    hash_kind_set(hasher, feature_kinds_.extra_statement_kinds);
    settings_digest_ = hasher.finalize();
}

RepresentationBuilder::RepresentationBuilder(const SimilarityOptions& options)
    : RepresentationBuilder(options.canonicalizer, options.fingerprint, options.feature_kinds) {}

BLAKE3Pipeline::Hash RepresentationBuilder::signature_hash(const FunctionSignature& signature) {
    std::string text = signature.name + "(";
    for (size_t i = 0; i < signature.parameter_types.size(); ++i) {
        if (i) text += ",";
        text += signature.parameter_types[i];
    }
    text += ")->" + signature.return_type;
    return BLAKE3Pipeline::hash(text);
}

BLAKE3Pipeline::Hash RepresentationBuilder::content_digest(const FunctionInfo& fn) const {
    BLAKE3Pipeline::Hasher hasher;
    hasher.update(settings_digest_);
    hasher.update(fn.name).update_u8(0).update(fn.file_path).update_u8(0);
    hasher.update_u64(fn.start_line).update_u64(fn.end_line);

    if (fn.metrics) {
        hasher.update_u8(1).update_u64(fn.metrics->lines_of_code).update_u64(fn.metrics->cyclomatic_complexity);
    } else {
        hasher.update_u8(0);
    }

    hasher.update_u64(fn.tokens.size());
    for (const auto& t : fn.tokens) hasher.update(t).update_u8(0);

    hasher.update(signature_hash(fn.signature));

    // Iterative so that pathological depth cannot blow the stack before the depth check
    std::vector<const AstNode*> stack{&fn.ast};
    while (!stack.empty()) {
        const AstNode* node = stack.back();
        stack.pop_back();
        hasher.update(node->kind).update_u8(0).update(node->text).update_u8(0);
        hasher.update_u64(node->children.size());
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) stack.push_back(&*it);
    }
    return hasher.finalize();
}

void RepresentationBuilder::count_features(const AstNode& node, uint32_t nesting, StructuralFeatures& out) const {
    const bool is_branch = feature_kinds_.branch_kinds.count(node.kind) > 0;
    const bool is_loop = feature_kinds_.loop_kinds.count(node.kind) > 0;

    if (is_branch) out.branch_count++;
    if (is_loop) out.loop_count++;
    if (ends_with(node.kind, "Statement") || feature_kinds_.extra_statement_kinds.count(node.kind))
        out.statement_count++;

    if (is_branch || is_loop) {
        nesting++;
        out.nesting_depth = std::max(out.nesting_depth, nesting);
    }
    for (const auto& child : node.children) count_features(child, nesting, out);
}

StructuralFeatures RepresentationBuilder::extract_features(const AstNode& ast, const FunctionSignature& signature) const {
    StructuralFeatures features;
    count_features(ast, 0, features);
    features.parameter_count = static_cast<uint32_t>(signature.parameter_types.size());
    return features;
}

FunctionRepresentation RepresentationBuilder::build_one(const FunctionInfo& fn) const {
    CanonicalForm form = canonicalizer_.canonicalize(fn.ast);

    FunctionRepresentation rep;
    rep.function_id = fn.id;
    rep.name = fn.name;
    rep.file_path = fn.file_path;
    rep.start_line = fn.start_line;
    rep.end_line = fn.end_line;
    rep.line_count = fn.line_count();
    rep.token_count = static_cast<uint32_t>(fn.tokens.empty() ? form.tokens.size() : fn.tokens.size());

    rep.structural_hash = form.merkle_root;
    rep.fingerprint = simhasher_.fingerprint(fn.tokens, form.tokens);

    FunctionSignature sig = fn.signature;
    if (sig.name.empty()) sig.name = fn.name;
    rep.signature_hash = signature_hash(sig);

    rep.features = extract_features(fn.ast, fn.signature);
    if (fn.metrics && fn.metrics->cyclomatic_complexity > 0) {
        rep.complexity = fn.metrics->cyclomatic_complexity;
    } else {
        rep.complexity = 1 + rep.features.branch_count + rep.features.loop_count;
    }
    return rep;
}

BuildResult RepresentationBuilder::build(const std::vector<FunctionInfo>& functions,
                                         const EmbeddingProvider* provider,
                                         RepresentationCache* cache) const {
    const size_t n = functions.size();

    std::vector<std::optional<SkipRecord>> rejected(n);
    std::vector<size_t> eligible;
    eligible.reserve(n);

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < n; ++i) {
        const auto& fn = functions[i];
        if (fn.id.empty()) {
            rejected[i] = SkipRecord{"", "missing-id", "function '" + fn.name + "' in " + fn.file_path};
        } else if (!seen.insert(fn.id).second) {
            rejected[i] = SkipRecord{fn.id, "duplicate-id", "id already used by an earlier function"};
        } else {
            eligible.push_back(i);
        }
    }

    std::vector<std::optional<FunctionRepresentation>> built(n);
    std::vector<std::exception_ptr> failures(n);

    #pragma omp parallel for schedule(dynamic, 64)
    for (int64_t e = 0; e < static_cast<int64_t>(eligible.size()); ++e) {
        const size_t i = eligible[e];
        const auto& fn = functions[i];
        try {
            BLAKE3Pipeline::Hash digest{};
            if (cache) {
                digest = content_digest(fn);
                if (auto hit = cache->lookup(fn.id, digest)) {
                    built[i] = std::move(*hit);
                    continue;
                }
            }
            FunctionRepresentation rep = build_one(fn);
            if (cache) cache->store(fn.id, digest, rep);
            built[i] = std::move(rep);
        } catch (const AstRejected& ex) {
            rejected[i] = SkipRecord{fn.id, ex.reason(), ex.what()};
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    // Anything other than a rejected AST (allocation failure etc.) is not a skip reason
    for (const auto& f : failures) {
        if (f) std::rethrow_exception(f);
    }

    BuildResult result;
    result.representations.reserve(eligible.size());
    for (size_t i = 0; i < n; ++i) {
        if (rejected[i]) {
            result.skipped.push_back(std::move(*rejected[i]));
            continue;
        }
        if (!built[i]) continue;

        FunctionRepresentation& rep = *built[i];
        const auto& fn = functions[i];
        if (fn.embedding) {
            rep.embedding = fn.embedding;
        } else if (provider) {
            rep.embedding = provider->get_embedding(fn.id);
        }
        result.representations.push_back(std::move(rep));
    }
    return result;
}

} // namespace Twinscan
