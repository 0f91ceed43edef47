/**
 * @file options_loader.cpp
 * @brief SimilarityOptions from JSON, with field paths in every error
 */

#include <io/options_loader.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <stdexcept>

namespace Twinscan {

using json = nlohmann::json;

// Overwrite `out` only when the key is present
template <typename T>
static void read(const json& j, const char* key, const std::string& where, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& ex) {
        throw std::runtime_error(where + key + ": " + ex.what());
    }
}

static const json* section(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return nullptr;
    if (!it->is_object()) throw std::runtime_error(std::string(key) + ": expected object");
    return &*it;
}

static DetectorId detector_from_name(const std::string& name) {
    auto id = parse_detector_id(name);
    if (!id) throw InvalidOptionsError("unknown detector '" + name + "'");
    return *id;
}

ConsensusStrategy OptionsLoader::strategy_from_json(const json& j) {
    if (j.is_string()) {
        const auto type = j.get<std::string>();
        if (type == "union") return ConsensusStrategy::union_all();
        if (type == "intersection") return ConsensusStrategy::intersection();
        if (type == "majority") return ConsensusStrategy::majority();
        throw InvalidOptionsError("strategy '" + type + "' needs an object form");
    }
    if (!j.is_object()) throw std::runtime_error("consensus: expected object or string");

    std::string type = "union";
    read(j, "type", "consensus.", type);

    if (type == "union") return ConsensusStrategy::union_all();
    if (type == "intersection") return ConsensusStrategy::intersection();
    if (type == "majority") {
        double threshold = 0.5;
        read(j, "threshold", "consensus.", threshold);
        return ConsensusStrategy::majority(threshold);
    }
    if (type == "weighted") {
        double threshold = 0.5;
        read(j, "threshold", "consensus.", threshold);

        std::map<std::string, double> named;
        read(j, "weights", "consensus.", named);

        std::map<DetectorId, double> weights;
        for (const auto& [name, w] : named) weights[detector_from_name(name)] = w;
        return ConsensusStrategy::weighted(std::move(weights), threshold);
    }
    throw InvalidOptionsError("unknown consensus strategy '" + type + "'");
}

SimilarityOptions OptionsLoader::from_json(const json& doc) {
    if (!doc.is_object()) throw std::runtime_error("options: expected object");

    SimilarityOptions o;
    read(doc, "threshold", "", o.threshold);
    read(doc, "minLines", "", o.min_lines);
    read(doc, "crossFile", "", o.cross_file);
    read(doc, "enabledDetectors", "", o.enabled_detectors);
    for (const auto& name : o.enabled_detectors) detector_from_name(name);

    if (doc.contains("consensus") && !doc["consensus"].is_null())
        o.consensus = strategy_from_json(doc["consensus"]);

    if (const json* c = section(doc, "canonicalizer")) {
        read(*c, "identifierKinds", "canonicalizer.", o.canonicalizer.identifier_kinds);
        read(*c, "literalKinds", "canonicalizer.", o.canonicalizer.literal_kinds);
        read(*c, "preservedNames", "canonicalizer.", o.canonicalizer.preserved_names);
        read(*c, "normalizeLiterals", "canonicalizer.", o.canonicalizer.normalize_literals);
        read(*c, "maxDepth", "canonicalizer.", o.canonicalizer.max_depth);
    }
    if (const json* f = section(doc, "fingerprint")) {
        read(*f, "bits", "fingerprint.", o.fingerprint.bits);
        read(*f, "minNgram", "fingerprint.", o.fingerprint.min_ngram);
        read(*f, "maxNgram", "fingerprint.", o.fingerprint.max_ngram);
        read(*f, "seed", "fingerprint.", o.fingerprint.hyperplane_seed);
    }
    if (const json* k = section(doc, "features")) {
        read(*k, "branchKinds", "features.", o.feature_kinds.branch_kinds);
        read(*k, "loopKinds", "features.", o.feature_kinds.loop_kinds);
        read(*k, "statementKinds", "features.", o.feature_kinds.extra_statement_kinds);
    }
    if (const json* l = section(doc, "lsh")) {
        read(*l, "bands", "lsh.", o.lsh.bands);
        read(*l, "maxBucketSize", "lsh.", o.lsh.max_bucket_size);
    }
    if (const json* s = section(doc, "structural")) {
        read(*s, "weights", "structural.", o.structural.weights);
        read(*s, "bucketGrowth", "structural.", o.structural.bucket_growth);
    }
    if (const json* a = section(doc, "ann")) {
        read(*a, "topK", "ann.", o.ann.top_k);
        read(*a, "M", "ann.", o.ann.hnsw.M);
        read(*a, "efConstruction", "ann.", o.ann.hnsw.ef_construction);
        read(*a, "efSearch", "ann.", o.ann.hnsw.ef_search);
    }
    if (const json* c = section(doc, "confidence")) {
        read(*c, "sameNameBonus", "confidence.", o.confidence.same_name_bonus);
        read(*c, "overloadPenalty", "confidence.", o.confidence.overload_penalty);
        read(*c, "largeGroupPenalty", "confidence.", o.confidence.large_group_penalty);
        read(*c, "largeGroupSize", "confidence.", o.confidence.large_group_size);
    }
    return o;
}

SimilarityOptions OptionsLoader::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open " + path.string());

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error(path.string() + ": " + ex.what());
    }
    return from_json(doc);
}

} // namespace Twinscan
