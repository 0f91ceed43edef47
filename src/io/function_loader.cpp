/**
 * @file function_loader.cpp
 * @brief JSON -> FunctionInfo, with field paths in every error
 */

#include <io/function_loader.hpp>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace Twinscan {

using json = nlohmann::json;

template <typename T>
static T field(const json& j, const char* key, const std::string& where, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& ex) {
        throw std::runtime_error(where + "." + key + ": " + ex.what());
    }
}

static bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

AstNode FunctionLoader::ast_from_json(const json& j, const std::string& where, uint32_t max_depth) {
    struct Pending {
        const json* src;
        AstNode* dst;
        uint32_t depth;
        size_t trail;
    };

    // (parent entry, child index) per visited node; paths are only spelled out on error
    std::vector<std::pair<size_t, size_t>> trail{{SIZE_MAX, 0}};
    auto path_of = [&](size_t t) {
        std::vector<size_t> indices;
        for (; trail[t].first != SIZE_MAX; t = trail[t].first) indices.push_back(trail[t].second);
        std::string path = where;
        for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
            path += ".children[" + std::to_string(*it) + "]";
        }
        return path;
    };

    AstNode root;
    std::vector<Pending> stack{{&j, &root, 1, 0}};
    while (!stack.empty()) {
        const Pending p = stack.back();
        stack.pop_back();

        if (!p.src->is_object()) throw std::runtime_error(path_of(p.trail) + ": AST node must be an object");
        if (p.depth > max_depth) {
            throw std::runtime_error(path_of(p.trail) + ": AST nested deeper than " +
                                     std::to_string(max_depth) + " levels");
        }
        if (!read_string(*p.src, "kind", p.dst->kind))
            throw std::runtime_error(path_of(p.trail) + ".kind: expected string");
        if (!read_string(*p.src, "text", p.dst->text))
            throw std::runtime_error(path_of(p.trail) + ".text: expected string");

        auto it = p.src->find("children");
        if (it == p.src->end() || it->is_null()) continue;
        if (!it->is_array()) throw std::runtime_error(path_of(p.trail) + ".children: expected array");

        // Sized once, so the child pointers below stay valid
        p.dst->children.resize(it->size());
        for (size_t i = it->size(); i-- > 0;) {
            trail.emplace_back(p.trail, i);
            stack.push_back({&(*it)[i], &p.dst->children[i], p.depth + 1, trail.size() - 1});
        }
    }
    return root;
}

FunctionInfo FunctionLoader::function_from_json(const json& j, const std::string& where,
                                                uint32_t max_ast_depth) {
    if (!j.is_object()) throw std::runtime_error(where + ": function record must be an object");

    FunctionInfo fn;
    fn.id = field<std::string>(j, "id", where, "");
    fn.name = field<std::string>(j, "name", where, "");
    fn.file_path = field<std::string>(j, "filePath", where, "");
    fn.start_line = field<uint32_t>(j, "startLine", where, 0);
    fn.end_line = field<uint32_t>(j, "endLine", where, 0);
    fn.tokens = field<std::vector<std::string>>(j, "tokens", where, {});

    if (j.contains("ast") && !j["ast"].is_null()) fn.ast = ast_from_json(j["ast"], where + ".ast", max_ast_depth);

    if (j.contains("signature") && j["signature"].is_object()) {
        const auto& s = j["signature"];
        const std::string sw = where + ".signature";
        fn.signature.name = field<std::string>(s, "name", sw, fn.name);
        fn.signature.parameter_types = field<std::vector<std::string>>(s, "parameterTypes", sw, {});
        fn.signature.return_type = field<std::string>(s, "returnType", sw, "");
    } else {
        fn.signature.name = fn.name;
    }

    if (j.contains("metrics") && j["metrics"].is_object()) {
        const auto& m = j["metrics"];
        const std::string mw = where + ".metrics";
        FunctionMetrics metrics;
        metrics.lines_of_code = field<uint32_t>(m, "linesOfCode", mw, 0);
        metrics.cyclomatic_complexity = field<uint32_t>(m, "cyclomaticComplexity", mw, 0);
        fn.metrics = metrics;
    }

    if (j.contains("embedding") && !j["embedding"].is_null()) {
        fn.embedding = field<std::vector<float>>(j, "embedding", where, {});
    }
    return fn;
}

std::vector<FunctionInfo> FunctionLoader::from_json(const json& doc, uint32_t max_ast_depth) {
    const json* list = &doc;
    if (doc.is_object()) {
        auto it = doc.find("functions");
        if (it == doc.end()) throw std::runtime_error("document has no 'functions' array");
        list = &*it;
    }
    if (!list->is_array()) throw std::runtime_error("functions: expected array");

    std::vector<FunctionInfo> functions;
    functions.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
        functions.push_back(function_from_json((*list)[i], "functions[" + std::to_string(i) + "]", max_ast_depth));
    }
    return functions;
}

std::vector<FunctionInfo> FunctionLoader::load_file(const std::filesystem::path& path, uint32_t max_ast_depth) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open " + path.string());

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error(path.string() + ": " + ex.what());
    }
    return from_json(doc, max_ast_depth);
}

} // namespace Twinscan
