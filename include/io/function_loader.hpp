/**
 * @file function_loader.hpp
 * @brief FunctionInfo records from the analyzer's JSON dump
 *
 * Accepted documents: a bare array of functions, or {"functions": [...]}.
 *
 *   {
 *     "id": "src/a.ts#L10", "name": "sum", "filePath": "src/a.ts",
 *     "startLine": 10, "endLine": 24,
 *     "ast": {"kind": "Block", "children": [{"kind": "Identifier", "text": "x"}]},
 *     "tokens": ["let", "x", "=", "0"],
 *     "signature": {"name": "sum", "parameterTypes": ["number[]"], "returnType": "number"},
 *     "metrics": {"linesOfCode": 15, "cyclomaticComplexity": 3},
 *     "embedding": [0.1, 0.2]
 *   }
 */

#pragma once

#include <core/function_info.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace Twinscan {

class TWINSCAN_API FunctionLoader {
public:
    /**
     * @brief Nesting limit for loaded ASTs (root is depth 1)
     *
     * Kept above CanonicalizerConfig::max_depth so an over-deep function still
     * loads and is skipped as ast-too-deep; anything deeper fails the load.
     */
    static constexpr uint32_t MAX_AST_DEPTH = 8192;

    /**
     * @throws std::runtime_error naming the offending field
     */
    static std::vector<FunctionInfo> from_json(const nlohmann::json& doc, uint32_t max_ast_depth = MAX_AST_DEPTH);

    static std::vector<FunctionInfo> load_file(const std::filesystem::path& path,
                                               uint32_t max_ast_depth = MAX_AST_DEPTH);

    static FunctionInfo function_from_json(const nlohmann::json& j, const std::string& where,
                                           uint32_t max_ast_depth = MAX_AST_DEPTH);

    /// Builds the tree without recursion
    static AstNode ast_from_json(const nlohmann::json& j, const std::string& where,
                                 uint32_t max_depth = MAX_AST_DEPTH);
};

} // namespace Twinscan
