/**
 * @file function_info.hpp
 * @brief Per-function records supplied by the external parser/analyzer
 *
 * The core never parses source text. It receives already-extracted
 * functions: an AST, the lexical token stream, the signature, optional
 * metrics and an optional embedding vector.
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace Twinscan {

/**
 * @brief Language-neutral AST node
 *
 * `kind` is the parser's node kind ("IfStatement", "Identifier", ...).
 * `text` carries the spelling for identifiers and literals, empty otherwise.
 */
struct AstNode {
    std::string kind;
    std::string text;
    std::vector<AstNode> children;

    bool is_leaf() const { return children.empty(); }
};

struct FunctionSignature {
    std::string name;
    std::vector<std::string> parameter_types;
    std::string return_type;
};

struct FunctionMetrics {
    uint32_t lines_of_code = 0;
    uint32_t cyclomatic_complexity = 0;
};

struct FunctionInfo {
    std::string id;                 // Stable identity
    std::string name;               // Display name
    std::string file_path;
    uint32_t start_line = 0;
    uint32_t end_line = 0;

    AstNode ast;
    std::vector<std::string> tokens;
    FunctionSignature signature;
    std::optional<FunctionMetrics> metrics;
    std::optional<std::vector<float>> embedding;

    /**
     * @brief Lines used for minLines filtering and priority.
     * Metrics win when the analyzer supplied them, else the line range.
     */
    uint32_t line_count() const {
        if (metrics && metrics->lines_of_code > 0) return metrics->lines_of_code;
        if (end_line < start_line) return 0;
        return end_line - start_line + 1;
    }
};

/**
 * @brief Optional source of embedding vectors keyed by function id
 *
 * Implementations wrap whatever model or vector store the caller has.
 * Absence of a vector is normal and must not be reported as an error.
 */
class TWINSCAN_API EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual std::optional<std::vector<float>> get_embedding(const std::string& function_id) const = 0;
};

} // namespace Twinscan
