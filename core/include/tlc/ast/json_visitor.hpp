// tlc/ast/json_visitor.hpp - JSON serialization for terms and results
//
// Returns nlohmann::json objects for expressions, types and inference
// outcomes. Used by the CLI's JSON output.
//
#pragma once

#include <nlohmann/json.hpp>

#include "tlc/ast/ast.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/typing_error.hpp"

namespace tlc
{

/**
 * Serialize an expression tree.
 *
 * @return e.g. {"type": "VarExpr", "name": "x"}; null input gives
 *         {"type": "MissingExpr"}
 */
[[nodiscard]] nlohmann::json to_json(const Expr * expr);

/**
 * Serialize a type.
 *
 * @return e.g. {"kind": "Function", "input": {...}, "output": {...}, "text": "(Int -> Int)"}
 */
[[nodiscard]] nlohmann::json to_json(const Type * type);

/// Serialize a typing error (kind, code, message, subject and payload)
[[nodiscard]] nlohmann::json to_json(const TypingError & error);

/// Serialize an inference outcome: {"success": true, "type": ...} or {"success": false, "error": ...}
[[nodiscard]] nlohmann::json to_json(const InferResult & result);

}  // namespace tlc
