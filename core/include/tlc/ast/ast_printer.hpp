// tlc/ast/ast_printer.hpp - Textual rendering of expressions
//
#pragma once

#include <string>

#include "tlc/ast/ast.hpp"

namespace tlc
{

/**
 * Render an expression on one line.
 *
 *   x                 variable
 *   (\x: Int. body)   lambda
 *   (f a)             application
 *   [IO] e            effectful expression
 *
 * A null expression renders as "<missing>". The output is deterministic;
 * the linearity check matches parameter names against it.
 */
[[nodiscard]] std::string to_string(const Expr * expr);

}  // namespace tlc
