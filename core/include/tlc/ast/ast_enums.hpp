// tlc/ast/ast_enums.hpp - AST enumeration definitions
//
#pragma once

#include <cstdint>
#include <string_view>

namespace tlc
{

// ============================================================================
// NodeKind - Identifies all expression node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; the set of expression shapes is closed.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "tlc/ast/ast_nodes.def"
};

/// Number of expression node kinds
inline constexpr int k_node_kind_count = 0
#define AST_NODE_EXPR(Class, Kind, Snake) +1
#include "tlc/ast/ast_nodes.def"
  ;

/// Class name of the node kind ("LambdaExpr"), or "" for an out-of-range value
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#include "tlc/ast/ast_nodes.def"
  }
  return "";
}

}  // namespace tlc
