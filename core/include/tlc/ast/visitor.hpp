// tlc/ast/visitor.hpp - CRTP visitor over the closed set of expression nodes
//
#pragma once

#include "tlc/ast/ast.hpp"
#include "tlc/ast/ast_enums.hpp"
#include "tlc/basic/casting.hpp"

namespace tlc
{

/**
 * CRTP visitor for const expression traversal.
 *
 * The dispatch switch is generated from ast_nodes.def. There are no
 * default visit methods: a derived visitor that omits a shape does not
 * compile. A derived class provides
 *
 * - `visit_var_expr`, `visit_lambda_expr`, `visit_apply_expr`,
 *   `visit_effect_expr` taking the matching `const` node pointer, and
 * - `visit_unknown(const Expr *)`, called for a null node or a kind value
 *   outside the enumeration.
 *
 * @code
 *   class DepthCounter : public ExprVisitor<DepthCounter, int> { ... };
 *   int depth = DepthCounter{}.visit(expr);
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 */
template <typename Derived, typename ReturnType = void>
class ExprVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(const Expr * node)
  {
    if (node == nullptr) {
      return get_derived().visit_unknown(node);
    }

    switch (node->get_kind()) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "tlc/ast/ast_nodes.def"
    }

    return get_derived().visit_unknown(node);
  }
};

}  // namespace tlc
