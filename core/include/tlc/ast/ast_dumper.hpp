// tlc/ast/ast_dumper.hpp - Debug expression tree output
//
#pragma once

#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "tlc/ast/ast.hpp"
#include "tlc/ast/visitor.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

/**
 * Dumps an expression tree, one node per line.
 *
 * @code
 *   ApplyExpr
 *   |-LambdaExpr param='x' type='Int'
 *   | `-VarExpr name='x'
 *   `-VarExpr name='x'
 * @endcode
 */
class AstDumper : public ExprVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  /// Dump an expression and its subtree
  void dump(const Expr * node)
  {
    prefix_.clear();
    isRoot_ = true;
    visit(node);
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_var_expr(const VarExpr * node) { print_tree("VarExpr", {{"name", node->name}}); }

  void visit_lambda_expr(const LambdaExpr * node)
  {
    const std::string type_text = to_string(node->paramType);
    print_tree("LambdaExpr", {{"param", node->param}, {"type", type_text}}, {node->body});
  }

  void visit_apply_expr(const ApplyExpr * node)
  {
    print_tree("ApplyExpr", {}, {node->callee, node->argument});
  }

  void visit_effect_expr(const EffectExpr * node)
  {
    print_tree("EffectExpr", {{"effect", node->effect}}, {node->inner});
  }

  void visit_unknown(const Expr * /*node*/) { print_tree("<missing>", {}); }

private:
  struct Prop
  {
    std::string_view key;
    std::string_view value;
  };

  void print_tree(
    std::string_view label, std::initializer_list<Prop> props,
    std::initializer_list<const Expr *> children = {})
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      os_ << " " << prop.key << "='" << prop.value << "'";
    }
    os_ << "\n";

    if (children.size() == 0) {
      return;
    }

    const size_t saved = prefix_.size();
    if (!isRoot_) {
      prefix_ += isLast_ ? "  " : "| ";
    }
    isRoot_ = false;

    size_t i = 0;
    for (const Expr * child : children) {
      isLast_ = (++i == children.size());
      visit(child);
    }
    prefix_.resize(saved);
  }

  void print_prefix()
  {
    if (isRoot_) {
      return;
    }
    os_ << prefix_ << (isLast_ ? "`-" : "|-");
  }

  std::ostream & os_;
  std::string prefix_;
  bool isRoot_ = true;
  bool isLast_ = true;
};

}  // namespace tlc
