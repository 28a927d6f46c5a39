// tlc/ast/ast_printer.cpp - Textual rendering of expressions
//
#include "tlc/ast/ast_printer.hpp"

#include "tlc/ast/visitor.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

namespace
{

class ExprPrinter : public ExprVisitor<ExprPrinter, void>
{
public:
  explicit ExprPrinter(std::string & out) : out_(out) {}

  void visit_var_expr(const VarExpr * node) { out_ += node->name; }

  void visit_lambda_expr(const LambdaExpr * node)
  {
    out_ += "(\\";
    out_ += node->param;
    out_ += ": ";
    out_ += to_string(node->paramType);
    out_ += ". ";
    visit(node->body);
    out_ += ")";
  }

  void visit_apply_expr(const ApplyExpr * node)
  {
    out_ += "(";
    visit(node->callee);
    out_ += " ";
    visit(node->argument);
    out_ += ")";
  }

  void visit_effect_expr(const EffectExpr * node)
  {
    out_ += "[";
    out_ += node->effect;
    out_ += "] ";
    visit(node->inner);
  }

  void visit_unknown(const Expr * /*node*/) { out_ += "<missing>"; }

private:
  std::string & out_;
};

}  // namespace

std::string to_string(const Expr * expr)
{
  std::string out;
  ExprPrinter printer(out);
  printer.visit(expr);
  return out;
}

}  // namespace tlc
