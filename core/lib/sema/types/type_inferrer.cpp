// tlc/sema/types/type_inferrer.cpp - Syntax-directed type inference
//
#include "tlc/sema/types/type_inferrer.hpp"

#include <mutex>
#include <string>
#include <utility>

#include "tlc/ast/ast_printer.hpp"
#include "tlc/basic/casting.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

TypeInferrer::TypeInferrer(TypeContext & types, DiagnosticBag * diags)
: types_(types), diags_(diags)
{
}

// ============================================================================
// Entry Point
// ============================================================================

InferResult TypeInferrer::infer(const Expr * expr, const TypingContext & ctx)
{
  InferResult result = infer_expr(expr, ctx);
  if (!result.success) {
    report(result.error, expr);
  }
  return result;
}

bool TypeInferrer::occurs_in(std::string_view param, const Expr * body)
{
  return to_string(body).find(param) != std::string::npos;
}

// ============================================================================
// Dispatch
// ============================================================================

InferResult TypeInferrer::infer_expr(const Expr * expr, const TypingContext & ctx)
{
  if (expr == nullptr) {
    return fail_at(expr, TypingError::unknown_expression_shape());
  }

  switch (expr->get_kind()) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return infer_##Snake(cast<Class>(expr), ctx);
#include "tlc/ast/ast_nodes.def"
  }

  return fail_at(expr, TypingError::unknown_expression_shape());
}

// ============================================================================
// Rules
// ============================================================================

InferResult TypeInferrer::infer_var_expr(const VarExpr * node, const TypingContext & ctx)
{
  if (const Type * bound = ctx.lookup(node->name)) {
    return InferResult::ok(bound);
  }
  return fail_at(node, TypingError::unbound_variable(std::string(node->name)));
}

InferResult TypeInferrer::infer_lambda_expr(const LambdaExpr * node, const TypingContext & ctx)
{
  // The occurrence check is purely syntactic, so it runs before the body is
  // typed: a linear binder whose name never appears is reported as such
  // even when the body would also fail.
  if (node->paramType != nullptr && node->paramType->is_linear() &&
      !occurs_in(node->param, node->body)) {
    return fail_at(node, TypingError::linearity_violation(std::string(node->param)));
  }

  // Inside the body a linear parameter stands for its base value.
  const Type * bound = node->paramType;
  if (bound != nullptr && bound->is_linear()) {
    bound = bound->base_type;
  }

  const TypingContext inner = ctx.extend(node->param, bound);
  InferResult body = infer_expr(node->body, inner);
  if (!body.success) {
    return body;
  }

  return InferResult::ok(types_.get_function_type(node->paramType, body.type));
}

InferResult TypeInferrer::infer_apply_expr(const ApplyExpr * node, const TypingContext & ctx)
{
  InferResult callee = infer_expr(node->callee, ctx);
  if (!callee.success) {
    return callee;
  }

  InferResult argument = infer_expr(node->argument, ctx);
  if (!argument.success) {
    return argument;
  }

  const Type * fn = callee.type;
  if (fn != nullptr && fn->is_function() && types_equal(fn->input, argument.type)) {
    return InferResult::ok(fn->output);
  }

  return fail_at(node, TypingError::type_mismatch(fn, argument.type));
}

InferResult TypeInferrer::infer_effect_expr(const EffectExpr * node, const TypingContext & ctx)
{
  InferResult inner = infer_expr(node->inner, ctx);
  if (!inner.success) {
    return inner;
  }
  return InferResult::ok(types_.get_effectful_type(node->effect, inner.type));
}

// ============================================================================
// Helpers
// ============================================================================

InferResult TypeInferrer::fail_at(const Expr * subject, TypingError error)
{
  error.subject = to_string(subject);
  return InferResult::fail(std::move(error));
}

void TypeInferrer::report(const TypingError & error, const Expr * root)
{
  error_count_.fetch_add(1, std::memory_order_relaxed);
  if (!diags_) return;

  const std::lock_guard<std::mutex> lock(diags_mutex_);
  auto builder = diags_->report_error(error.message(), error.subject);
  builder.with_code(error_code(error.kind));

  const std::string root_text = to_string(root);
  if (root_text != error.subject) {
    builder.with_secondary_label(root_text, "in");
  }

  switch (error.kind) {
    case TypingErrorKind::UnboundVariable:
      builder.with_help("bind '" + error.name + "' in the context before use");
      break;
    case TypingErrorKind::LinearityViolation:
      builder.with_note("a linear parameter must appear in the body of its abstraction");
      builder.with_help("use '" + error.name + "' in the body");
      break;
    case TypingErrorKind::TypeMismatch:
      if (error.expected != nullptr && error.expected->is_function()) {
        builder.with_note(
          "the function expects " + to_string(error.expected->input) + " but the argument is " +
          to_string(error.actual));
      } else {
        builder.with_note(to_string(error.expected) + " is not a function type");
      }
      break;
    case TypingErrorKind::UnknownExpressionShape:
      break;
  }
}

}  // namespace tlc
