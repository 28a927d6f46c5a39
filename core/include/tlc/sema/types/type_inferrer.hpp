// tlc/sema/types/type_inferrer.hpp - Syntax-directed type inference
//
// Computes the typing judgment Γ ⊢ e : T in a single top-down pass. There is
// no unification: every subtree's type is fully determined before its
// parent's rule applies.
//
#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string_view>

#include "tlc/ast/ast.hpp"
#include "tlc/basic/diagnostic.hpp"
#include "tlc/sema/resolution/typing_context.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/typing_error.hpp"

namespace tlc
{

/**
 * Type inference engine.
 *
 * ## Rules
 *
 * - **Var x**: the type bound to x in Γ, else UnboundVariable(x).
 * - **Lambda x: A. e**: if A is linear, x must occur in the rendered text
 *   of e (LinearityViolation(x) otherwise); then e is typed under
 *   Γ, x: A giving B, and the result is (A -> B). A linear A = Linear[T]
 *   binds x at T inside e, so (\x: Linear[Int]. x) : (Linear[Int] -> Int).
 * - **Apply f a**: both sides are typed under Γ; f must have a function
 *   type whose input equals a's type structurally. The result is the
 *   function's output; anything else is TypeMismatch.
 * - **Effect [l] e**: e is typed under Γ giving T; the result is
 *   Effect[l, T]. Labels are not checked.
 * - Anything else (a null node) is UnknownExpressionShape.
 *
 * The first failure ends the whole inference and is returned unchanged.
 *
 * One inferrer may be shared between threads: results depend only on the
 * arguments, the failure counter is atomic and reports to the bag are
 * serialized.
 *
 * ## Usage
 * ```cpp
 * TypeInferrer inferrer(types, &diags);
 * InferResult r = inferrer.infer(expr, TypingContext{});
 * if (r) std::cout << to_string(r.type);
 * ```
 */
class TypeInferrer
{
public:
  /**
   * Construct a TypeInferrer.
   *
   * @param types TypeContext in which result types are created
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit TypeInferrer(TypeContext & types, DiagnosticBag * diags = nullptr);

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Infer the type of an expression under a context.
   *
   * Neither argument is modified. On failure one error diagnostic is
   * reported to the bag, if any.
   *
   * @param expr Expression to type (nullptr yields UnknownExpressionShape)
   * @param ctx Typing context Γ
   * @return The inferred type, or the first typing error
   */
  [[nodiscard]] InferResult infer(const Expr * expr, const TypingContext & ctx);

  // ===========================================================================
  // Linearity
  // ===========================================================================

  /**
   * Syntactic occurrence check used for linear parameters.
   *
   * True iff param is a substring of to_string(body). This is weaker than
   * counting uses: "x" is also found inside "max", and repeated uses are
   * accepted.
   */
  [[nodiscard]] static bool occurs_in(std::string_view param, const Expr * body);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return error_count() != 0; }
  [[nodiscard]] size_t error_count() const noexcept
  {
    return error_count_.load(std::memory_order_relaxed);
  }

private:
  InferResult infer_expr(const Expr * expr, const TypingContext & ctx);

  InferResult infer_var_expr(const VarExpr * node, const TypingContext & ctx);
  InferResult infer_lambda_expr(const LambdaExpr * node, const TypingContext & ctx);
  InferResult infer_apply_expr(const ApplyExpr * node, const TypingContext & ctx);
  InferResult infer_effect_expr(const EffectExpr * node, const TypingContext & ctx);

  static InferResult fail_at(const Expr * subject, TypingError error);

  void report(const TypingError & error, const Expr * root);

  TypeContext & types_;
  DiagnosticBag * diags_;

  // infer() may be called from several threads at once.
  std::atomic<size_t> error_count_{0};
  std::mutex diags_mutex_;
};

}  // namespace tlc
