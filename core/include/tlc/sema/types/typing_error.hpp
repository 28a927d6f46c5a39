// tlc/sema/types/typing_error.hpp - Typing failures and inference results
//
#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "tlc/sema/types/type.hpp"

namespace tlc
{

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class TypingErrorKind : uint8_t {
  UnboundVariable,        ///< E001
  LinearityViolation,     ///< E002
  TypeMismatch,           ///< E003
  UnknownExpressionShape  ///< E004
};

/// Stable diagnostic code for an error kind ("E001" ...)
[[nodiscard]] const char * error_code(TypingErrorKind kind) noexcept;

/// Display name of an error kind ("UnboundVariable" ...)
[[nodiscard]] const char * to_string(TypingErrorKind kind) noexcept;

/**
 * A single typing failure.
 *
 * - UnboundVariable: `name` is the missing variable.
 * - LinearityViolation: `name` is the linear parameter.
 * - TypeMismatch: `expected` is the function position's type, `actual`
 *   the argument's type.
 * - UnknownExpressionShape: no payload.
 */
struct TypingError
{
  TypingErrorKind kind = TypingErrorKind::UnknownExpressionShape;
  std::string name;
  const Type * expected = nullptr;
  const Type * actual = nullptr;

  /// Rendered expression at which inference failed
  std::string subject;

  [[nodiscard]] static TypingError unbound_variable(std::string name);
  [[nodiscard]] static TypingError linearity_violation(std::string name);
  [[nodiscard]] static TypingError type_mismatch(const Type * expected, const Type * actual);
  [[nodiscard]] static TypingError unknown_expression_shape();

  /// Human-readable message, e.g. "Unbound variable: y"
  [[nodiscard]] std::string message() const;
};

// ============================================================================
// Inference Result
// ============================================================================

/**
 * Outcome of one top-level inference: either a type or exactly one error.
 */
struct InferResult
{
  /// Inferred type (only valid if success == true)
  const Type * type = nullptr;

  /// Whether inference succeeded
  bool success = false;

  /// Failure (only valid if success == false)
  TypingError error;

  static InferResult ok(const Type * t)
  {
    InferResult r;
    r.type = t;
    r.success = true;
    return r;
  }

  static InferResult fail(TypingError e)
  {
    InferResult r;
    r.error = std::move(e);
    r.success = false;
    return r;
  }

  explicit operator bool() const noexcept { return success; }
};

}  // namespace tlc
