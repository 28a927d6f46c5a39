// tlc/sema/types/typing_error.cpp - Typing failure messages
//
#include "tlc/sema/types/typing_error.hpp"

#include <utility>

#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

const char * error_code(TypingErrorKind kind) noexcept
{
  switch (kind) {
    case TypingErrorKind::UnboundVariable:
      return "E001";
    case TypingErrorKind::LinearityViolation:
      return "E002";
    case TypingErrorKind::TypeMismatch:
      return "E003";
    case TypingErrorKind::UnknownExpressionShape:
      return "E004";
  }
  return "E000";
}

const char * to_string(TypingErrorKind kind) noexcept
{
  switch (kind) {
    case TypingErrorKind::UnboundVariable:
      return "UnboundVariable";
    case TypingErrorKind::LinearityViolation:
      return "LinearityViolation";
    case TypingErrorKind::TypeMismatch:
      return "TypeMismatch";
    case TypingErrorKind::UnknownExpressionShape:
      return "UnknownExpressionShape";
  }
  return "Unknown";
}

TypingError TypingError::unbound_variable(std::string name)
{
  TypingError e;
  e.kind = TypingErrorKind::UnboundVariable;
  e.name = std::move(name);
  return e;
}

TypingError TypingError::linearity_violation(std::string name)
{
  TypingError e;
  e.kind = TypingErrorKind::LinearityViolation;
  e.name = std::move(name);
  return e;
}

TypingError TypingError::type_mismatch(const Type * expected, const Type * actual)
{
  TypingError e;
  e.kind = TypingErrorKind::TypeMismatch;
  e.expected = expected;
  e.actual = actual;
  return e;
}

TypingError TypingError::unknown_expression_shape()
{
  TypingError e;
  e.kind = TypingErrorKind::UnknownExpressionShape;
  return e;
}

std::string TypingError::message() const
{
  switch (kind) {
    case TypingErrorKind::UnboundVariable:
      return "Unbound variable: " + name;
    case TypingErrorKind::LinearityViolation:
      return "Linear variable " + name + " must be used exactly once.";
    case TypingErrorKind::TypeMismatch:
      return "Type mismatch: " + to_string(expected) + " cannot be applied to " +
             to_string(actual);
    case TypingErrorKind::UnknownExpressionShape:
      return "Unknown expression type";
  }
  return "Unknown expression type";
}

}  // namespace tlc
