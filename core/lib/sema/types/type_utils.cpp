// tlc/sema/types/type_utils.cpp - Type equality and rendering
//
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{

// ============================================================================
// Equality
// ============================================================================

bool types_equal(const Type * lhs, const Type * rhs)
{
  if (!lhs || !rhs) return false;
  if (lhs->is_dependent_function() || rhs->is_dependent_function()) return false;

  if (lhs == rhs) return true;
  if (lhs->kind != rhs->kind) return false;

  switch (lhs->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
      return true;
    case TypeKind::Function:
      return types_equal(lhs->input, rhs->input) && types_equal(lhs->output, rhs->output);
    case TypeKind::Linear:
      return types_equal(lhs->base_type, rhs->base_type);
    case TypeKind::Effectful:
      return lhs->name == rhs->name && types_equal(lhs->base_type, rhs->base_type);
    case TypeKind::DependentFunction:
      return false;
  }
  return false;
}

// ============================================================================
// Rendering
// ============================================================================

std::string to_string(const Type * type)
{
  if (!type) return "<null>";

  switch (type->kind) {
    case TypeKind::Int:
      return "Int";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::Function:
      return "(" + to_string(type->input) + " -> " + to_string(type->output) + ")";
    case TypeKind::DependentFunction:
      return "(Pi " + std::string(type->name) + ": " + to_string(type->input) + ". " +
             to_string(type->dependent_return_type()) + ")";
    case TypeKind::Linear:
      return "Linear[" + to_string(type->base_type) + "]";
    case TypeKind::Effectful:
      return "Effect[" + std::string(type->name) + ", " + to_string(type->base_type) + "]";
  }
  return "<unknown>";
}

const char * to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Int:
      return "Int";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::Function:
      return "Function";
    case TypeKind::DependentFunction:
      return "DependentFunction";
    case TypeKind::Linear:
      return "Linear";
    case TypeKind::Effectful:
      return "Effectful";
  }
  return "Unknown";
}

}  // namespace tlc
