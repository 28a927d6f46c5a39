// tlc/sema/types/type.hpp - Semantic type representation
//
// Types of the calculus: two base types, functions, dependent functions,
// linear wrappers and effect-annotated wrappers. Types are immutable and
// owned by a TypeContext.
//
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory_resource>
#include <mutex>
#include <string_view>
#include <unordered_set>

namespace tlc
{

struct Type;

/// Computes a dependent function's return type from its parameter name.
using ReturnTypeFn = std::function<const Type *(std::string_view param_name)>;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Int,
  Bool,
  Function,           ///< (A -> B)
  DependentFunction,  ///< (Pi n: A. R(n))
  Linear,             ///< Linear[T]
  Effectful,          ///< Effect[e, T]
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type value.
 *
 * Fields are meaningful per kind; unused ones stay null/empty. Equality is
 * structural (see types_equal in type_utils.hpp); pointer identity is only a
 * fast path.
 */
struct Type
{
  TypeKind kind;

  /// Function: parameter type. DependentFunction: bound parameter's type
  const Type * input = nullptr;

  /// Function: result type
  const Type * output = nullptr;

  /// Linear / Effectful: wrapped type
  const Type * base_type = nullptr;

  /// Effectful: effect label. DependentFunction: parameter name
  std::string_view name;

  /// DependentFunction only
  const ReturnTypeFn * return_type_of = nullptr;

  [[nodiscard]] bool is_function() const noexcept { return kind == TypeKind::Function; }
  [[nodiscard]] bool is_dependent_function() const noexcept
  {
    return kind == TypeKind::DependentFunction;
  }
  [[nodiscard]] bool is_linear() const noexcept { return kind == TypeKind::Linear; }
  [[nodiscard]] bool is_effectful() const noexcept { return kind == TypeKind::Effectful; }

  /**
   * Return type of a dependent function, computed from the parameter name
   * (the name stands in for the argument; nothing is evaluated).
   *
   * @return nullptr for any other kind
   */
  [[nodiscard]] const Type * dependent_return_type() const
  {
    if (kind != TypeKind::DependentFunction || return_type_of == nullptr || !*return_type_of) {
      return nullptr;
    }
    return (*return_type_of)(name);
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owner of all types built for a session.
 *
 * Base types are singletons. Function, linear and effectful types are
 * interned: asking twice for the same shape returns the same pointer.
 * Dependent function types are never interned.
 *
 * Creation is guarded by a mutex, so several inferrers may share one
 * context from different threads.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }

  // ===========================================================================
  // Composite Type Creation
  // ===========================================================================

  /// Get function type: (input -> output)
  const Type * get_function_type(const Type * input, const Type * output);

  /// Get linear type: Linear[base]
  const Type * get_linear_type(const Type * base);

  /// Get effectful type: Effect[effect, base]
  const Type * get_effectful_type(std::string_view effect, const Type * base);

  /// Create a dependent function type: (Pi param_name: param_type. return_type_of(param_name))
  const Type * make_dependent_function_type(
    std::string_view param_name, const Type * param_type, ReturnTypeFn return_type_of);

  // ===========================================================================
  // Type Lookup by Name
  // ===========================================================================

  /// Look up a base type by name ("Int", "Bool"); nullptr otherwise
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const noexcept;

  /// Number of composite types created so far
  [[nodiscard]] size_t composite_count() const;

private:
  std::string_view intern_name(std::string_view s);

  Type int_;
  Type bool_;

  mutable std::mutex mutex_;

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Interned types are referenced by pointer; the container must keep addresses stable.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::unordered_set<std::string_view> names_{&arena_};
  std::deque<ReturnTypeFn> return_type_fns_;
};

}  // namespace tlc
