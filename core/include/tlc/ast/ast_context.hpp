// tlc/ast/ast_context.hpp - Expression arena allocator and string pool
//
// AstContext owns every expression node and interned identifier built
// through it. Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include "tlc/ast/ast.hpp"

namespace tlc
{

/**
 * Arena that owns expression nodes and interned strings.
 *
 * Nodes and strings stay valid as long as the context is alive; there is
 * no individual deallocation.
 *
 * @code
 *   AstContext ast;
 *   TypeContext types;
 *   const Expr * id = ast.lambda("x", types.int_type(), ast.var("x"));
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new node of type T in the arena.
   *
   * String arguments are stored as given; use intern() (or the typed
   * factories below) when the caller's buffer does not outlive the context.
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Expr, T>, "T must derive from Expr");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Expression nodes must be trivially destructible to be managed by the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // Typed Factories (names are interned)
  // ===========================================================================

  const VarExpr * var(std::string_view name) { return create<VarExpr>(intern(name)); }

  const LambdaExpr * lambda(std::string_view param, const Type * param_type, const Expr * body)
  {
    return create<LambdaExpr>(intern(param), param_type, body);
  }

  const ApplyExpr * apply(const Expr * callee, const Expr * argument)
  {
    return create<ApplyExpr>(callee, argument);
  }

  const EffectExpr * effect(std::string_view effect_name, const Expr * inner)
  {
    return create<EffectExpr>(intern(effect_name), inner);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /// Intern a string and return a view that lives as long as the context.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    if (!s.empty()) {
      std::memcpy(ptr, s.data(), s.size());
    }

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace tlc
