// tlc/basic/casting.hpp - classof-based checked casts
//
// isa / cast over any hierarchy exposing a static classof().
// Used by the expression visitors once the node kind is known:
//
//   case NodeKind::Lambda: return visit_lambda_expr(cast<LambdaExpr>(node));
//
#pragma once

#include <cassert>
#include <type_traits>

namespace tlc
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// True if node is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/**
 * Downcast that the caller has already proven valid.
 *
 * @note Asserts on nullptr or kind mismatch.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

}  // namespace tlc
