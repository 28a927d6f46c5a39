// tlc/sema/resolution/typing_context.hpp - Immutable variable-to-type environment
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlc/sema/types/type.hpp"

namespace tlc
{

/// A single name/type pair, used to seed a context.
struct Binding
{
  std::string_view name;
  const Type * type = nullptr;
};

/**
 * Persistent typing environment Γ.
 *
 * A context is a chain of frames shared between its extensions. extend()
 * returns a new context with one more frame and never touches the
 * receiver, so a binder's type cannot leak outside its scope. Lookups walk
 * from the newest frame outwards; an inner binding shadows outer ones.
 *
 * Copying a context is cheap (one shared pointer). Names are copied into
 * the frames, so callers may pass temporary strings.
 */
class TypingContext
{
public:
  /// Empty context
  TypingContext() = default;

  /// Build a context from bindings; later entries shadow earlier ones.
  [[nodiscard]] static TypingContext from_bindings(gsl::span<const Binding> bindings);

  /// Type bound to name, or nullptr when unbound
  [[nodiscard]] const Type * lookup(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept
  {
    return lookup(name) != nullptr;
  }

  /// New context identical to this one except that name maps to type.
  [[nodiscard]] TypingContext extend(std::string_view name, const Type * type) const;

  [[nodiscard]] bool empty() const noexcept { return head_ == nullptr; }

  /// Number of distinct visible names
  [[nodiscard]] size_t size() const;

  /// Visible bindings, innermost first, shadowed entries omitted
  [[nodiscard]] std::vector<std::pair<std::string, const Type *>> bindings() const;

private:
  struct Frame
  {
    std::string name;
    const Type * type;
    std::shared_ptr<const Frame> parent;
  };

  explicit TypingContext(std::shared_ptr<const Frame> head) : head_(std::move(head)) {}

  std::shared_ptr<const Frame> head_;
};

}  // namespace tlc
