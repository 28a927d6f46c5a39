// tlc/sema/resolution/typing_context.cpp - Persistent typing environment
//
#include "tlc/sema/resolution/typing_context.hpp"

#include <algorithm>

namespace tlc
{

TypingContext TypingContext::from_bindings(gsl::span<const Binding> bindings)
{
  TypingContext ctx;
  for (const auto & b : bindings) {
    ctx = ctx.extend(b.name, b.type);
  }
  return ctx;
}

const Type * TypingContext::lookup(std::string_view name) const noexcept
{
  for (const Frame * f = head_.get(); f != nullptr; f = f->parent.get()) {
    if (f->name == name) {
      return f->type;
    }
  }
  return nullptr;
}

TypingContext TypingContext::extend(std::string_view name, const Type * type) const
{
  auto frame = std::make_shared<const Frame>(Frame{std::string(name), type, head_});
  return TypingContext(std::move(frame));
}

size_t TypingContext::size() const { return bindings().size(); }

std::vector<std::pair<std::string, const Type *>> TypingContext::bindings() const
{
  std::vector<std::pair<std::string, const Type *>> out;
  for (const Frame * f = head_.get(); f != nullptr; f = f->parent.get()) {
    const bool shadowed = std::any_of(
      out.begin(), out.end(), [&](const auto & entry) { return entry.first == f->name; });
    if (!shadowed) {
      out.emplace_back(f->name, f->type);
    }
  }
  return out;
}

}  // namespace tlc
