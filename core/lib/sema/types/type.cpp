// tlc/sema/types/type.cpp - Type context implementation
//
#include "tlc/sema/types/type.hpp"

#include <cstring>
#include <utility>

namespace tlc
{

TypeContext::TypeContext()
{
  int_ = Type{TypeKind::Int};
  bool_ = Type{TypeKind::Bool};
}

const Type * TypeContext::get_function_type(const Type * input, const Type * output)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Function && t.input == input && t.output == output) {
      return &t;
    }
  }

  Type new_type{TypeKind::Function};
  new_type.input = input;
  new_type.output = output;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_linear_type(const Type * base)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Linear && t.base_type == base) {
      return &t;
    }
  }

  Type new_type{TypeKind::Linear};
  new_type.base_type = base;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_effectful_type(std::string_view effect, const Type * base)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Effectful && t.base_type == base && t.name == effect) {
      return &t;
    }
  }

  Type new_type{TypeKind::Effectful};
  new_type.name = intern_name(effect);
  new_type.base_type = base;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::make_dependent_function_type(
  std::string_view param_name, const Type * param_type, ReturnTypeFn return_type_of)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  // Never interned: two callables cannot be compared.
  return_type_fns_.push_back(std::move(return_type_of));

  Type new_type{TypeKind::DependentFunction};
  new_type.name = intern_name(param_name);
  new_type.input = param_type;
  new_type.return_type_of = &return_type_fns_.back();
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::lookup_builtin(std::string_view name) const noexcept
{
  if (name == "Int") return &int_;
  if (name == "Bool") return &bool_;
  return nullptr;
}

size_t TypeContext::composite_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return composite_types_.size();
}

// Caller holds mutex_.
std::string_view TypeContext::intern_name(std::string_view s)
{
  auto it = names_.find(s);
  if (it != names_.end()) {
    return *it;
  }

  char * const ptr = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
  if (!s.empty()) {
    std::memcpy(ptr, s.data(), s.size());
  }
  const std::string_view stored(ptr, s.size());
  names_.insert(stored);
  return stored;
}

}  // namespace tlc
