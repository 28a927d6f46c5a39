// tlc/driver/samples.hpp - Built-in sample judgments
//
// A fixed set of named terms exercising each typing rule: identity, linear
// abstraction, a dependent function type, effect wrapping, application and
// a rejected linear abstraction.
//
#pragma once

#include <gsl/span>
#include <string_view>
#include <vector>

#include "tlc/ast/ast_context.hpp"
#include "tlc/sema/resolution/typing_context.hpp"
#include "tlc/sema/types/type.hpp"

namespace tlc
{

/**
 * A sample built into caller-owned arenas.
 *
 * Either `expr` is set (a judgment to infer) or only `type` is set (a
 * type that is displayed but not inferred, such as a dependent function).
 */
struct Sample
{
  std::string_view name;
  const Expr * expr = nullptr;
  const Type * type = nullptr;

  /// Sample-specific bindings, layered over the base context
  std::vector<Binding> bindings;

  /// Inference is expected to fail
  bool expect_failure = false;
};

using SampleBuilder = Sample (*)(AstContext & ast, TypeContext & types);

struct SampleSpec
{
  std::string_view name;
  std::string_view description;
  SampleBuilder build;
};

/// All built-in samples, in presentation order
[[nodiscard]] gsl::span<const SampleSpec> builtin_samples() noexcept;

/// Sample with the given name, or nullptr
[[nodiscard]] const SampleSpec * find_sample(std::string_view name) noexcept;

}  // namespace tlc
