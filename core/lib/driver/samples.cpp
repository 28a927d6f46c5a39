// tlc/driver/samples.cpp - Built-in sample judgments
//
#include "tlc/driver/samples.hpp"

#include <array>

namespace tlc
{

namespace
{

// (\x: Int. x)
Sample build_identity(AstContext & ast, TypeContext & types)
{
  Sample s;
  s.name = "identity";
  s.expr = ast.lambda("x", types.int_type(), ast.var("x"));
  return s;
}

// (\x: Linear[Int]. x)
Sample build_linear(AstContext & ast, TypeContext & types)
{
  Sample s;
  s.name = "linear";
  s.expr = ast.lambda("x", types.get_linear_type(types.int_type()), ast.var("x"));
  return s;
}

// (Pi n: Int. Effect[n, Int])
Sample build_dependent(AstContext & /*ast*/, TypeContext & types)
{
  Sample s;
  s.name = "dependent";
  TypeContext * owner = &types;
  s.type = types.make_dependent_function_type(
    "n", types.int_type(),
    [owner](std::string_view n) { return owner->get_effectful_type(n, owner->int_type()); });
  return s;
}

// [IO] x  under {x: Int}
Sample build_effect(AstContext & ast, TypeContext & types)
{
  Sample s;
  s.name = "effect";
  s.expr = ast.effect("IO", ast.var("x"));
  s.bindings.push_back(Binding{ast.intern("x"), types.int_type()});
  return s;
}

// ((\x: Int. x) x)  under {x: Int}
Sample build_application(AstContext & ast, TypeContext & types)
{
  Sample s;
  s.name = "application";
  s.expr = ast.apply(ast.lambda("x", types.int_type(), ast.var("x")), ast.var("x"));
  s.bindings.push_back(Binding{ast.intern("x"), types.int_type()});
  return s;
}

// (\x: Linear[Int]. y)  under {x: Int}
Sample build_bad_linear(AstContext & ast, TypeContext & types)
{
  Sample s;
  s.name = "bad_linear";
  s.expr = ast.lambda("x", types.get_linear_type(types.int_type()), ast.var("y"));
  s.bindings.push_back(Binding{ast.intern("x"), types.int_type()});
  s.expect_failure = true;
  return s;
}

constexpr std::array<SampleSpec, 6> k_samples{{
  {"identity", "identity function on Int", &build_identity},
  {"linear", "linear parameter used in the body", &build_linear},
  {"dependent", "dependent function type (displayed only)", &build_dependent},
  {"effect", "variable evaluated under the IO effect", &build_effect},
  {"application", "identity applied to a variable", &build_application},
  {"bad_linear", "linear parameter never used", &build_bad_linear},
}};

}  // namespace

gsl::span<const SampleSpec> builtin_samples() noexcept
{
  return gsl::span<const SampleSpec>(k_samples.data(), k_samples.size());
}

const SampleSpec * find_sample(std::string_view name) noexcept
{
  for (const auto & spec : k_samples) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

}  // namespace tlc
