// tests/unit/sema/test_type_utils.cpp - Unit tests for type construction, equality and rendering
//

#include <gtest/gtest.h>

#include <string>

#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/type_utils.hpp"

using namespace tlc;

class TypeUtilsTest : public ::testing::Test
{
protected:
  TypeContext types;

  const Type * dependent_effect()
  {
    TypeContext * owner = &types;
    return types.make_dependent_function_type(
      "n", types.int_type(),
      [owner](std::string_view n) { return owner->get_effectful_type(n, owner->int_type()); });
  }
};

// ============================================================================
// Rendering
// ============================================================================

TEST_F(TypeUtilsTest, RenderBaseTypes)
{
  EXPECT_EQ(to_string(types.int_type()), "Int");
  EXPECT_EQ(to_string(types.bool_type()), "Bool");
}

TEST_F(TypeUtilsTest, RenderComposites)
{
  const Type * fn = types.get_function_type(types.int_type(), types.bool_type());
  EXPECT_EQ(to_string(fn), "(Int -> Bool)");
  EXPECT_EQ(to_string(types.get_linear_type(types.int_type())), "Linear[Int]");
  EXPECT_EQ(to_string(types.get_effectful_type("IO", fn)), "Effect[IO, (Int -> Bool)]");
}

TEST_F(TypeUtilsTest, RenderNestedFunctions)
{
  const Type * inner = types.get_function_type(types.int_type(), types.int_type());
  EXPECT_EQ(to_string(types.get_function_type(inner, types.bool_type())), "((Int -> Int) -> Bool)");
  EXPECT_EQ(to_string(types.get_function_type(types.bool_type(), inner)), "(Bool -> (Int -> Int))");
}

TEST_F(TypeUtilsTest, RenderDependentFunction)
{
  EXPECT_EQ(to_string(dependent_effect()), "(Pi n: Int. Effect[n, Int])");
}

TEST_F(TypeUtilsTest, RenderMissingType)
{
  EXPECT_EQ(to_string(static_cast<const Type *>(nullptr)), "<null>");
}

TEST_F(TypeUtilsTest, RenderingIsStable)
{
  const Type * t = types.get_linear_type(types.get_effectful_type("State", types.bool_type()));
  EXPECT_EQ(to_string(t), to_string(t));
  EXPECT_EQ(to_string(t), "Linear[Effect[State, Bool]]");
}

TEST_F(TypeUtilsTest, KindNames)
{
  EXPECT_STREQ(to_string(TypeKind::Function), "Function");
  EXPECT_STREQ(to_string(TypeKind::DependentFunction), "DependentFunction");
  EXPECT_STREQ(to_string(TypeKind::Effectful), "Effectful");
}

// ============================================================================
// Interning
// ============================================================================

TEST_F(TypeUtilsTest, CompositesAreInterned)
{
  const Type * a = types.get_function_type(types.int_type(), types.int_type());
  const Type * b = types.get_function_type(types.int_type(), types.int_type());
  EXPECT_EQ(a, b);
  EXPECT_EQ(types.get_effectful_type("IO", types.int_type()),
            types.get_effectful_type(std::string("IO"), types.int_type()));
  EXPECT_EQ(types.composite_count(), 2U);
}

TEST_F(TypeUtilsTest, EffectLabelIsCopied)
{
  std::string label = "IO";
  const Type * t = types.get_effectful_type(label, types.int_type());
  label = "XX";
  EXPECT_EQ(to_string(t), "Effect[IO, Int]");
}

TEST_F(TypeUtilsTest, LookupBuiltin)
{
  EXPECT_EQ(types.lookup_builtin("Int"), types.int_type());
  EXPECT_EQ(types.lookup_builtin("Bool"), types.bool_type());
  EXPECT_EQ(types.lookup_builtin("String"), nullptr);
}

// ============================================================================
// Equality
// ============================================================================

TEST_F(TypeUtilsTest, EqualityIsStructural)
{
  TypeContext other;
  const Type * a = types.get_function_type(types.int_type(), types.get_linear_type(types.bool_type()));
  const Type * b = other.get_function_type(other.int_type(), other.get_linear_type(other.bool_type()));
  EXPECT_NE(a, b);
  EXPECT_TRUE(types_equal(a, b));
}

TEST_F(TypeUtilsTest, DifferentShapesDiffer)
{
  EXPECT_FALSE(types_equal(types.int_type(), types.bool_type()));
  EXPECT_FALSE(types_equal(types.int_type(), types.get_linear_type(types.int_type())));
  EXPECT_FALSE(types_equal(
    types.get_effectful_type("IO", types.int_type()),
    types.get_effectful_type("State", types.int_type())));
  EXPECT_FALSE(types_equal(
    types.get_function_type(types.int_type(), types.bool_type()),
    types.get_function_type(types.bool_type(), types.int_type())));
}

TEST_F(TypeUtilsTest, DependentFunctionNeverEqual)
{
  const Type * d = dependent_effect();
  EXPECT_FALSE(types_equal(d, d));
  EXPECT_FALSE(types_equal(d, dependent_effect()));
}

TEST_F(TypeUtilsTest, NullNeverEqual)
{
  EXPECT_FALSE(types_equal(nullptr, nullptr));
  EXPECT_FALSE(types_equal(types.int_type(), nullptr));
}

TEST_F(TypeUtilsTest, DependentReturnTypeFromParameterName)
{
  const Type * d = dependent_effect();
  ASSERT_TRUE(d->is_dependent_function());
  const Type * ret = d->dependent_return_type();
  ASSERT_NE(ret, nullptr);
  EXPECT_TRUE(ret->is_effectful());
  EXPECT_EQ(ret->name, "n");
  EXPECT_EQ(types.int_type()->dependent_return_type(), nullptr);
}
