// test_json_visitor.cpp - Unit tests for JSON serialization of terms and results
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "tlc/ast/ast_context.hpp"
#include "tlc/ast/json_visitor.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/type_inferrer.hpp"

using nlohmann::json;

namespace tlc
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  AstContext ast;
  TypeContext types;
};

TEST_F(JsonVisitorTest, Variable)
{
  auto j = to_json(ast.var("x"));
  EXPECT_EQ(j["type"], "VarExpr");
  EXPECT_EQ(j["name"], "x");
}

TEST_F(JsonVisitorTest, LambdaCarriesParameterType)
{
  auto j = to_json(ast.lambda("x", types.get_linear_type(types.int_type()), ast.var("x")));
  EXPECT_EQ(j["type"], "LambdaExpr");
  EXPECT_EQ(j["param"], "x");
  EXPECT_EQ(j["paramType"]["kind"], "Linear");
  EXPECT_EQ(j["paramType"]["text"], "Linear[Int]");
  EXPECT_EQ(j["paramType"]["base"]["kind"], "Int");
  EXPECT_EQ(j["body"]["name"], "x");
}

TEST_F(JsonVisitorTest, ApplicationAndEffect)
{
  auto j = to_json(ast.apply(ast.var("f"), ast.effect("IO", ast.var("x"))));
  EXPECT_EQ(j["type"], "ApplyExpr");
  EXPECT_EQ(j["callee"]["name"], "f");
  EXPECT_EQ(j["argument"]["type"], "EffectExpr");
  EXPECT_EQ(j["argument"]["effect"], "IO");
  EXPECT_EQ(j["argument"]["inner"]["name"], "x");
}

TEST_F(JsonVisitorTest, MissingExpression)
{
  EXPECT_EQ(to_json(static_cast<const Expr *>(nullptr))["type"], "MissingExpr");
}

TEST_F(JsonVisitorTest, FunctionType)
{
  auto j = to_json(types.get_function_type(types.int_type(), types.bool_type()));
  EXPECT_EQ(j["kind"], "Function");
  EXPECT_EQ(j["text"], "(Int -> Bool)");
  EXPECT_EQ(j["input"]["kind"], "Int");
  EXPECT_EQ(j["output"]["kind"], "Bool");
}

TEST_F(JsonVisitorTest, DependentFunctionType)
{
  TypeContext * owner = &types;
  const Type * d = types.make_dependent_function_type(
    "n", types.int_type(),
    [owner](std::string_view n) { return owner->get_effectful_type(n, owner->int_type()); });

  auto j = to_json(d);
  EXPECT_EQ(j["kind"], "DependentFunction");
  EXPECT_EQ(j["param"], "n");
  EXPECT_EQ(j["paramType"]["kind"], "Int");
  EXPECT_EQ(j["returnType"]["effect"], "n");
  EXPECT_EQ(j["text"], "(Pi n: Int. Effect[n, Int])");
}

TEST_F(JsonVisitorTest, NullTypeIsNull)
{
  EXPECT_TRUE(to_json(static_cast<const Type *>(nullptr)).is_null());
}

TEST_F(JsonVisitorTest, SuccessfulResult)
{
  TypeInferrer inferrer(types);
  auto j = to_json(inferrer.infer(ast.lambda("x", types.int_type(), ast.var("x")), TypingContext{}));
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["type"]["text"], "(Int -> Int)");
  EXPECT_FALSE(j.contains("error"));
}

TEST_F(JsonVisitorTest, FailedResult)
{
  TypeInferrer inferrer(types);
  auto j = to_json(inferrer.infer(ast.lambda("x", types.int_type(), ast.var("y")), TypingContext{}));
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error"]["kind"], "UnboundVariable");
  EXPECT_EQ(j["error"]["code"], "E001");
  EXPECT_EQ(j["error"]["name"], "y");
  EXPECT_EQ(j["error"]["subject"], "y");
  EXPECT_EQ(j["error"]["message"], "Unbound variable: y");
}

TEST_F(JsonVisitorTest, MismatchCarriesBothTypes)
{
  auto j = to_json(TypingError::type_mismatch(types.int_type(), types.bool_type()));
  EXPECT_EQ(j["kind"], "TypeMismatch");
  EXPECT_EQ(j["expected"]["kind"], "Int");
  EXPECT_EQ(j["actual"]["kind"], "Bool");
  EXPECT_FALSE(j.contains("name"));
}

}  // namespace tlc
