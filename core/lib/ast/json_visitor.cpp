// tlc/ast/json_visitor.cpp - JSON serialization implementation
//
#include "tlc/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "tlc/ast/visitor.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace tlc
{
namespace
{

using nlohmann::json;

// ============================================================================
// Expression serialization
// ============================================================================

class JsonExprVisitor : public ExprVisitor<JsonExprVisitor, json>
{
public:
  json visit_var_expr(const VarExpr * node)
  {
    return json{{"type", "VarExpr"}, {"name", std::string(node->name)}};
  }

  json visit_lambda_expr(const LambdaExpr * node)
  {
    return json{
      {"type", "LambdaExpr"},
      {"param", std::string(node->param)},
      {"paramType", to_json(node->paramType)},
      {"body", visit(node->body)}};
  }

  json visit_apply_expr(const ApplyExpr * node)
  {
    return json{
      {"type", "ApplyExpr"}, {"callee", visit(node->callee)}, {"argument", visit(node->argument)}};
  }

  json visit_effect_expr(const EffectExpr * node)
  {
    return json{
      {"type", "EffectExpr"}, {"effect", std::string(node->effect)}, {"inner", visit(node->inner)}};
  }

  json visit_unknown(const Expr * /*node*/) { return json{{"type", "MissingExpr"}}; }
};

}  // namespace

json to_json(const Expr * expr) { return JsonExprVisitor{}.visit(expr); }

// ============================================================================
// Type serialization
// ============================================================================

json to_json(const Type * type)
{
  if (!type) return nullptr;

  json j{{"kind", to_string(type->kind)}, {"text", to_string(type)}};

  switch (type->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
      break;
    case TypeKind::Function:
      j["input"] = to_json(type->input);
      j["output"] = to_json(type->output);
      break;
    case TypeKind::DependentFunction:
      j["param"] = std::string(type->name);
      j["paramType"] = to_json(type->input);
      j["returnType"] = to_json(type->dependent_return_type());
      break;
    case TypeKind::Linear:
      j["base"] = to_json(type->base_type);
      break;
    case TypeKind::Effectful:
      j["effect"] = std::string(type->name);
      j["base"] = to_json(type->base_type);
      break;
  }
  return j;
}

// ============================================================================
// Result serialization
// ============================================================================

json to_json(const TypingError & error)
{
  json j{
    {"kind", to_string(error.kind)},
    {"code", error_code(error.kind)},
    {"message", error.message()},
    {"subject", error.subject}};

  switch (error.kind) {
    case TypingErrorKind::UnboundVariable:
    case TypingErrorKind::LinearityViolation:
      j["name"] = error.name;
      break;
    case TypingErrorKind::TypeMismatch:
      j["expected"] = to_json(error.expected);
      j["actual"] = to_json(error.actual);
      break;
    case TypingErrorKind::UnknownExpressionShape:
      break;
  }
  return j;
}

json to_json(const InferResult & result)
{
  if (result.success) {
    return json{{"success", true}, {"type", to_json(result.type)}};
  }
  return json{{"success", false}, {"error", to_json(result.error)}};
}

}  // namespace tlc
