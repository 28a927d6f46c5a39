// tlc/ast/ast.hpp - Expression node classes
//
// Expressions of the calculus, following the LLVM/Clang style with
// classof() for RTTI support. Nodes carry no type of their own; a type is
// only obtained by running TypeInferrer under a TypingContext.
//
#pragma once

#include <string_view>

#include "tlc/ast/ast_enums.hpp"
#include "tlc/basic/casting.hpp"

namespace tlc
{

struct Type;

// ============================================================================
// Base Class
// ============================================================================

/**
 * Base class for all expression nodes.
 *
 * Nodes are immutable after construction, non-copyable and owned by an
 * AstContext.
 */
class Expr
{
public:
  const NodeKind kind;

  Expr(const Expr &) = delete;
  Expr & operator=(const Expr &) = delete;
  Expr(Expr &&) = delete;
  Expr & operator=(Expr &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit Expr(NodeKind k) : kind(k) {}
  ~Expr() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that implements classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, NodeKind K>
class NodeBase : public Expr
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const Expr * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Expr(K) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Variable reference, resolved only through the typing context.
class VarExpr : public NodeBase<VarExpr, NodeKind::Var>
{
public:
  std::string_view name;

  explicit VarExpr(std::string_view n) : name(n) {}
};

/// Lambda abstraction: binds `param : paramType` over `body`.
class LambdaExpr : public NodeBase<LambdaExpr, NodeKind::Lambda>
{
public:
  std::string_view param;
  const Type * paramType = nullptr;
  const Expr * body = nullptr;

  LambdaExpr(std::string_view p, const Type * t, const Expr * b) : param(p), paramType(t), body(b)
  {
  }
};

/// Function application `(callee argument)`.
class ApplyExpr : public NodeBase<ApplyExpr, NodeKind::Apply>
{
public:
  const Expr * callee = nullptr;
  const Expr * argument = nullptr;

  ApplyExpr(const Expr * f, const Expr * a) : callee(f), argument(a) {}
};

/// Marks `inner` as evaluated under the named effect.
class EffectExpr : public NodeBase<EffectExpr, NodeKind::Effect>
{
public:
  std::string_view effect;
  const Expr * inner = nullptr;

  EffectExpr(std::string_view e, const Expr * i) : effect(e), inner(i) {}
};

}  // namespace tlc
