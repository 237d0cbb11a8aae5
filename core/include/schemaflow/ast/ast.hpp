// schemaflow/ast/ast.hpp - Syntax tree node classes for the analyzed source language
//
// Node classes follow the LLVM/Clang style with classof() for RTTI support.
// Nodes are arena-allocated by AstContext and must stay trivially
// destructible: text is held as std::string_view, child lists as gsl::span.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>

#include "schemaflow/ast/ast_enums.hpp"
#include "schemaflow/basic/casting.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all syntax tree nodes.
 *
 * Every node has a NodeKind (for classof-based RTTI) and the SourceRange it
 * was parsed from. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Bare identifier.
class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::Name>
{
public:
  std::string_view name;

  explicit NameExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  std::string_view text;  ///< Literal spelling; values beyond int64 are never folded.

  explicit IntLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  std::string_view text;

  explicit FloatLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// String literal. Adjacent literals are concatenated into one node.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;  ///< Decoded contents (escapes processed unless raw)
  bool is_bytes = false;
  bool is_formatted = false;  ///< f-string; contents are not a literal column name

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NoneLiteralExpr : public NodeBase<NoneLiteralExpr, Expr, NodeKind::NoneLiteral>
{
public:
  explicit NoneLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class EllipsisExpr : public NodeBase<EllipsisExpr, Expr, NodeKind::Ellipsis>
{
public:
  explicit EllipsisExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Binary, boolean and comparison operators. Chained comparisons nest left.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `then_expr if condition else else_expr`
class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::ConditionalExpr>
{
public:
  Expr * condition;
  Expr * then_expr;
  Expr * else_expr;

  ConditionalExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), then_expr(t), else_expr(e)
  {
  }
};

class Param;

class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::LambdaExpr>
{
public:
  gsl::span<Param *> params;
  Expr * body;

  LambdaExpr(gsl::span<Param *> p, Expr * b, SourceRange r = {}) : NodeBase(r), params(p), body(b)
  {
  }
};

/// Assignment expression `target := value`.
class NamedExpr : public NodeBase<NamedExpr, Expr, NodeKind::NamedExpr>
{
public:
  NameExpr * target;
  Expr * value;

  NamedExpr(NameExpr * t, Expr * v, SourceRange r = {}) : NodeBase(r), target(t), value(v) {}
};

class Argument;

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Argument *> args;

  CallExpr(Expr * c, gsl::span<Argument *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a)
  {
  }
};

/// `base.attr`
class AttributeExpr : public NodeBase<AttributeExpr, Expr, NodeKind::AttributeExpr>
{
public:
  Expr * base;
  std::string_view attr;
  SourceRange attr_range;  ///< Range of the attribute name alone

  AttributeExpr(Expr * b, std::string_view a, SourceRange ar, SourceRange r = {})
  : NodeBase(r), base(b), attr(a), attr_range(ar)
  {
  }
};

/// `base[index]`; a multi-element index is a TupleExpr.
class SubscriptExpr : public NodeBase<SubscriptExpr, Expr, NodeKind::SubscriptExpr>
{
public:
  Expr * base;
  Expr * index;

  SubscriptExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// `lower:upper:step` inside a subscript; any part may be null.
class SliceExpr : public NodeBase<SliceExpr, Expr, NodeKind::SliceExpr>
{
public:
  Expr * lower;
  Expr * upper;
  Expr * step;

  SliceExpr(Expr * l, Expr * u, Expr * s, SourceRange r = {})
  : NodeBase(r), lower(l), upper(u), step(s)
  {
  }
};

/// `*value` in displays and assignment targets.
class StarredExpr : public NodeBase<StarredExpr, Expr, NodeKind::StarredExpr>
{
public:
  Expr * value;

  explicit StarredExpr(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class ListExpr : public NodeBase<ListExpr, Expr, NodeKind::ListExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ListExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::TupleExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

class SetExpr : public NodeBase<SetExpr, Expr, NodeKind::SetExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit SetExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// Dict display. A null key marks a `**mapping` entry.
class DictExpr : public NodeBase<DictExpr, Expr, NodeKind::DictExpr>
{
public:
  gsl::span<Expr *> keys;
  gsl::span<Expr *> values;

  DictExpr(gsl::span<Expr *> k, gsl::span<Expr *> v, SourceRange r = {})
  : NodeBase(r), keys(k), values(v)
  {
  }
};

class ComprehensionClause;

/// List/set/dict comprehension or generator expression.
class ComprehensionExpr : public NodeBase<ComprehensionExpr, Expr, NodeKind::ComprehensionExpr>
{
public:
  ComprehensionKind comp_kind;
  Expr * element;  ///< For dicts: the key
  Expr * value;    ///< Dict value, otherwise null
  gsl::span<ComprehensionClause *> clauses;

  ComprehensionExpr(
    ComprehensionKind k, Expr * e, Expr * v, gsl::span<ComprehensionClause *> c,
    SourceRange r = {})
  : NodeBase(r), comp_kind(k), element(e), value(v), clauses(c)
  {
  }
};

class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::AwaitExpr>
{
public:
  Expr * value;

  explicit AwaitExpr(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class YieldExpr : public NodeBase<YieldExpr, Expr, NodeKind::YieldExpr>
{
public:
  Expr * value;  ///< May be null
  bool is_from = false;

  YieldExpr(Expr * v, bool from, SourceRange r = {}) : NodeBase(r), value(v), is_from(from) {}
};

/**
 * `pattern as name` inside a `case` clause.
 *
 * Other patterns reuse expression nodes: a NameExpr captures (`_` is the
 * wildcard), an AttributeExpr is a value pattern, List/Tuple are sequence
 * patterns, a DictExpr is a mapping pattern, a CallExpr is a class pattern
 * and `|` alternatives are BinaryExpr(BitOr).
 */
class AsPatternExpr : public NodeBase<AsPatternExpr, Expr, NodeKind::AsPattern>
{
public:
  Expr * pattern;
  NameExpr * target;

  AsPatternExpr(Expr * p, NameExpr * t, SourceRange r = {}) : NodeBase(r), pattern(p), target(t) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Call argument or class base-list entry.
class Argument : public NodeBase<Argument, AstNode, NodeKind::Argument>
{
public:
  ArgumentKind arg_kind;
  std::string_view name;  ///< Keyword name (Keyword kind only)
  Expr * value;

  Argument(ArgumentKind k, std::string_view n, Expr * v, SourceRange r = {})
  : NodeBase(r), arg_kind(k), name(n), value(v)
  {
  }

  [[nodiscard]] bool is_positional() const noexcept { return arg_kind == ArgumentKind::Positional; }
  [[nodiscard]] bool is_keyword() const noexcept { return arg_kind == ArgumentKind::Keyword; }
};

/// Function or lambda parameter.
class Param : public NodeBase<Param, AstNode, NodeKind::Param>
{
public:
  ParamKind param_kind;
  std::string_view name;
  Expr * annotation = nullptr;
  Expr * default_value = nullptr;

  Param(ParamKind k, std::string_view n, SourceRange r = {}) : NodeBase(r), param_kind(k), name(n)
  {
  }
};

/// `name` or `name as asname` in an import statement.
class ImportAlias : public NodeBase<ImportAlias, AstNode, NodeKind::ImportAlias>
{
public:
  std::string_view name;    ///< Dotted name for `import`, plain name for `from ... import`
  std::string_view asname;  ///< Empty when no alias

  ImportAlias(std::string_view n, std::string_view a, SourceRange r = {})
  : NodeBase(r), name(n), asname(a)
  {
  }

  [[nodiscard]] std::string_view bound_name() const noexcept
  {
    return asname.empty() ? name : asname;
  }
};

class WithItem : public NodeBase<WithItem, AstNode, NodeKind::WithItem>
{
public:
  Expr * context;
  Expr * target;  ///< May be null

  WithItem(Expr * c, Expr * t, SourceRange r = {}) : NodeBase(r), context(c), target(t) {}
};

class ExceptHandler : public NodeBase<ExceptHandler, AstNode, NodeKind::ExceptHandler>
{
public:
  Expr * type = nullptr;  ///< Null for a bare `except:`
  std::string_view name;
  gsl::span<Stmt *> body;

  explicit ExceptHandler(SourceRange r = {}) : NodeBase(r) {}
};

/// One `for target in iter if cond...` clause of a comprehension.
class ComprehensionClause
: public NodeBase<ComprehensionClause, AstNode, NodeKind::ComprehensionClause>
{
public:
  Expr * target;
  Expr * iter;
  gsl::span<Expr *> conditions;
  bool is_async = false;

  ComprehensionClause(Expr * t, Expr * i, gsl::span<Expr *> c, SourceRange r = {})
  : NodeBase(r), target(t), iter(i), conditions(c)
  {
  }
};

/// `case pattern [if guard]: body`
class MatchCase : public NodeBase<MatchCase, AstNode, NodeKind::MatchCase>
{
public:
  Expr * pattern;
  Expr * guard;  ///< May be null
  gsl::span<Stmt *> body;

  MatchCase(Expr * p, Expr * g, SourceRange r = {}) : NodeBase(r), pattern(p), guard(g) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `t1 = t2 = value`; targets are listed left to right.
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  gsl::span<Expr *> targets;
  Expr * value;

  AssignStmt(gsl::span<Expr *> t, Expr * v, SourceRange r = {}) : NodeBase(r), targets(t), value(v)
  {
  }
};

class AugAssignStmt : public NodeBase<AugAssignStmt, Stmt, NodeKind::AugAssignStmt>
{
public:
  Expr * target;
  BinaryOp op;
  Expr * value;

  AugAssignStmt(Expr * t, BinaryOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/// `target: annotation [= value]`
class AnnAssignStmt : public NodeBase<AnnAssignStmt, Stmt, NodeKind::AnnAssignStmt>
{
public:
  Expr * target;
  Expr * annotation;
  Expr * value;  ///< May be null

  AnnAssignStmt(Expr * t, Expr * a, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), annotation(a), value(v)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;  ///< May be null

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class PassStmt : public NodeBase<PassStmt, Stmt, NodeKind::PassStmt>
{
public:
  explicit PassStmt(SourceRange r = {}) : NodeBase(r) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

class DeleteStmt : public NodeBase<DeleteStmt, Stmt, NodeKind::DeleteStmt>
{
public:
  gsl::span<Expr *> targets;

  explicit DeleteStmt(gsl::span<Expr *> t, SourceRange r = {}) : NodeBase(r), targets(t) {}
};

class RaiseStmt : public NodeBase<RaiseStmt, Stmt, NodeKind::RaiseStmt>
{
public:
  Expr * exception;  ///< May be null
  Expr * cause;      ///< May be null

  RaiseStmt(Expr * e, Expr * c, SourceRange r = {}) : NodeBase(r), exception(e), cause(c) {}
};

class AssertStmt : public NodeBase<AssertStmt, Stmt, NodeKind::AssertStmt>
{
public:
  Expr * test;
  Expr * message;  ///< May be null

  AssertStmt(Expr * t, Expr * m, SourceRange r = {}) : NodeBase(r), test(t), message(m) {}
};

/// `global a, b` or `nonlocal a, b`
class GlobalStmt : public NodeBase<GlobalStmt, Stmt, NodeKind::GlobalStmt>
{
public:
  gsl::span<std::string_view> names;
  bool is_nonlocal = false;

  GlobalStmt(gsl::span<std::string_view> n, bool nonlocal, SourceRange r = {})
  : NodeBase(r), names(n), is_nonlocal(nonlocal)
  {
  }
};

class ImportStmt : public NodeBase<ImportStmt, Stmt, NodeKind::ImportStmt>
{
public:
  gsl::span<ImportAlias *> names;

  explicit ImportStmt(gsl::span<ImportAlias *> n, SourceRange r = {}) : NodeBase(r), names(n) {}
};

/// `from [.]*module import a as b, c` (`*` is recorded as an alias named "*").
class ImportFromStmt : public NodeBase<ImportFromStmt, Stmt, NodeKind::ImportFromStmt>
{
public:
  std::string_view module;
  uint32_t level = 0;  ///< Number of leading dots
  gsl::span<ImportAlias *> names;

  ImportFromStmt(std::string_view m, uint32_t lvl, gsl::span<ImportAlias *> n, SourceRange r = {})
  : NodeBase(r), module(m), level(lvl), names(n)
  {
  }
};

/// `if`; an `elif` chain is a nested IfStmt as the only else statement.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> then_body;
  gsl::span<Stmt *> else_body;

  explicit IfStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;
  gsl::span<Stmt *> else_body;

  explicit WhileStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Expr * target;
  Expr * iter;
  gsl::span<Stmt *> body;
  gsl::span<Stmt *> else_body;
  bool is_async = false;

  ForStmt(Expr * t, Expr * i, SourceRange r = {}) : NodeBase(r), target(t), iter(i) {}
};

class WithStmt : public NodeBase<WithStmt, Stmt, NodeKind::WithStmt>
{
public:
  gsl::span<WithItem *> items;
  gsl::span<Stmt *> body;
  bool is_async = false;

  explicit WithStmt(gsl::span<WithItem *> i, SourceRange r = {}) : NodeBase(r), items(i) {}
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  gsl::span<Stmt *> body;
  gsl::span<ExceptHandler *> handlers;
  gsl::span<Stmt *> else_body;
  gsl::span<Stmt *> finally_body;

  explicit TryStmt(SourceRange r = {}) : NodeBase(r) {}
};

class FunctionDefStmt : public NodeBase<FunctionDefStmt, Stmt, NodeKind::FunctionDef>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<Expr *> decorators;
  gsl::span<Param *> params;
  Expr * returns = nullptr;  ///< Return annotation, may be null
  gsl::span<Stmt *> body;
  bool is_async = false;

  gsl::span<Param *> type_params;  ///< Bound in `annotation`, default in `default_value`

  FunctionDefStmt(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr)
  {
  }
};

/// `class Name(bases, keyword=...): body`
class ClassDefStmt : public NodeBase<ClassDefStmt, Stmt, NodeKind::ClassDef>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<Expr *> decorators;
  gsl::span<Argument *> bases;  ///< Positional bases and keyword entries (metaclass=...)
  gsl::span<Stmt *> body;
  gsl::span<Param *> type_params;

  ClassDefStmt(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr)
  {
  }
};

class MatchStmt : public NodeBase<MatchStmt, Stmt, NodeKind::MatchStmt>
{
public:
  Expr * subject;
  gsl::span<MatchCase *> cases;

  explicit MatchStmt(Expr * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// `type Name[params] = value`
class TypeAliasStmt : public NodeBase<TypeAliasStmt, Stmt, NodeKind::TypeAliasStmt>
{
public:
  NameExpr * name;
  gsl::span<Param *> type_params;
  Expr * value;

  TypeAliasStmt(NameExpr * n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

// ============================================================================
// Module (Root Node)
// ============================================================================

class Module : public NodeBase<Module, AstNode, NodeKind::Module>
{
public:
  gsl::span<Stmt *> body;

  explicit Module(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

/// Spelled dotted name of a Name/Attribute chain ("pd.DataFrame"), or empty.
/// The result is written into `out`; returns false for any other shape.
bool dotted_name(const Expr * expr, std::string & out);

/// Last component of a Name/Attribute chain ("DataFrame" for pd.DataFrame).
[[nodiscard]] std::string_view terminal_name(const Expr * expr) noexcept;

}  // namespace schemaflow
