// schemaflow/ast/ast_enums.hpp - Syntax tree enumerations
//
// Node kinds, operators and the small tags carried by supporting nodes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace schemaflow
{

// ============================================================================
// NodeKind - Identifies all syntax tree node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "schemaflow/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "schemaflow/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "schemaflow/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "schemaflow/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,       ///< +
  Sub,       ///< -
  Mul,       ///< *
  MatMul,    ///< @
  Div,       ///< /
  FloorDiv,  ///< //
  Mod,       ///< %
  Pow,       ///< **
  // Bitwise
  LShift,  ///< <<
  RShift,  ///< >>
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
  // Boolean
  And,  ///< and
  Or,   ///< or
  // Comparison
  Eq,     ///< ==
  Ne,     ///< !=
  Lt,     ///< <
  Le,     ///< <=
  Gt,     ///< >
  Ge,     ///< >=
  In,     ///< in
  NotIn,  ///< not in
  Is,     ///< is
  IsNot,  ///< is not
};

enum class UnaryOp : uint8_t {
  Not,     ///< not
  Neg,     ///< -
  Pos,     ///< +
  Invert,  ///< ~
};

/// How a call argument or class base-list entry is passed.
enum class ArgumentKind : uint8_t {
  Positional,  ///< f(x)
  Keyword,     ///< f(name=x)
  Star,        ///< f(*xs)
  DoubleStar,  ///< f(**kw)
};

enum class ParamKind : uint8_t {
  Normal,   ///< x, x: T, x=default
  VarArgs,  ///< *args (or the bare `*` separator when the name is empty)
  KwArgs,   ///< **kwargs
};

enum class ComprehensionKind : uint8_t { List, Set, Dict, Generator };

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Snake;
#include "schemaflow/ast/ast_nodes.def"
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::MatMul:
      return "@";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::FloorDiv:
      return "//";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::LShift:
      return "<<";
    case BinaryOp::RShift:
      return ">>";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::In:
      return "in";
    case BinaryOp::NotIn:
      return "not in";
    case BinaryOp::Is:
      return "is";
    case BinaryOp::IsNot:
      return "is not";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "not";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Pos:
      return "+";
    case UnaryOp::Invert:
      return "~";
  }
  return "";
}

// ============================================================================
// Category ranges
// ============================================================================

namespace detail
{
inline constexpr NodeKind k_first_expr_kind = NodeKind::Name;
inline constexpr NodeKind k_last_expr_kind = NodeKind::AsPattern;
inline constexpr NodeKind k_first_stmt_kind = NodeKind::ExprStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::TypeAliasStmt;
}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace schemaflow
