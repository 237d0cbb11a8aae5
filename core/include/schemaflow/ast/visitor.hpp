// schemaflow/ast/visitor.hpp - CRTP visitors for syntax tree traversal
#pragma once

#include <type_traits>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_enums.hpp"
#include "schemaflow/basic/casting.hpp"

namespace schemaflow
{

namespace detail
{

/// Propagate const from NodePtrT to a derived node type
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP dispatch
// ============================================================================

/**
 * CRTP visitor: `visit(node)` dispatches on NodeKind to `visit_<snake>()`
 * in the derived class. Unhandled kinds fall back to the category methods
 * (`visit_expr`, `visit_stmt`) and then to `visit_node`.
 *
 * @code
 *   class NameCounter : public ConstAstVisitor<NameCounter>
 *   {
 *   public:
 *     void visit_name_expr(const NameExpr * n) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "schemaflow/ast/ast_nodes.def"
    }

    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "schemaflow/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that walks every child node. Override a `visit_<snake>()` method
 * to customize; call the base implementation to continue into children or
 * return without it to prune the subtree. Returning false stops the walk.
 */
template <typename Derived, typename NodePtrT = const AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves: keep walking.
  bool visit_node(NodePtrT /*node*/) { return true; }

  template <typename Range>
  bool visit_all(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (n && !get_derived().visit(n)) return false;
    }
    return true;
  }

  bool visit_opt(NodePtrT node) { return !node || get_derived().visit(node); }

  // --- Expressions ---------------------------------------------------------

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->then_expr) &&
           get_derived().visit(node->else_expr);
  }

  bool visit_lambda_expr(NodePtr<LambdaExpr> node)
  {
    return visit_all(node->params) && get_derived().visit(node->body);
  }

  bool visit_named_expr(NodePtr<NamedExpr> node) { return get_derived().visit(node->value); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return get_derived().visit(node->callee) && visit_all(node->args);
  }

  bool visit_attribute_expr(NodePtr<AttributeExpr> node) { return get_derived().visit(node->base); }

  bool visit_subscript_expr(NodePtr<SubscriptExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }

  bool visit_slice_expr(NodePtr<SliceExpr> node)
  {
    return visit_opt(node->lower) && visit_opt(node->upper) && visit_opt(node->step);
  }

  bool visit_starred_expr(NodePtr<StarredExpr> node) { return get_derived().visit(node->value); }
  bool visit_list_expr(NodePtr<ListExpr> node) { return visit_all(node->elements); }
  bool visit_tuple_expr(NodePtr<TupleExpr> node) { return visit_all(node->elements); }
  bool visit_set_expr(NodePtr<SetExpr> node) { return visit_all(node->elements); }

  bool visit_dict_expr(NodePtr<DictExpr> node)
  {
    return visit_all(node->keys) && visit_all(node->values);
  }

  bool visit_comprehension_expr(NodePtr<ComprehensionExpr> node)
  {
    return visit_all(node->clauses) && visit_opt(node->element) && visit_opt(node->value);
  }

  bool visit_await_expr(NodePtr<AwaitExpr> node) { return get_derived().visit(node->value); }
  bool visit_yield_expr(NodePtr<YieldExpr> node) { return visit_opt(node->value); }

  bool visit_as_pattern_expr(NodePtr<AsPatternExpr> node)
  {
    return get_derived().visit(node->pattern) && get_derived().visit(node->target);
  }

  // --- Supporting nodes ----------------------------------------------------

  bool visit_argument(NodePtr<Argument> node) { return get_derived().visit(node->value); }

  bool visit_param(NodePtr<Param> node)
  {
    return visit_opt(node->annotation) && visit_opt(node->default_value);
  }

  bool visit_with_item(NodePtr<WithItem> node)
  {
    return get_derived().visit(node->context) && visit_opt(node->target);
  }

  bool visit_except_handler(NodePtr<ExceptHandler> node)
  {
    return visit_opt(node->type) && visit_all(node->body);
  }

  bool visit_comprehension_clause(NodePtr<ComprehensionClause> node)
  {
    return get_derived().visit(node->iter) && get_derived().visit(node->target) &&
           visit_all(node->conditions);
  }

  bool visit_match_case(NodePtr<MatchCase> node)
  {
    return get_derived().visit(node->pattern) && visit_opt(node->guard) && visit_all(node->body);
  }

  // --- Statements ----------------------------------------------------------

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_assign_stmt(NodePtr<AssignStmt> node)
  {
    return get_derived().visit(node->value) && visit_all(node->targets);
  }

  bool visit_aug_assign_stmt(NodePtr<AugAssignStmt> node)
  {
    return get_derived().visit(node->value) && get_derived().visit(node->target);
  }

  bool visit_ann_assign_stmt(NodePtr<AnnAssignStmt> node)
  {
    return get_derived().visit(node->annotation) && visit_opt(node->value) &&
           get_derived().visit(node->target);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return visit_opt(node->value); }
  bool visit_delete_stmt(NodePtr<DeleteStmt> node) { return visit_all(node->targets); }

  bool visit_raise_stmt(NodePtr<RaiseStmt> node)
  {
    return visit_opt(node->exception) && visit_opt(node->cause);
  }

  bool visit_assert_stmt(NodePtr<AssertStmt> node)
  {
    return get_derived().visit(node->test) && visit_opt(node->message);
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->then_body) &&
           visit_all(node->else_body);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->body) &&
           visit_all(node->else_body);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return get_derived().visit(node->iter) && get_derived().visit(node->target) &&
           visit_all(node->body) && visit_all(node->else_body);
  }

  bool visit_with_stmt(NodePtr<WithStmt> node)
  {
    return visit_all(node->items) && visit_all(node->body);
  }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    return visit_all(node->body) && visit_all(node->handlers) && visit_all(node->else_body) &&
           visit_all(node->finally_body);
  }

  bool visit_function_def_stmt(NodePtr<FunctionDefStmt> node)
  {
    return visit_all(node->decorators) && visit_all(node->type_params) &&
           visit_all(node->params) && visit_opt(node->returns) && visit_all(node->body);
  }

  bool visit_class_def_stmt(NodePtr<ClassDefStmt> node)
  {
    return visit_all(node->decorators) && visit_all(node->type_params) &&
           visit_all(node->bases) && visit_all(node->body);
  }

  bool visit_match_stmt(NodePtr<MatchStmt> node)
  {
    return get_derived().visit(node->subject) && visit_all(node->cases);
  }

  bool visit_type_alias_stmt(NodePtr<TypeAliasStmt> node)
  {
    return get_derived().visit(node->name) && visit_all(node->type_params) &&
           get_derived().visit(node->value);
  }

  bool visit_module(NodePtr<Module> node) { return visit_all(node->body); }
};

}  // namespace schemaflow
