// schemaflow/sema/binding/binding_resolver.hpp - Schema binding resolution
//
// Single forward walk over one file's syntax tree that tracks which schema
// each variable holds and hands every column access on a bound frame to an
// AccessSink. Module statements run first; function bodies are deferred and
// walked afterwards against the final state of their enclosing scope.
//
#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/ast/visitor.hpp"
#include "schemaflow/sema/binding/schema_binding.hpp"
#include "schemaflow/sema/check/access_site.hpp"
#include "schemaflow/sema/schema/schema_registry.hpp"

namespace schemaflow
{

/**
 * Binding Resolver.
 *
 * Binding sources, strongest first:
 * 1. a frame annotation naming a schema (Certain)
 * 2. a factory call naming a schema (Certain)
 * 3. a schema-preserving operation on a bound frame (Inferred)
 * 4. merge/concat/select/drop of bound frames (Inferred, synthesized schema)
 * Anything else leaves the variable Unknown. Divergent branch outcomes are
 * merged to Unknown.
 *
 * The registry must be frozen. The resolver is single-use: call run() once.
 */
class BindingResolver : public RecursiveAstVisitor<BindingResolver>
{
  using Base = RecursiveAstVisitor<BindingResolver>;

public:
  BindingResolver(
    const SchemaRegistry & registry, AstContext & ast, FileId file_id, AccessSink & sink);

  BindingResolver(const BindingResolver &) = delete;
  BindingResolver & operator=(const BindingResolver &) = delete;

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  void run(const Module & module);

  /// Module scope after run().
  [[nodiscard]] const BindingScope * module_scope() const noexcept { return module_scope_; }

  /// Final scope of a function body ("load", "Loader.run"), or null.
  [[nodiscard]] const BindingScope * function_scope(std::string_view qualifier) const;

  // ===========================================================================
  // Visitor Overrides
  // ===========================================================================

  // Statements
  bool visit_assign_stmt(const AssignStmt * node);
  bool visit_aug_assign_stmt(const AugAssignStmt * node);
  bool visit_ann_assign_stmt(const AnnAssignStmt * node);
  bool visit_delete_stmt(const DeleteStmt * node);
  bool visit_import_stmt(const ImportStmt * node);
  bool visit_import_from_stmt(const ImportFromStmt * node);
  bool visit_if_stmt(const IfStmt * node);
  bool visit_while_stmt(const WhileStmt * node);
  bool visit_for_stmt(const ForStmt * node);
  bool visit_with_stmt(const WithStmt * node);
  bool visit_try_stmt(const TryStmt * node);
  bool visit_match_stmt(const MatchStmt * node);
  bool visit_type_alias_stmt(const TypeAliasStmt * node);
  bool visit_function_def_stmt(const FunctionDefStmt * node);
  bool visit_class_def_stmt(const ClassDefStmt * node);

  // Expressions
  bool visit_subscript_expr(const SubscriptExpr * node);
  bool visit_attribute_expr(const AttributeExpr * node);
  bool visit_call_expr(const CallExpr * node);
  bool visit_named_expr(const NamedExpr * node);
  bool visit_lambda_expr(const LambdaExpr * node);
  bool visit_comprehension_expr(const ComprehensionExpr * node);

private:
  struct PendingBody
  {
    const FunctionDefStmt * function;
    const BindingScope * parent;
    std::string qualifier;
  };

  // --- Inference -------------------------------------------------------------

  /// Schema carried by the value of `expr` (variable field left empty).
  [[nodiscard]] SchemaBinding infer(const Expr * expr);
  [[nodiscard]] SchemaBinding infer_call(const CallExpr * call);
  [[nodiscard]] SchemaBinding infer_method(
    const CallExpr * call, const AttributeExpr * callee, const SchemaBinding & receiver);
  [[nodiscard]] SchemaBinding infer_subscript(const SubscriptExpr * sub);

  /// Registered schema named by a Name/Attribute expression, or null.
  [[nodiscard]] const SchemaDefinition * schema_named(const Expr * expr) const;
  [[nodiscard]] const SchemaDefinition * annotation_schema(const Expr * annotation);

  /**
   * Column names spelled by `"a"`, `S.a` or a list of those. Returns false
   * when any element is computed.
   */
  [[nodiscard]] bool column_names(const Expr * expr, std::vector<std::string> & out) const;

  /// Binding for a schema; unresolved schemas bind as Unknown.
  [[nodiscard]] static SchemaBinding bound_to(const SchemaDefinition * schema, Confidence c);

  [[nodiscard]] SchemaBinding union_of(const std::vector<const Expr *> & operands);
  [[nodiscard]] SchemaBinding subset_of(
    const SchemaBinding & source, const std::vector<std::string> & names);
  [[nodiscard]] SchemaBinding drop_from(
    const SchemaBinding & source, const std::vector<std::string> & names);

  // --- Access sites ----------------------------------------------------------

  /**
   * Report a column reference (`"x"` or `Other.x`) on `frame`. Returns the
   * physical name the reference resolves to, or nullopt when `ref` is not a
   * column reference.
   */
  std::optional<std::string> report_column_ref(
    const Expr * frame_expr, const SchemaBinding & frame, const Expr * ref, AccessMode mode);

  /// Report every column reference in a subscript index (single or list).
  std::vector<std::string> report_index(
    const Expr * frame_expr, const SchemaBinding & frame, const Expr * index, AccessMode mode);

  void report_selection_args(
    const CallExpr * call, const AttributeExpr * callee, const SchemaBinding & receiver);

  // --- Binding updates -------------------------------------------------------

  void assign_to(const Expr * target, const SchemaBinding & value);
  void write_subscript(const SubscriptExpr * target);
  void forget_targets(const Expr * target);

  // --- Scopes ----------------------------------------------------------------

  void collect_function_returns(const Module & module);
  void run_function(const PendingBody & pending);
  void visit_body(gsl::span<Stmt *> body);
  [[nodiscard]] std::string qualify(std::string_view name) const;

  /// Fold a list of branch outcomes into the current scope.
  void merge_outcomes(const std::vector<BindingScope::Table> & outcomes);

  const SchemaRegistry & registry_;
  AstContext & ast_;
  FileId file_id_;
  AccessSink & sink_;

  BindingEnvironment env_;
  BindingScope * scope_ = nullptr;
  const BindingScope * module_scope_ = nullptr;

  /// Parent for functions defined at the current point (class bodies skip themselves).
  const BindingScope * function_parent_ = nullptr;

  std::deque<PendingBody> pending_;
  std::unordered_map<std::string_view, const SchemaDefinition *> function_returns_;
  std::map<std::string, const BindingScope *, std::less<>> function_scopes_;
};

/// Spelling of a frame expression for diagnostics ("df", "load()", "df[...]").
[[nodiscard]] std::string describe_frame_expr(const Expr * expr);

}  // namespace schemaflow
