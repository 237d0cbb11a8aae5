// schemaflow/sema/schema/schema_collector.hpp - Per-file schema declaration scan
//
// First half of the Schema Registry pass. Runs once per parsed file (in
// parallel across files) and records every construct that may declare a
// schema. Whether a candidate really is a schema, and what it resolves to,
// is decided later by SchemaRegistry once every file has been collected.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/sema/schema/schema.hpp"

namespace schemaflow
{

// ============================================================================
// Raw Declarations
// ============================================================================

enum class CandidateKind : uint8_t {
  Class,   ///< `class S(Base, ...)`
  Add,     ///< `S = A + B` / `S = combine_schemas(A, B)`
  Subset,  ///< `S = A.select([...])`
  Drop,    ///< `S = A.drop([...])`
};

/// A name referenced by a declaration, with where it was written.
struct NamedRef
{
  std::string name;
  SourceRange range;
};

/// A column pattern that could not be compiled; reported only if its class is a schema.
struct PatternIssue
{
  SourceRange range;
  std::string message;
};

/**
 * One possible schema declaration as written in the source.
 *
 * For classes, `operands` lists the terminal base names in base-list order
 * and `columns`/`groups` hold the class's own members. For expressions,
 * `operands` are the composed schemas (Add) or the single source (Subset,
 * Drop) and `selection` lists the selected or dropped member names.
 */
struct RawSchema
{
  CandidateKind kind = CandidateKind::Class;
  std::string name;
  SourceRange declared_at;
  DeclarationStyle style = DeclarationStyle::DescriptorClass;

  std::vector<NamedRef> operands;
  std::vector<NamedRef> selection;

  std::vector<ColumnDefinition> columns;
  std::vector<ColumnGroup> groups;
  std::optional<bool> allow_extra_columns;

  std::vector<PatternIssue> pattern_issues;
};

struct CollectedSchemas
{
  FileId file_id;
  std::vector<RawSchema> candidates;
};

// ============================================================================
// SchemaCollector
// ============================================================================

/**
 * Scans the top level of one module for schema candidates.
 *
 * The AstContext is only used to re-parse string annotations; the collector
 * never reports diagnostics itself.
 */
class SchemaCollector
{
public:
  SchemaCollector(AstContext & ast, FileId file_id) : ast_(ast), file_id_(file_id) {}

  [[nodiscard]] CollectedSchemas collect(const Module & module);

  /// Base names that make a class a schema without being schemas themselves.
  [[nodiscard]] static bool is_schema_root(std::string_view name) noexcept;

private:
  void collect_class(const ClassDefStmt * cls, std::vector<RawSchema> & out);
  void collect_assignment(const AssignStmt * assign, std::vector<RawSchema> & out);

  void collect_descriptor(
    RawSchema & schema, const NameExpr * target, const CallExpr * call, const Expr * annotation);
  void collect_annotated_field(
    RawSchema & schema, const NameExpr * target, const Expr * annotation, const Expr * value);
  void collect_config_class(RawSchema & schema, const ClassDefStmt * config);

  /// Annotation with Optional/Series/Annotated wrappers removed.
  [[nodiscard]] const Expr * unwrap_annotation(const Expr * annotation, bool & nullable);

  AstContext & ast_;
  FileId file_id_;
};

// ============================================================================
// Expression helpers shared with the binding resolver
// ============================================================================

/// Value of a plain (non-f, non-bytes) string literal.
[[nodiscard]] std::optional<std::string_view> string_literal_value(const Expr * expr) noexcept;

/// Spelled type name of a type expression ("int", "pl.Int64", "datetime").
[[nodiscard]] std::string type_spelling(const Expr * expr);

/// Find a keyword argument by name.
[[nodiscard]] const Argument * find_keyword(const CallExpr * call, std::string_view name) noexcept;

/// The n-th positional argument, or null.
[[nodiscard]] const Expr * positional_arg(const CallExpr * call, size_t n) noexcept;

}  // namespace schemaflow
