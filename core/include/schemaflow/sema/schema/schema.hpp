// schemaflow/sema/schema/schema.hpp - Column and schema definitions
//
// A SchemaDefinition is the resolved, immutable shape of one declared schema.
// Definitions are owned by the SchemaRegistry; the binding resolver also
// synthesizes short-lived definitions for select/drop/merge results.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/sema/schema/value_type.hpp"

namespace schemaflow
{

// ============================================================================
// Column Membership
// ============================================================================

/// A single column; literal accesses must equal the lookup key.
struct ExactMember
{
};

/// A column family matched by patterns (`ColumnSet(members=r"x_\d+", regex=True)`).
struct RegexMember
{
  std::vector<std::string> patterns;

  /// Parallel to `patterns`; null for a pattern that was rejected. Shared
  /// between copies of the column so every derived schema reuses it.
  std::vector<std::shared_ptr<const std::regex>> compiled;
};

/// A column family listing its member names explicitly.
struct MembersList
{
  std::vector<std::string> names;
};

/// Members assigned at runtime (`members=DefinedLater`); every literal is accepted.
struct DeferredMembers
{
};

using Membership = std::variant<ExactMember, RegexMember, MembersList, DeferredMembers>;

/// Longest pattern accepted in a regex column family.
inline constexpr size_t k_max_column_pattern_length = 256;

/**
 * Compile one column-family pattern. Returns null when the pattern is too
 * long or is not a valid ECMAScript regular expression; `error` then says why.
 */
[[nodiscard]] std::shared_ptr<const std::regex> compile_column_pattern(
  std::string_view pattern, std::string & error);

// ============================================================================
// ColumnDefinition
// ============================================================================

struct ColumnDefinition
{
  std::string name;        ///< Attribute name on the schema class
  std::string lookup_key;  ///< Physical column name (the alias when one is set)
  ValueType value_type;
  Membership membership = ExactMember{};
  bool nullable = false;
  SourceRange declared_at;

  [[nodiscard]] bool is_exact() const noexcept
  {
    return std::holds_alternative<ExactMember>(membership);
  }
  [[nodiscard]] bool is_family() const noexcept { return !is_exact(); }

  /// True when `literal` is a member of this column family (never for exact columns).
  [[nodiscard]] bool family_accepts(std::string_view literal) const;
};

/// `ColumnGroup(members=[a, b])`: a named view over other members.
struct ColumnGroup
{
  std::string name;
  std::vector<std::string> members;
  SourceRange declared_at;
};

// ============================================================================
// SchemaDefinition
// ============================================================================

/// How a schema was declared.
enum class DeclarationStyle : uint8_t {
  DescriptorClass,      ///< `x = Column(...)` class attributes
  AnnotatedFieldClass,  ///< `x: int` / `x: Series[int] = Field(...)`
  Inheritance,          ///< Class composed from schema bases
  AddExpression,        ///< `C = A + B` or `combine_schemas(A, B)`
  SubsetExpression,     ///< `C = A.select([...])`
  DropExpression,       ///< `C = A.drop([...])`
  Synthesized,          ///< Built by the binding resolver, never registered
};

[[nodiscard]] std::string_view to_string(DeclarationStyle style) noexcept;

class SchemaDefinition
{
public:
  std::string name;
  SourceRange declared_at;
  std::vector<ColumnDefinition> columns;
  std::vector<ColumnGroup> groups;
  bool allow_extra_columns = true;
  bool resolved = true;  ///< False after a composition conflict or cycle
  DeclarationStyle origin = DeclarationStyle::DescriptorClass;

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const ColumnDefinition * find_by_key(std::string_view key) const noexcept;
  [[nodiscard]] const ColumnDefinition * find_by_name(std::string_view name) const noexcept;
  [[nodiscard]] const ColumnGroup * find_group(std::string_view name) const noexcept;

  /**
   * True when a literal subscript `df["name"]` names a member: an exact
   * column's lookup key, a listed or pattern-matched family member, a
   * column family itself, or a group.
   */
  [[nodiscard]] bool accepts_literal(std::string_view name) const;

  /// As accepts_literal(), but an attribute may also use a column's attribute name.
  [[nodiscard]] bool accepts_attribute(std::string_view name) const;

  /// Literal names that could be meant by a misspelled subscript.
  [[nodiscard]] std::vector<std::string> subscript_candidates() const;

  /// Names that could be meant by a misspelled attribute access.
  [[nodiscard]] std::vector<std::string> attribute_candidates() const;

  // ===========================================================================
  // Mutation (only while building)
  // ===========================================================================

  /// Add `column`, replacing an existing column with the same attribute name.
  void put_column(ColumnDefinition column);

  /// Add `group`, replacing an existing group with the same name.
  void put_group(ColumnGroup group);
};

// ============================================================================
// Composition
// ============================================================================

struct CompositionConflict
{
  std::string column;  ///< Lookup key both sides declare
  ValueType first;
  std::string first_schema;
  ValueType second;
  std::string second_schema;

  [[nodiscard]] std::string message() const;
};

/**
 * Union `parts` into `target` in order. A lookup key keeps its first
 * definition; a later definition of the same key with a different type is a
 * conflict. When several keys conflict, the lexicographically smallest one is
 * returned so the verdict does not depend on operand order.
 *
 * `target` is fully populated even when a conflict is returned.
 */
[[nodiscard]] std::optional<CompositionConflict> compose_into(
  SchemaDefinition & target, const std::vector<const SchemaDefinition *> & parts);

/**
 * Two columns of `schema` that share a lookup key with different types, or
 * none. Returns the pair with the smallest key; `first` is the earlier column.
 */
[[nodiscard]] std::optional<std::pair<const ColumnDefinition *, const ColumnDefinition *>>
find_key_clash(const SchemaDefinition & schema);

/// Keep only columns (and groups) whose attribute name or lookup key is in `names`.
[[nodiscard]] std::unique_ptr<SchemaDefinition> make_subset(
  const SchemaDefinition & source, const std::vector<std::string> & names, std::string name,
  DeclarationStyle origin);

/// Remove columns whose attribute name or lookup key is in `names`.
[[nodiscard]] std::unique_ptr<SchemaDefinition> make_drop(
  const SchemaDefinition & source, const std::vector<std::string> & names, std::string name,
  DeclarationStyle origin);

}  // namespace schemaflow
