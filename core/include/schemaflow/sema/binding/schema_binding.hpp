// schemaflow/sema/binding/schema_binding.hpp - Variable to schema bindings
//
// Binding state for one file. Scopes form the usual lexical chain (module,
// then function bodies); an environment owns the scopes of one file and
// provides snapshot/merge for branching control flow.
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "schemaflow/sema/schema/schema.hpp"

namespace schemaflow
{

// ============================================================================
// SchemaBinding
// ============================================================================

enum class Confidence : uint8_t {
  Certain,   ///< Annotation or schema-naming factory call
  Inferred,  ///< Propagated through a frame operation
};

[[nodiscard]] constexpr std::string_view to_string(Confidence c) noexcept
{
  switch (c) {
    case Confidence::Certain:
      return "certain";
    case Confidence::Inferred:
      return "inferred";
  }
  return "";
}

/**
 * "At this point, `variable` holds a frame of `schema`."
 * A null schema is Unknown: accesses through it are never judged.
 */
struct SchemaBinding
{
  std::string variable;  ///< Scope-qualified name ("load.df")
  const SchemaDefinition * schema = nullptr;
  Confidence confidence = Confidence::Inferred;

  [[nodiscard]] bool is_unknown() const noexcept { return schema == nullptr; }

  [[nodiscard]] static SchemaBinding unknown() { return SchemaBinding{}; }
};

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// BindingScope
// ============================================================================

/**
 * Bindings of one module, class body, function body or comprehension.
 *
 * An explicit Unknown entry shadows bindings of outer scopes; a name with no
 * entry at all falls through to the parent. Keys are interned names whose
 * storage is owned by the file's AstContext.
 */
class BindingScope
{
public:
  using Table = std::unordered_map<std::string_view, SchemaBinding, StringViewHash, StringViewEqual>;

  BindingScope(std::string qualifier, const BindingScope * parent)
  : qualifier_(std::move(qualifier)), parent_(parent)
  {
  }

  /// Bind (or rebind) `name` from this point on.
  void bind(std::string_view name, const SchemaDefinition * schema, Confidence confidence);

  /// Mark `name` as holding something of unknown shape.
  void forget(std::string_view name) { bind(name, nullptr, Confidence::Inferred); }

  [[nodiscard]] const SchemaBinding * lookup_local(std::string_view name) const;

  /// Innermost binding of `name`, searching parent scopes.
  [[nodiscard]] const SchemaBinding * lookup(std::string_view name) const;

  [[nodiscard]] const BindingScope * parent() const noexcept { return parent_; }
  [[nodiscard]] const std::string & qualifier() const noexcept { return qualifier_; }
  [[nodiscard]] const Table & table() const noexcept { return table_; }

  // Snapshot support for branch merging
  [[nodiscard]] Table snapshot() const { return table_; }
  void restore(Table table) { table_ = std::move(table); }

  /**
   * Replace the local table with the join of two branch outcomes. A name
   * keeps its binding only when both branches agree on the schema;
   * otherwise it becomes an explicit Unknown.
   */
  void merge(const Table & a, const Table & b);

private:
  [[nodiscard]] const SchemaBinding * effective(const Table & t, std::string_view name) const;

  std::string qualifier_;
  const BindingScope * parent_;
  Table table_;
};

// ============================================================================
// BindingEnvironment
// ============================================================================

/**
 * Owns every scope created while resolving one file. Scopes stay alive until
 * the environment is destroyed, so deferred function bodies can use their
 * enclosing scope as it stood at the end of that scope's traversal.
 */
class BindingEnvironment
{
public:
  BindingEnvironment() = default;

  BindingEnvironment(const BindingEnvironment &) = delete;
  BindingEnvironment & operator=(const BindingEnvironment &) = delete;

  BindingScope & create_scope(std::string qualifier, const BindingScope * parent);

  /// Keep a schema synthesized for this file alive and return it.
  const SchemaDefinition * adopt(std::unique_ptr<SchemaDefinition> schema);

private:
  std::vector<std::unique_ptr<BindingScope>> scopes_;
  std::vector<std::unique_ptr<SchemaDefinition>> synthesized_;
};

}  // namespace schemaflow
