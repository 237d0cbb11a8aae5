// schemaflow/sema/schema/schema_registry.hpp - Project-wide schema table
//
// Second half of the Schema Registry pass. Per-file candidates are merged in
// path order, composition dependencies are resolved across files, and the
// registry is frozen before any file is checked.
//
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/sema/schema/schema.hpp"
#include "schemaflow/sema/schema/schema_collector.hpp"

namespace schemaflow
{

/**
 * Maps schema names to resolved SchemaDefinitions.
 *
 * Lifecycle: add_file() for every collected file, then resolve(), then
 * freeze(). Once frozen the registry is read-only and safe to share between
 * threads. Consulting it before freeze() is an internal fault.
 */
class SchemaRegistry
{
public:
  SchemaRegistry() = default;

  SchemaRegistry(const SchemaRegistry &) = delete;
  SchemaRegistry & operator=(const SchemaRegistry &) = delete;
  SchemaRegistry(SchemaRegistry &&) = default;
  SchemaRegistry & operator=(SchemaRegistry &&) = default;

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /// add_file() for each entry (in the given order), resolve(), freeze().
  [[nodiscard]] static SchemaRegistry build(
    std::vector<CollectedSchemas> files, DiagnosticBag & diags);

  // ===========================================================================
  // Building
  // ===========================================================================

  /// Queue one file's candidates. Files must be added in path order.
  void add_file(CollectedSchemas collected);

  /**
   * Decide which candidates are schemas and resolve every composition.
   * Conflicts, cycles, duplicate names and bad column patterns are reported
   * to `diags`; none of them stop the other schemas from resolving.
   */
  void resolve(DiagnosticBag & diags);

  void freeze();

  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Queries (frozen registry only)
  // ===========================================================================

  /// Schema by name, or null. Unresolved schemas are returned too.
  [[nodiscard]] const SchemaDefinition * find(std::string_view name) const;

  /// Every schema, ordered by name.
  [[nodiscard]] std::vector<const SchemaDefinition *> schemas() const;

  [[nodiscard]] size_t size() const noexcept { return by_name_.size(); }

private:
  enum class State : uint8_t {
    Pending,
    Visiting,
    Done,
  };

  struct Entry
  {
    RawSchema raw;
    bool is_schema = false;
    State state = State::Pending;
    bool in_cycle = false;
    std::optional<bool> explicit_allow_extra;  ///< Set here or inherited from a base that set it
    std::unique_ptr<SchemaDefinition> definition;
  };

  void require_frozen(std::string_view operation) const;

  void classify();
  void spread_from_roots(std::set<std::string, std::less<>> & known);

  /// Mark candidates that only wait on each other as schemas; true if any were.
  bool promote_cyclic_candidates(std::set<std::string, std::less<>> & known);
  void pick_winners(DiagnosticBag & diags);

  /// Resolve one entry; returns null while the entry is on the resolution stack.
  const SchemaDefinition * resolve_entry(
    size_t index, std::vector<size_t> & stack, DiagnosticBag & diags);
  void resolve_class(Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags);
  void resolve_add(Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags);
  void resolve_selection(Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags);

  [[nodiscard]] std::optional<size_t> index_of(std::string_view name) const;

  std::vector<Entry> entries_;
  std::map<std::string, size_t, std::less<>> by_name_;
  bool resolved_ = false;
  bool frozen_ = false;
};

}  // namespace schemaflow
