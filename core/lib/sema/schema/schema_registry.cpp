// schemaflow/sema/schema/schema_registry.cpp - Project-wide schema table
#include "schemaflow/sema/schema/schema_registry.hpp"

#include <algorithm>
#include <map>

#include <gsl/span>

#include "schemaflow/sema/check/fuzzy_match.hpp"

namespace schemaflow
{

SchemaRegistry SchemaRegistry::build(std::vector<CollectedSchemas> files, DiagnosticBag & diags)
{
  SchemaRegistry registry;
  for (auto & file : files) {
    registry.add_file(std::move(file));
  }
  registry.resolve(diags);
  registry.freeze();
  return registry;
}

void SchemaRegistry::add_file(CollectedSchemas collected)
{
  if (resolved_) {
    throw InternalFault("schema candidates added after the registry was resolved");
  }
  for (auto & raw : collected.candidates) {
    Entry entry;
    entry.raw = std::move(raw);
    entries_.push_back(std::move(entry));
  }
}

void SchemaRegistry::resolve(DiagnosticBag & diags)
{
  if (resolved_) {
    throw InternalFault("schema registry resolved twice");
  }
  resolved_ = true;

  classify();
  pick_winners(diags);

  // Name order keeps cycle reports independent of file order.
  std::vector<size_t> stack;
  for (const auto & [name, index] : by_name_) {
    (void)name;
    resolve_entry(index, stack, diags);
  }
}

void SchemaRegistry::freeze()
{
  if (!resolved_) {
    throw InternalFault("schema registry frozen before it was resolved");
  }
  frozen_ = true;
}

void SchemaRegistry::require_frozen(std::string_view operation) const
{
  if (!frozen_) {
    throw InternalFault(
      "schema registry consulted before it was frozen (" + std::string(operation) + ")");
  }
}

const SchemaDefinition * SchemaRegistry::find(std::string_view name) const
{
  require_frozen("find");
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return nullptr;
  }
  return entries_[it->second].definition.get();
}

std::vector<const SchemaDefinition *> SchemaRegistry::schemas() const
{
  require_frozen("schemas");
  std::vector<const SchemaDefinition *> out;
  out.reserve(by_name_.size());
  for (const auto & [name, index] : by_name_) {
    (void)name;
    out.push_back(entries_[index].definition.get());
  }
  return out;
}

std::optional<size_t> SchemaRegistry::index_of(std::string_view name) const
{
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ============================================================================
// Classification
// ============================================================================

namespace
{

/// Operands that decide whether a candidate of `kind` is a schema.
gsl::span<const NamedRef> deciding_operands(const RawSchema & raw)
{
  const gsl::span<const NamedRef> ops(raw.operands.data(), raw.operands.size());
  if (raw.kind == CandidateKind::Subset || raw.kind == CandidateKind::Drop) {
    return ops.first(ops.empty() ? 0 : 1);
  }
  return ops;
}

}  // namespace

void SchemaRegistry::classify()
{
  std::set<std::string, std::less<>> known;
  do {
    spread_from_roots(known);
  } while (promote_cyclic_candidates(known));
}

void SchemaRegistry::spread_from_roots(std::set<std::string, std::less<>> & known)
{
  // Schema-ness spreads from the roots until nothing changes.
  auto is_known = [&](const std::string & n) { return known.count(n) != 0; };

  bool changed = true;
  while (changed) {
    changed = false;
    for (auto & entry : entries_) {
      if (entry.is_schema) {
        continue;
      }
      const auto ops = deciding_operands(entry.raw);
      bool schema = false;
      switch (entry.raw.kind) {
        case CandidateKind::Class:
          schema = std::any_of(ops.begin(), ops.end(), [&](const NamedRef & op) {
            return SchemaCollector::is_schema_root(op.name) || is_known(op.name);
          });
          break;
        case CandidateKind::Add:
        case CandidateKind::Subset:
        case CandidateKind::Drop:
          schema = !ops.empty() && std::all_of(ops.begin(), ops.end(), [&](const NamedRef & op) {
            return is_known(op.name);
          });
          break;
      }
      if (schema) {
        entry.is_schema = true;
        known.insert(entry.raw.name);
        changed = true;
      }
    }
  }
}

bool SchemaRegistry::promote_cyclic_candidates(std::set<std::string, std::less<>> & known)
{
  // Candidates left over after spreading can only be waiting on each other.
  // Keep those whose operands stay inside the known schemas and the other
  // leftovers, then promote the ones that reach a known schema so resolution
  // reports the cycle.
  std::map<std::string, bool, std::less<>> pending;  // name -> reaches a known schema
  for (const auto & entry : entries_) {
    if (!entry.is_schema) {
      pending.emplace(entry.raw.name, false);
    }
  }
  auto inside = [&](const NamedRef & op) {
    return known.count(op.name) != 0 || pending.count(op.name) != 0;
  };

  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto & entry : entries_) {
      if (entry.is_schema || pending.count(entry.raw.name) == 0) {
        continue;
      }
      const auto ops = deciding_operands(entry.raw);
      const bool closed = entry.raw.kind == CandidateKind::Class
                            ? std::any_of(ops.begin(), ops.end(), inside)
                            : !ops.empty() && std::all_of(ops.begin(), ops.end(), inside);
      if (!closed) {
        pending.erase(entry.raw.name);
        changed = true;
      }
    }
  }

  changed = true;
  while (changed) {
    changed = false;
    for (const auto & entry : entries_) {
      const auto it = pending.find(entry.raw.name);
      if (entry.is_schema || it == pending.end() || it->second) {
        continue;
      }
      const auto ops = deciding_operands(entry.raw);
      const bool reaches = std::any_of(ops.begin(), ops.end(), [&](const NamedRef & op) {
        if (known.count(op.name) != 0) {
          return true;
        }
        const auto other = pending.find(op.name);
        return other != pending.end() && other->second;
      });
      if (reaches) {
        it->second = true;
        changed = true;
      }
    }
  }

  bool promoted = false;
  for (auto & entry : entries_) {
    const auto it = pending.find(entry.raw.name);
    if (!entry.is_schema && it != pending.end() && it->second) {
      entry.is_schema = true;
      known.insert(entry.raw.name);
      promoted = true;
    }
  }
  return promoted;
}

void SchemaRegistry::pick_winners(DiagnosticBag & diags)
{
  for (size_t i = 0; i < entries_.size(); ++i) {
    const Entry & entry = entries_[i];
    if (!entry.is_schema) {
      continue;
    }

    const auto [it, inserted] = by_name_.emplace(entry.raw.name, i);
    if (!inserted) {
      const Entry & first = entries_[it->second];
      diags
        .report_warning(
          entry.raw.declared_at,
          "Schema '" + entry.raw.name + "' is declared more than once; the first declaration is used")
        .with_code(codes::k_duplicate_schema)
        .with_secondary_label(first.raw.declared_at, "first declared here");
      continue;
    }

    for (const auto & issue : entry.raw.pattern_issues) {
      diags.report_warning(issue.range, issue.message).with_code(codes::k_invalid_column_pattern);
    }
  }
}

// ============================================================================
// Resolution
// ============================================================================

const SchemaDefinition * SchemaRegistry::resolve_entry(
  size_t index, std::vector<size_t> & stack, DiagnosticBag & diags)
{
  Entry & entry = entries_[index];
  if (entry.state == State::Done) {
    return entry.definition.get();
  }

  if (entry.state == State::Visiting) {
    const auto start = std::find(stack.begin(), stack.end(), index);
    std::string path;
    for (auto it = start; it != stack.end(); ++it) {
      entries_[*it].in_cycle = true;
      path += entries_[*it].raw.name + " -> ";
    }
    path += entry.raw.name;
    diags
      .report_error(
        entry.raw.declared_at,
        "Schema '" + entry.raw.name + "' is composed from itself (" + path + ")")
      .with_code(codes::k_schema_conflict);
    return nullptr;
  }

  entry.state = State::Visiting;
  stack.push_back(index);

  entry.definition = std::make_unique<SchemaDefinition>();
  entry.definition->name = entry.raw.name;
  entry.definition->declared_at = entry.raw.declared_at;
  entry.definition->origin = entry.raw.style;

  switch (entry.raw.kind) {
    case CandidateKind::Class:
      resolve_class(entry, stack, diags);
      break;
    case CandidateKind::Add:
      resolve_add(entry, stack, diags);
      break;
    case CandidateKind::Subset:
    case CandidateKind::Drop:
      resolve_selection(entry, stack, diags);
      break;
  }

  // entries_ is never resized while resolving, so `entry` is still valid.
  if (entry.in_cycle) {
    entry.definition->resolved = false;
  }
  entry.state = State::Done;
  stack.pop_back();
  return entry.definition.get();
}

void SchemaRegistry::resolve_class(Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags)
{
  SchemaDefinition & def = *entry.definition;
  std::vector<const SchemaDefinition *> bases;
  std::optional<bool> inherited_allow_extra;
  bool bases_ok = true;

  for (const auto & op : entry.raw.operands) {
    if (SchemaCollector::is_schema_root(op.name)) {
      continue;
    }
    const auto base_index = index_of(op.name);
    if (!base_index) {
      continue;  // Mixins and other non-schema bases contribute nothing.
    }
    const SchemaDefinition * base = resolve_entry(*base_index, stack, diags);
    if (base == nullptr || !base->resolved) {
      bases_ok = false;
      continue;
    }
    bases.push_back(base);
    if (!inherited_allow_extra) {
      inherited_allow_extra = entries_[*base_index].explicit_allow_extra;
    }
  }

  if (auto conflict = compose_into(def, bases)) {
    diags.report_error(def.declared_at, conflict->message()).with_code(codes::k_schema_conflict);
    def.resolved = false;
  }
  if (!bases_ok) {
    def.resolved = false;
  }

  // Own members override inherited ones by attribute name.
  for (const auto & column : entry.raw.columns) {
    def.put_column(column);
  }
  for (const auto & group : entry.raw.groups) {
    def.put_group(group);
  }

  // An override may still collide with another column's physical name.
  if (def.resolved) {
    if (const auto clash = find_key_clash(def)) {
      const auto owner = [&](const ColumnDefinition & column) -> std::string {
        const bool own = std::any_of(
          entry.raw.columns.begin(), entry.raw.columns.end(),
          [&](const ColumnDefinition & c) { return c.name == column.name; });
        if (!own) {
          for (const auto * base : bases) {
            const ColumnDefinition * inherited = base->find_by_name(column.name);
            if (inherited != nullptr && inherited->lookup_key == column.lookup_key) {
              return base->name;
            }
          }
        }
        return def.name;
      };
      const ColumnDefinition & first = *clash->first;
      const ColumnDefinition & second = *clash->second;
      const CompositionConflict conflict{
        first.lookup_key, first.value_type, owner(first), second.value_type, owner(second)};
      diags.report_error(second.declared_at, conflict.message())
        .with_code(codes::k_schema_conflict)
        .with_secondary_label(first.declared_at, "'" + first.lookup_key + "' first declared here");
      def.resolved = false;
    }
  }

  if (!bases.empty() && entry.raw.columns.empty() && entry.raw.groups.empty()) {
    def.origin = DeclarationStyle::Inheritance;
  }

  entry.explicit_allow_extra =
    entry.raw.allow_extra_columns ? entry.raw.allow_extra_columns : inherited_allow_extra;
  def.allow_extra_columns = entry.explicit_allow_extra.value_or(true);
}

void SchemaRegistry::resolve_add(Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags)
{
  SchemaDefinition & def = *entry.definition;
  std::vector<const SchemaDefinition *> parts;
  bool parts_ok = true;

  for (const auto & op : entry.raw.operands) {
    const auto part_index = index_of(op.name);
    const SchemaDefinition * part =
      part_index ? resolve_entry(*part_index, stack, diags) : nullptr;
    if (part == nullptr || !part->resolved) {
      parts_ok = false;
      continue;
    }
    parts.push_back(part);
  }

  if (!parts_ok) {
    def.resolved = false;
    return;
  }
  if (auto conflict = compose_into(def, parts)) {
    diags.report_error(def.declared_at, conflict->message()).with_code(codes::k_schema_conflict);
    def.resolved = false;
  }
  def.allow_extra_columns = true;
}

void SchemaRegistry::resolve_selection(
  Entry & entry, std::vector<size_t> & stack, DiagnosticBag & diags)
{
  const auto source_index = index_of(entry.raw.operands.front().name);
  const SchemaDefinition * source =
    source_index ? resolve_entry(*source_index, stack, diags) : nullptr;
  if (source == nullptr || !source->resolved) {
    entry.definition->resolved = false;
    return;
  }

  std::vector<std::string> names;
  names.reserve(entry.raw.selection.size());
  for (const auto & ref : entry.raw.selection) {
    const bool known = source->find_by_name(ref.name) != nullptr ||
                       source->find_by_key(ref.name) != nullptr ||
                       source->find_group(ref.name) != nullptr;
    if (!known) {
      auto builder = diags.report_error(
        ref.range, "Column '" + ref.name + "' does not exist in " + source->name);
      builder.with_code(codes::k_unknown_column)
        .with_secondary_label(source->declared_at, source->name + " declared here");
      if (auto suggestion = best_match(ref.name, source->attribute_candidates())) {
        builder.with_fixit(ref.range, *suggestion);
      }
    }
    names.push_back(ref.name);
  }

  const DeclarationStyle origin = entry.raw.style;
  auto derived = entry.raw.kind == CandidateKind::Subset
                   ? make_subset(*source, names, entry.raw.name, origin)
                   : make_drop(*source, names, entry.raw.name, origin);
  derived->declared_at = entry.raw.declared_at;
  entry.definition = std::move(derived);
  entry.explicit_allow_extra = entries_[*source_index].explicit_allow_extra;
}

}  // namespace schemaflow
