// schemaflow/sema/schema/schema.cpp - Column and schema definitions
#include "schemaflow/sema/schema/schema.hpp"

#include <algorithm>
#include <unordered_map>

namespace schemaflow
{

std::shared_ptr<const std::regex> compile_column_pattern(std::string_view pattern, std::string & error)
{
  if (pattern.size() > k_max_column_pattern_length) {
    error = "pattern is longer than " + std::to_string(k_max_column_pattern_length) + " characters";
    return nullptr;
  }
  try {
    return std::make_shared<const std::regex>(
      std::string(pattern), std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error & e) {
    error = e.what();
    return nullptr;
  }
}

// ============================================================================
// ColumnDefinition
// ============================================================================

bool ColumnDefinition::family_accepts(std::string_view literal) const
{
  if (std::holds_alternative<DeferredMembers>(membership)) {
    return true;
  }
  if (const auto * list = std::get_if<MembersList>(&membership)) {
    return std::find(list->names.begin(), list->names.end(), literal) != list->names.end();
  }

  if (const auto * rx = std::get_if<RegexMember>(&membership)) {
    const std::string subject(literal);
    for (const auto & compiled : rx->compiled) {
      // Anchored at the start only, like Python's re.match.
      if (
        compiled &&
        std::regex_search(subject, *compiled, std::regex_constants::match_continuous)) {
        return true;
      }
    }
  }
  return false;
}

std::string_view to_string(DeclarationStyle style) noexcept
{
  switch (style) {
    case DeclarationStyle::DescriptorClass:
      return "descriptor_class";
    case DeclarationStyle::AnnotatedFieldClass:
      return "annotated_field_class";
    case DeclarationStyle::Inheritance:
      return "inheritance";
    case DeclarationStyle::AddExpression:
      return "add_expression";
    case DeclarationStyle::SubsetExpression:
      return "subset_expression";
    case DeclarationStyle::DropExpression:
      return "drop_expression";
    case DeclarationStyle::Synthesized:
      return "synthesized";
  }
  return "";
}

// ============================================================================
// SchemaDefinition
// ============================================================================

const ColumnDefinition * SchemaDefinition::find_by_key(std::string_view key) const noexcept
{
  for (const auto & c : columns) {
    if (c.is_exact() && c.lookup_key == key) {
      return &c;
    }
  }
  return nullptr;
}

const ColumnDefinition * SchemaDefinition::find_by_name(std::string_view name) const noexcept
{
  for (const auto & c : columns) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

const ColumnGroup * SchemaDefinition::find_group(std::string_view name) const noexcept
{
  for (const auto & g : groups) {
    if (g.name == name) {
      return &g;
    }
  }
  return nullptr;
}

bool SchemaDefinition::accepts_literal(std::string_view name) const
{
  if (find_by_key(name) != nullptr) {
    return true;
  }
  for (const auto & c : columns) {
    if (c.is_family() && (c.name == name || c.family_accepts(name))) {
      return true;
    }
  }
  return find_group(name) != nullptr;
}

bool SchemaDefinition::accepts_attribute(std::string_view name) const
{
  return find_by_name(name) != nullptr || accepts_literal(name);
}

std::vector<std::string> SchemaDefinition::subscript_candidates() const
{
  std::vector<std::string> out;
  for (const auto & c : columns) {
    if (c.is_exact()) {
      out.push_back(c.lookup_key);
    } else if (const auto * list = std::get_if<MembersList>(&c.membership)) {
      out.insert(out.end(), list->names.begin(), list->names.end());
    }
  }
  return out;
}

std::vector<std::string> SchemaDefinition::attribute_candidates() const
{
  std::vector<std::string> out;
  for (const auto & c : columns) {
    out.push_back(c.name);
    if (c.is_exact() && c.lookup_key != c.name) {
      out.push_back(c.lookup_key);
    }
  }
  for (const auto & g : groups) {
    out.push_back(g.name);
  }
  return out;
}

void SchemaDefinition::put_column(ColumnDefinition column)
{
  for (auto & c : columns) {
    if (c.name == column.name) {
      c = std::move(column);
      return;
    }
  }
  columns.push_back(std::move(column));
}

void SchemaDefinition::put_group(ColumnGroup group)
{
  for (auto & g : groups) {
    if (g.name == group.name) {
      g = std::move(group);
      return;
    }
  }
  groups.push_back(std::move(group));
}

// ============================================================================
// Composition
// ============================================================================

std::string CompositionConflict::message() const
{
  return "Column '" + column + "' has conflicting types: " + first.display_name() + " (" +
         first_schema + ") vs " + second.display_name() + " (" + second_schema + ")";
}

std::optional<CompositionConflict> compose_into(
  SchemaDefinition & target, const std::vector<const SchemaDefinition *> & parts)
{
  struct Seen
  {
    size_t index;
    const SchemaDefinition * owner;
  };
  std::unordered_map<std::string, Seen> by_key;
  std::optional<CompositionConflict> conflict;

  for (size_t i = 0; i < target.columns.size(); ++i) {
    by_key.emplace(target.columns[i].lookup_key, Seen{i, &target});
  }

  for (const auto * part : parts) {
    if (part == nullptr) {
      continue;
    }
    for (const auto & column : part->columns) {
      const auto it = by_key.find(column.lookup_key);
      if (it == by_key.end()) {
        by_key.emplace(column.lookup_key, Seen{target.columns.size(), part});
        target.columns.push_back(column);
        continue;
      }

      const auto & existing = target.columns[it->second.index];
      if (existing.value_type == column.value_type) {
        continue;
      }
      if (!conflict || column.lookup_key < conflict->column) {
        conflict = CompositionConflict{
          column.lookup_key, existing.value_type, it->second.owner->name, column.value_type,
          part->name};
      }
    }
    for (const auto & group : part->groups) {
      if (target.find_group(group.name) == nullptr) {
        target.groups.push_back(group);
      }
    }
  }

  return conflict;
}

std::optional<std::pair<const ColumnDefinition *, const ColumnDefinition *>>
find_key_clash(const SchemaDefinition & schema)
{
  std::unordered_map<std::string, const ColumnDefinition *> by_key;
  std::optional<std::pair<const ColumnDefinition *, const ColumnDefinition *>> clash;
  for (const auto & column : schema.columns) {
    const auto [it, inserted] = by_key.emplace(column.lookup_key, &column);
    if (inserted || it->second->value_type == column.value_type) {
      continue;
    }
    if (!clash || column.lookup_key < clash->first->lookup_key) {
      clash = std::make_pair(it->second, &column);
    }
  }
  return clash;
}

namespace
{

bool selected(const ColumnDefinition & c, const std::vector<std::string> & names)
{
  return std::any_of(names.begin(), names.end(), [&](const std::string & n) {
    return n == c.name || n == c.lookup_key;
  });
}

std::unique_ptr<SchemaDefinition> derive(
  const SchemaDefinition & source, std::string name, DeclarationStyle origin)
{
  auto out = std::make_unique<SchemaDefinition>();
  out->name = std::move(name);
  out->declared_at = source.declared_at;
  out->allow_extra_columns = source.allow_extra_columns;
  out->resolved = source.resolved;
  out->origin = origin;
  return out;
}

}  // namespace

std::unique_ptr<SchemaDefinition> make_subset(
  const SchemaDefinition & source, const std::vector<std::string> & names, std::string name,
  DeclarationStyle origin)
{
  auto out = derive(source, std::move(name), origin);
  for (const auto & c : source.columns) {
    if (selected(c, names)) {
      out->columns.push_back(c);
    }
  }
  for (const auto & g : source.groups) {
    if (std::find(names.begin(), names.end(), g.name) != names.end()) {
      out->groups.push_back(g);
    }
  }
  return out;
}

std::unique_ptr<SchemaDefinition> make_drop(
  const SchemaDefinition & source, const std::vector<std::string> & names, std::string name,
  DeclarationStyle origin)
{
  auto out = derive(source, std::move(name), origin);
  for (const auto & c : source.columns) {
    if (!selected(c, names)) {
      out->columns.push_back(c);
    }
  }
  for (const auto & g : source.groups) {
    if (std::find(names.begin(), names.end(), g.name) == names.end()) {
      out->groups.push_back(g);
    }
  }
  return out;
}

}  // namespace schemaflow
