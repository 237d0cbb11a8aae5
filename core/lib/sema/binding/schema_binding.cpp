// schemaflow/sema/binding/schema_binding.cpp - Variable to schema bindings
#include "schemaflow/sema/binding/schema_binding.hpp"

namespace schemaflow
{

// ============================================================================
// BindingScope
// ============================================================================

void BindingScope::bind(std::string_view name, const SchemaDefinition * schema, Confidence confidence)
{
  SchemaBinding binding;
  binding.variable = qualifier_.empty() ? std::string(name) : qualifier_ + "." + std::string(name);
  binding.schema = schema;
  binding.confidence = confidence;
  table_.insert_or_assign(name, std::move(binding));
}

const SchemaBinding * BindingScope::lookup_local(std::string_view name) const
{
  auto it = table_.find(name);
  return it != table_.end() ? &it->second : nullptr;
}

const SchemaBinding * BindingScope::lookup(std::string_view name) const
{
  if (const SchemaBinding * b = lookup_local(name)) {
    return b;
  }
  return parent_ ? parent_->lookup(name) : nullptr;
}

const SchemaBinding * BindingScope::effective(const Table & t, std::string_view name) const
{
  auto it = t.find(name);
  if (it != t.end()) {
    return &it->second;
  }
  return parent_ ? parent_->lookup(name) : nullptr;
}

void BindingScope::merge(const Table & a, const Table & b)
{
  Table merged;

  auto join = [&](std::string_view name) {
    if (merged.count(name) != 0) {
      return;
    }
    const SchemaBinding * left = effective(a, name);
    const SchemaBinding * right = effective(b, name);
    const SchemaDefinition * ls = left ? left->schema : nullptr;
    const SchemaDefinition * rs = right ? right->schema : nullptr;

    if (ls != nullptr && ls == rs) {
      SchemaBinding binding = *left;
      if (right->confidence == Confidence::Inferred) {
        binding.confidence = Confidence::Inferred;
      }
      merged.emplace(name, std::move(binding));
      return;
    }
    // Divergent, or unknown on at least one path.
    SchemaBinding binding;
    binding.variable = left ? left->variable : (right ? right->variable : std::string(name));
    merged.emplace(name, std::move(binding));
  };

  for (const auto & [name, binding] : a) {
    (void)binding;
    join(name);
  }
  for (const auto & [name, binding] : b) {
    (void)binding;
    join(name);
  }
  table_ = std::move(merged);
}

// ============================================================================
// BindingEnvironment
// ============================================================================

BindingScope & BindingEnvironment::create_scope(std::string qualifier, const BindingScope * parent)
{
  scopes_.push_back(std::make_unique<BindingScope>(std::move(qualifier), parent));
  return *scopes_.back();
}

const SchemaDefinition * BindingEnvironment::adopt(std::unique_ptr<SchemaDefinition> schema)
{
  synthesized_.push_back(std::move(schema));
  return synthesized_.back().get();
}

}  // namespace schemaflow
