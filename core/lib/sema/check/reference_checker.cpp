// schemaflow/sema/check/reference_checker.cpp - Column access judgment
#include "schemaflow/sema/check/reference_checker.hpp"

#include "schemaflow/sema/binding/binding_resolver.hpp"
#include "schemaflow/sema/check/fuzzy_match.hpp"

namespace schemaflow
{

Judgment ReferenceChecker::judge(
  const SchemaDefinition & schema, std::string_view name, AccessKind kind, AccessMode mode)
{
  const bool attribute = kind == AccessKind::Attribute;
  const bool accepted = attribute ? schema.accepts_attribute(name) : schema.accepts_literal(name);

  Judgment j;
  if (accepted) {
    return j;
  }

  if (mode == AccessMode::Write) {
    if (!schema.allow_extra_columns) {
      j.verdict = Verdict::UndeclaredMutation;
    }
    return j;
  }

  j.verdict = Verdict::UnknownColumn;
  j.suggestion =
    best_match(name, attribute ? schema.attribute_candidates() : schema.subscript_candidates());
  return j;
}

void ReferenceChecker::on_access(const AccessSite & site, const SchemaBinding & binding)
{
  if (binding.is_unknown()) {
    return;
  }
  ++sites_checked_;

  if (site.kind != AccessKind::SchemaColumnSubscript) {
    report(site, *binding.schema, site.name, judge(*binding.schema, site.name, site.kind, site.mode));
    return;
  }

  // df[Other.col]: `col` must exist on Other, and its key on the bound schema.
  const SchemaDefinition * other = site.referenced_schema;
  if (other == nullptr) {
    throw InternalFault("schema column access '" + site.name + "' without a referenced schema");
  }

  std::string key;
  if (const ColumnDefinition * col = other->find_by_name(site.name)) {
    key = col->is_exact() ? col->lookup_key : col->name;
  } else if (other->find_group(site.name) != nullptr) {
    key = site.name;
  } else {
    Judgment missing;
    missing.verdict = Verdict::UnknownColumn;
    missing.suggestion = best_match(site.name, other->attribute_candidates());
    report(site, *other, site.name, missing);
    return;
  }

  report(
    site, *binding.schema, key,
    judge(*binding.schema, key, AccessKind::LiteralSubscript, site.mode));
}

void ReferenceChecker::report(
  const AccessSite & site, const SchemaDefinition & schema, std::string_view name,
  const Judgment & judgment)
{
  if (judgment.ok()) {
    return;
  }

  const std::string column(name);
  if (judgment.verdict == Verdict::UndeclaredMutation) {
    auto builder = diags_.report_error(
      site.range,
      "Column '" + column + "' is not declared in " + schema.name +
        " (allow_extra_columns is False)");
    builder.with_code(codes::k_undeclared_mutation)
      .with_help("declare '" + column + "' in " + schema.name + " or set allow_extra_columns = True");
    if (schema.declared_at.is_valid()) {
      builder.with_secondary_label(schema.declared_at, schema.name + " declared here");
    }
    return;
  }

  auto builder =
    diags_.report_error(site.range, "Column '" + column + "' does not exist in " + schema.name);
  builder.with_code(codes::k_unknown_column);
  if (schema.declared_at.is_valid()) {
    builder.with_secondary_label(schema.declared_at, schema.name + " declared here");
  }
  if (judgment.suggestion) {
    builder.with_fixit(site.range, *judgment.suggestion);
  }
}

size_t check_module(
  const SchemaRegistry & registry, AstContext & ast, FileId file_id, const Module & module,
  DiagnosticBag & diags)
{
  ReferenceChecker checker(diags);
  BindingResolver resolver(registry, ast, file_id, checker);
  resolver.run(module);
  return checker.sites_checked();
}

}  // namespace schemaflow
