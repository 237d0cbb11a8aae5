// schemaflow/report/schema_exporter.cpp - Resolved schemas as runtime-checkable JSON
#include "schemaflow/report/schema_exporter.hpp"

#include <string>
#include <variant>

namespace schemaflow
{

using json = nlohmann::json;

namespace
{

json export_column(const ColumnDefinition & col)
{
  json out;
  out["name"] = col.name;
  if (col.lookup_key != col.name) {
    out["alias"] = col.lookup_key;
  } else {
    out["alias"] = nullptr;
  }
  out["type"] = col.value_type.display_name();
  out["nullable"] = col.nullable;

  if (const auto * regex = std::get_if<RegexMember>(&col.membership)) {
    out["regex"] = true;
    out["patterns"] = regex->patterns;
  } else if (const auto * list = std::get_if<MembersList>(&col.membership)) {
    out["regex"] = false;
    out["members"] = list->names;
  } else if (std::holds_alternative<DeferredMembers>(col.membership)) {
    // Any column name is accepted at runtime.
    out["regex"] = true;
    out["patterns"] = json::array({".*"});
  }
  return out;
}

}  // namespace

json export_schema(const SchemaDefinition & schema)
{
  json out;
  out["name"] = schema.name;
  out["strict"] = !schema.allow_extra_columns;
  out["resolved"] = schema.resolved;
  out["origin"] = std::string(to_string(schema.origin));

  out["columns"] = json::array();
  for (const auto & col : schema.columns) {
    out["columns"].push_back(export_column(col));
  }

  out["groups"] = json::array();
  for (const auto & group : schema.groups) {
    out["groups"].push_back(json{{"name", group.name}, {"members", group.members}});
  }
  return out;
}

json export_schemas(const SchemaRegistry & registry)
{
  json out = json::array();
  for (const SchemaDefinition * schema : registry.schemas()) {
    out.push_back(export_schema(*schema));
  }
  return out;
}

}  // namespace schemaflow
