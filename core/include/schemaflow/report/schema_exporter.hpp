// schemaflow/report/schema_exporter.hpp - Resolved schemas as runtime-checkable JSON
//
// One-way export of registry contents for runtime validators and editor
// plugins. Nothing here feeds back into analysis.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "schemaflow/sema/schema/schema.hpp"
#include "schemaflow/sema/schema/schema_registry.hpp"

namespace schemaflow
{

/**
 * Export one schema:
 *   {
 *     "name": "UserSchema",
 *     "strict": true,                 // !allow_extra_columns
 *     "resolved": true,
 *     "origin": "descriptor_class",
 *     "columns": [
 *       {"name": "email", "alias": "email_address", "type": "str", "nullable": false},
 *       {"name": "sensors", "type": "float", "nullable": false,
 *        "regex": true, "patterns": ["sensor_\\d+"]}
 *     ],
 *     "groups": [{"name": "contact", "members": ["email"]}]
 *   }
 *
 * `alias` is null when the physical name equals the attribute name.
 */
[[nodiscard]] nlohmann::json export_schema(const SchemaDefinition & schema);

/// Every schema in the registry, ordered by name.
[[nodiscard]] nlohmann::json export_schemas(const SchemaRegistry & registry);

}  // namespace schemaflow
