// schemaflow/report/json_renderer.hpp - Machine-readable diagnostic output
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

/**
 * One object per diagnostic, in the order given:
 *   {"file", "line", "column", "severity", "code", "message", "suggestion"}
 *
 * `file`, `line` and `column` are null for a diagnostic without a location;
 * `suggestion` is null when there is no "did you mean".
 */
[[nodiscard]] nlohmann::json diagnostic_to_json(
  const Diagnostic & diag, const SourceRegistry & sources);

[[nodiscard]] nlohmann::json diagnostics_to_json(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources);

/// Serialized array, pretty-printed with `indent` spaces (-1 = compact).
[[nodiscard]] std::string render_json(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources, int indent = 2);

}  // namespace schemaflow
