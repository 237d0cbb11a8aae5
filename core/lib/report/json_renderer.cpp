// schemaflow/report/json_renderer.cpp - Machine-readable diagnostic output
#include "schemaflow/report/json_renderer.hpp"

namespace schemaflow
{

using json = nlohmann::json;

json diagnostic_to_json(const Diagnostic & diag, const SourceRegistry & sources)
{
  json out;

  const SourceRange range = diag.primary_range();
  const FullSourceRange fr = sources.get_full_range(range);
  if (range.file_id().is_valid()) {
    out["file"] = sources.get_path(range.file_id()).generic_string();
  } else {
    out["file"] = nullptr;
  }
  if (fr.is_valid()) {
    out["line"] = fr.start_line;
    out["column"] = fr.start_column;
  } else {
    out["line"] = nullptr;
    out["column"] = nullptr;
  }

  out["severity"] = std::string(to_string(diag.severity));
  out["code"] = diag.code;
  out["message"] = diag.message;

  if (auto suggestion = diag.suggestion()) {
    out["suggestion"] = *suggestion;
  } else {
    out["suggestion"] = nullptr;
  }
  return out;
}

json diagnostics_to_json(const std::vector<Diagnostic> & diags, const SourceRegistry & sources)
{
  json out = json::array();
  for (const auto & d : diags) {
    out.push_back(diagnostic_to_json(d, sources));
  }
  return out;
}

std::string render_json(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources, int indent)
{
  return diagnostics_to_json(diags, sources).dump(indent);
}

}  // namespace schemaflow
