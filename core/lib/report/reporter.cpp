// schemaflow/report/reporter.cpp - Diagnostic aggregation and run outcome
#include "schemaflow/report/reporter.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace schemaflow
{

void DiagnosticReporter::add(const DiagnosticBag & bag)
{
  diagnostics_.insert(diagnostics_.end(), bag.begin(), bag.end());
}

void DiagnosticReporter::add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

std::vector<Diagnostic> DiagnosticReporter::ordered() const
{
  struct Key
  {
    std::string path;
    uint32_t offset;
  };

  std::vector<Key> keys;
  keys.reserve(diagnostics_.size());
  for (const auto & d : diagnostics_) {
    const SourceRange range = d.primary_range();
    Key key{std::string(), 0};
    if (range.file_id().is_valid()) {
      key.path = sources_.get_path(range.file_id()).generic_string();
      key.offset = range.is_valid() ? range.get_begin().offset() : 0;
    }
    keys.push_back(std::move(key));
  }

  std::vector<size_t> order(diagnostics_.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (keys[a].path != keys[b].path) {
      return keys[a].path < keys[b].path;
    }
    return keys[a].offset < keys[b].offset;
  });

  std::vector<Diagnostic> out;
  out.reserve(order.size());
  for (const size_t i : order) {
    out.push_back(diagnostics_[i]);
  }
  return out;
}

RunOutcome DiagnosticReporter::outcome(bool strict) const noexcept
{
  return compute_outcome(diagnostics_, strict);
}

RunOutcome compute_outcome(const std::vector<Diagnostic> & diags, bool strict) noexcept
{
  for (const auto & d : diags) {
    if (d.severity == Severity::Error || (strict && d.severity == Severity::Warning)) {
      return RunOutcome::Findings;
    }
  }
  return RunOutcome::Clean;
}

size_t count_severity(const std::vector<Diagnostic> & diags, Severity severity) noexcept
{
  return static_cast<size_t>(std::count_if(
    diags.begin(), diags.end(), [severity](const Diagnostic & d) { return d.severity == severity; }));
}

}  // namespace schemaflow
