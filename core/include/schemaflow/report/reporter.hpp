// schemaflow/report/reporter.hpp - Diagnostic aggregation and run outcome
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

enum class OutputFormat : uint8_t {
  Human,
  Json,
};

enum class RunOutcome : uint8_t {
  Clean,            ///< Nothing that fails the run
  Findings,         ///< Errors (or warnings in strict mode) were reported
  InternalFailure,  ///< The engine itself failed
};

[[nodiscard]] constexpr std::string_view to_string(RunOutcome outcome) noexcept
{
  switch (outcome) {
    case RunOutcome::Clean:
      return "clean";
    case RunOutcome::Findings:
      return "findings";
    case RunOutcome::InternalFailure:
      return "internal_failure";
  }
  return "";
}

/// Process exit status: 0 clean, 1 findings, 2 internal failure.
[[nodiscard]] constexpr int exit_code(RunOutcome outcome) noexcept
{
  switch (outcome) {
    case RunOutcome::Clean:
      return 0;
    case RunOutcome::Findings:
      return 1;
    case RunOutcome::InternalFailure:
      return 2;
  }
  return 2;
}

/**
 * Diagnostic Reporter.
 *
 * Collects the bags produced by every phase and file and yields one
 * sequence ordered by (file path, byte offset, insertion order).
 * Diagnostics without a location sort before all others.
 */
class DiagnosticReporter
{
public:
  explicit DiagnosticReporter(const SourceRegistry & sources) : sources_(sources) {}

  void add(const DiagnosticBag & bag);
  void add(Diagnostic diag);

  /// Every collected diagnostic in report order.
  [[nodiscard]] std::vector<Diagnostic> ordered() const;

  /// Clean unless an error (or, when `strict`, a warning) was collected.
  [[nodiscard]] RunOutcome outcome(bool strict) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

private:
  const SourceRegistry & sources_;
  std::vector<Diagnostic> diagnostics_;
};

/// Outcome of an already ordered diagnostic sequence.
[[nodiscard]] RunOutcome compute_outcome(const std::vector<Diagnostic> & diags, bool strict) noexcept;

[[nodiscard]] size_t count_severity(const std::vector<Diagnostic> & diags, Severity severity) noexcept;

}  // namespace schemaflow
