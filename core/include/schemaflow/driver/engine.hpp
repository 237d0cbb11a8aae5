// schemaflow/driver/engine.hpp - Two-phase analysis driver
//
// Single entry point for a check run. Used by the CLI and usable from any
// other front end (editor integration, tests).
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/report/reporter.hpp"
#include "schemaflow/sema/schema/schema_registry.hpp"

namespace schemaflow
{

// ============================================================================
// Check Options
// ============================================================================

/// Per-file phase reported to CheckOptions::on_file_done.
enum class AnalysisPhase : uint8_t {
  Parse,  ///< Parsed and schema candidates collected
  Check,  ///< Bindings resolved and accesses judged
};

struct CheckOptions
{
  /// Warnings fail the run too
  bool strict = false;

  /// Rendering requested by the caller (the engine itself does not render)
  OutputFormat output_format = OutputFormat::Human;

  /// Worker threads per phase; 0 = one per hardware thread
  size_t jobs = 0;

  /// Print phase progress and timings to `log`
  bool verbose = false;

  /// Verbose output stream (std::cerr when null)
  std::ostream * log = nullptr;

  /**
   * Progress hook, called on a worker thread each time a file finishes a
   * phase. Must be thread-safe. An InternalFault it throws fails the run
   * like any other fault raised while that file was processed.
   */
  std::function<void(AnalysisPhase, const std::filesystem::path &)> on_file_done;
};

/// A source file supplied in memory.
struct SourceInput
{
  std::filesystem::path path;
  std::string text;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  RunOutcome outcome = RunOutcome::Clean;

  /// Every diagnostic of the run, in report order
  std::vector<Diagnostic> diagnostics;

  /// Files that were read (including ones that failed to parse)
  size_t files_checked = 0;

  /// Access sites judged against a schema
  size_t sites_checked = 0;

  /// Source text of the run, for rendering
  SourceRegistry sources;

  /// Frozen registry (null after an internal failure)
  std::unique_ptr<SchemaRegistry> registry;

  /// Set when outcome is InternalFailure
  std::optional<std::string> internal_error;

  [[nodiscard]] size_t error_count() const noexcept;
  [[nodiscard]] size_t warning_count() const noexcept;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * Runs the analysis:
 * 0. read every file into the SourceRegistry (sequential)
 * 1. parse and collect schema candidates (parallel per file)
 *    -- barrier: build, resolve and freeze the SchemaRegistry --
 * 2. resolve bindings and check accesses (parallel per file)
 * then merges the per-file diagnostics in report order.
 *
 * Files are processed in path order regardless of the order given, so a
 * run is reproducible byte for byte.
 */
class Engine
{
public:
  explicit Engine(CheckOptions options) : options_(options) {}

  /// Check files on disk.
  [[nodiscard]] CheckResult check_files(const std::vector<std::filesystem::path> & paths) const;

  /// Check in-memory sources.
  [[nodiscard]] CheckResult check_sources(std::vector<SourceInput> inputs) const;

  [[nodiscard]] const CheckOptions & options() const noexcept { return options_; }

private:
  void run(CheckResult & result, const std::vector<FileId> & files, DiagnosticBag & early) const;

  [[nodiscard]] std::ostream & log() const;
  void file_done(AnalysisPhase phase, const SourceRegistry & sources, FileId id) const;

  CheckOptions options_;
};

}  // namespace schemaflow
