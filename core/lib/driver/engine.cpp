// schemaflow/driver/engine.cpp - Two-phase analysis driver implementation
//
#include "schemaflow/driver/engine.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include "schemaflow/driver/worker_pool.hpp"
#include "schemaflow/sema/check/reference_checker.hpp"
#include "schemaflow/sema/schema/schema_collector.hpp"
#include "schemaflow/syntax/frontend.hpp"

namespace schemaflow
{

namespace
{

using Clock = std::chrono::steady_clock;

/// Per-file state owned by exactly one worker at a time.
struct FileWork
{
  FileId file_id;
  std::unique_ptr<AstContext> ast;
  Module * module = nullptr;
  DiagnosticBag parse_diags;
  CollectedSchemas schemas;
  DiagnosticBag check_diags;
  size_t sites = 0;
};

long long elapsed_ms(Clock::time_point since)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

/// Run `task` for one file, tagging an untagged InternalFault with the file path.
template <typename Task>
void with_file_context(const SourceRegistry & sources, FileId id, Task && task)
{
  try {
    task();
  } catch (const InternalFault & fault) {
    if (!fault.file().empty()) {
      throw;
    }
    throw InternalFault(fault.what(), sources.get_path(id).generic_string());
  }
}

void fail_run(CheckResult & result, std::string message)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = std::string(codes::k_internal_fault);
  diag.message = "internal error: " + message;

  result.outcome = RunOutcome::InternalFailure;
  result.registry.reset();
  result.sites_checked = 0;
  result.diagnostics.clear();
  result.diagnostics.push_back(std::move(diag));
  result.internal_error = std::move(message);
}

}  // namespace

size_t CheckResult::error_count() const noexcept
{
  return count_severity(diagnostics, Severity::Error);
}

size_t CheckResult::warning_count() const noexcept
{
  return count_severity(diagnostics, Severity::Warning);
}

std::ostream & Engine::log() const { return options_.log != nullptr ? *options_.log : std::cerr; }

void Engine::file_done(AnalysisPhase phase, const SourceRegistry & sources, FileId id) const
{
  if (options_.on_file_done) {
    options_.on_file_done(phase, sources.get_path(id));
  }
}

// ============================================================================
// Entry Points
// ============================================================================

CheckResult Engine::check_files(const std::vector<std::filesystem::path> & paths) const
{
  CheckResult result;
  DiagnosticBag early;

  std::vector<std::filesystem::path> sorted;
  sorted.reserve(paths.size());
  for (const auto & p : paths) {
    sorted.push_back(p.lexically_normal());
  }
  std::sort(sorted.begin(), sorted.end(), [](const auto & a, const auto & b) {
    return a.generic_string() < b.generic_string();
  });
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

  // Phase 0: read sequentially; the registry is read-only afterwards.
  std::vector<FileId> files;
  for (const auto & path : sorted) {
    auto text = read_file(path);
    if (!text) {
      const FileId id = result.sources.register_file(path, std::string());
      early.report_error(SourceRange(id, 0, 0), "Cannot read file '" + path.generic_string() + "'")
        .with_code(codes::k_file_read_error);
      continue;
    }
    files.push_back(result.sources.register_file(path, std::move(*text)));
  }

  try {
    run(result, files, early);
  } catch (const InternalFault & fault) {
    fail_run(
      result, fault.file().empty() ? std::string(fault.what())
                                   : fault.file() + ": " + fault.what());
  } catch (const std::exception & e) {
    fail_run(result, e.what());
  }
  return result;
}

CheckResult Engine::check_sources(std::vector<SourceInput> inputs) const
{
  CheckResult result;
  DiagnosticBag early;

  std::stable_sort(inputs.begin(), inputs.end(), [](const auto & a, const auto & b) {
    return a.path.generic_string() < b.path.generic_string();
  });

  std::vector<FileId> files;
  for (auto & input : inputs) {
    if (result.sources.find_by_path(input.path)) {
      continue;
    }
    files.push_back(result.sources.register_file(input.path, std::move(input.text)));
  }

  try {
    run(result, files, early);
  } catch (const InternalFault & fault) {
    fail_run(
      result, fault.file().empty() ? std::string(fault.what())
                                   : fault.file() + ": " + fault.what());
  } catch (const std::exception & e) {
    fail_run(result, e.what());
  }
  return result;
}

// ============================================================================
// Pipeline
// ============================================================================

void Engine::run(CheckResult & result, const std::vector<FileId> & files, DiagnosticBag & early)
  const
{
  const auto run_start = Clock::now();
  const size_t jobs = effective_jobs(options_.jobs, files.size());
  result.files_checked = files.size();

  if (files.empty()) {
    early.report_warning(SourceRange{}, "No source files to check")
      .with_code(codes::k_no_source_files);
  }

  if (options_.verbose) {
    fmt::print(log(), "Checking {} file(s) with {} worker(s)\n", files.size(), jobs);
  }

  std::vector<FileWork> work(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    work[i].file_id = files[i];
    work[i].ast = std::make_unique<AstContext>();
  }

  // Phase 1: parse and collect schema candidates.
  auto phase_start = Clock::now();
  const SourceRegistry & sources = result.sources;
  parallel_for(work.size(), jobs, [&](size_t i) {
    FileWork & w = work[i];
    with_file_context(sources, w.file_id, [&]() {
      const ParseOutput parsed = parse_source(sources, w.file_id, *w.ast, w.parse_diags);
      w.module = parsed.module;
      w.schemas.file_id = w.file_id;
      if (parsed.ok()) {
        w.schemas = SchemaCollector(*w.ast, w.file_id).collect(*w.module);
      }
      file_done(AnalysisPhase::Parse, sources, w.file_id);
    });
  });

  if (options_.verbose) {
    const auto parsed = static_cast<size_t>(
      std::count_if(work.begin(), work.end(), [](const FileWork & w) { return w.module != nullptr; }));
    fmt::print(
      log(), "Phase 1: parsed {}/{} file(s) in {} ms\n", parsed, work.size(),
      elapsed_ms(phase_start));
  }

  // Barrier: one registry from every file's candidates, in path order.
  phase_start = Clock::now();
  DiagnosticBag registry_diags;
  std::vector<CollectedSchemas> collected;
  collected.reserve(work.size());
  for (auto & w : work) {
    collected.push_back(std::move(w.schemas));
  }
  result.registry =
    std::make_unique<SchemaRegistry>(SchemaRegistry::build(std::move(collected), registry_diags));

  if (options_.verbose) {
    fmt::print(
      log(), "Registry: {} schema(s) resolved in {} ms\n", result.registry->size(),
      elapsed_ms(phase_start));
  }

  // Phase 2: bind and check; each file writes only into its own bag.
  phase_start = Clock::now();
  const SchemaRegistry & registry = *result.registry;
  parallel_for(work.size(), jobs, [&](size_t i) {
    FileWork & w = work[i];
    if (w.module == nullptr) {
      return;
    }
    with_file_context(sources, w.file_id, [&]() {
      w.sites = check_module(registry, *w.ast, w.file_id, *w.module, w.check_diags);
      file_done(AnalysisPhase::Check, sources, w.file_id);
    });
  });

  DiagnosticReporter reporter(result.sources);
  reporter.add(early);
  reporter.add(registry_diags);
  for (const auto & w : work) {
    reporter.add(w.parse_diags);
    reporter.add(w.check_diags);
    result.sites_checked += w.sites;
  }

  if (options_.verbose) {
    fmt::print(
      log(), "Phase 2: checked {} access site(s) in {} ms\n", result.sites_checked,
      elapsed_ms(phase_start));
  }

  result.diagnostics = reporter.ordered();
  result.outcome = compute_outcome(result.diagnostics, options_.strict);

  if (options_.verbose) {
    fmt::print(
      log(), "Done: {} error(s), {} warning(s) in {} ms\n", result.error_count(),
      result.warning_count(), elapsed_ms(run_start));
  }
}

}  // namespace schemaflow
