// schemaflow - DataFrame schema checker command line interface
//
// Usage:
//   schemaflow check [path...] [--strict] [--json] [-j N] [--no-color] [-v]
//   schemaflow schemas [path...] [--name Schema]
//
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "schemaflow/driver/engine.hpp"
#include "schemaflow/driver/file_collector.hpp"
#include "schemaflow/project/project_config.hpp"
#include "schemaflow/report/human_renderer.hpp"
#include "schemaflow/report/json_renderer.hpp"
#include "schemaflow/report/schema_exporter.hpp"

namespace fs = std::filesystem;

namespace
{

/// Exit status for a run that could not start (bad arguments, bad config).
constexpr int k_usage_error = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "schemaflow v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [path...] [options]\n\n"
            << "Commands:\n"
            << "  check [path...]          Check DataFrame column accesses (default: .)\n"
            << "  schemas [path...]        Print resolved schemas as JSON\n\n"
            << "Options:\n"
            << "  --strict                 Warnings fail the run\n"
            << "  --json                   Machine-readable diagnostics\n"
            << "  -j, --jobs <n>           Worker threads (0 = all cores)\n"
            << "  --no-color               Disable terminal colors\n"
            << "  --name <schema>          Only export this schema (schemas command)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Exit status: 0 clean, 1 findings, 2 internal error\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<fs::path> paths;
  std::optional<bool> strict;
  std::optional<schemaflow::OutputFormat> output_format;
  std::optional<size_t> jobs;
  std::string schema_name;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<size_t> parse_jobs(const std::string & text)
{
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::strtoul(text.c_str(), nullptr, 10));
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "--json") {
      args.output_format = schemaflow::OutputFormat::Json;
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        break;
      }
      args.jobs = parse_jobs(argv[++i]);
      if (!args.jobs) {
        args.error = "invalid job count: " + std::string(argv[i]);
        break;
      }
    } else if (arg == "--name") {
      if (i + 1 >= argc) {
        args.error = "missing value for --name";
        break;
      }
      args.schema_name = argv[++i];
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      break;
    } else {
      args.paths.emplace_back(arg);
    }
  }

  if (args.paths.empty()) {
    args.paths.emplace_back(".");
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Load schemaflow.yaml above the first path, if any. Returns false on a bad file.
bool load_config(const CommandArgs & args, schemaflow::ProjectConfig & config)
{
  auto config_path = schemaflow::find_project_config(args.paths.front());
  if (!config_path) {
    return true;
  }

  auto loaded = schemaflow::load_project_config(*config_path);
  if (!loaded.success) {
    std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
    return false;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  config = std::move(loaded.config);
  return true;
}

/// Collect sources and run the engine with CLI flags layered over `config`.
schemaflow::CheckResult run_engine(
  const CommandArgs & args, const schemaflow::ProjectConfig & config)
{
  schemaflow::CheckOptions options;
  options.strict = args.strict.value_or(config.strict);
  options.output_format = args.output_format.value_or(config.output_format);
  options.jobs = args.jobs.value_or(config.jobs);
  options.verbose = args.verbose;
  options.log = &std::cerr;

  auto collected = schemaflow::collect_source_files(args.paths, config.exclude);
  for (const auto & missing : collected.missing) {
    std::cerr << "warning: path not found: " << missing.string() << "\n";
  }

  return schemaflow::Engine(options).check_files(collected.files);
}

int cmd_check(const CommandArgs & args)
{
  schemaflow::ProjectConfig config;
  if (!load_config(args, config)) {
    return k_usage_error;
  }

  const auto format = args.output_format.value_or(config.output_format);

  if (!config.enabled) {
    if (args.verbose) {
      std::cerr << "Checking disabled by configuration\n";
    }
    if (format == schemaflow::OutputFormat::Json) {
      std::cout << "[]\n";
    }
    return schemaflow::exit_code(schemaflow::RunOutcome::Clean);
  }

  const auto result = run_engine(args, config);

  if (result.outcome == schemaflow::RunOutcome::InternalFailure) {
    std::cerr << "internal error: " << result.internal_error.value_or("unknown failure") << "\n";
    return schemaflow::exit_code(result.outcome);
  }

  if (format == schemaflow::OutputFormat::Json) {
    std::cout << schemaflow::render_json(result.diagnostics, result.sources) << "\n";
  } else {
    // Detect if terminal supports colors (simple check for TTY)
    const bool use_color = !args.no_color && isatty(fileno(stdout)) != 0;
    schemaflow::HumanRenderer renderer(std::cout, use_color);
    renderer.print_all(result.diagnostics, result.sources, result.files_checked);
  }

  return schemaflow::exit_code(result.outcome);
}

int cmd_schemas(const CommandArgs & args)
{
  schemaflow::ProjectConfig config;
  if (!load_config(args, config)) {
    return k_usage_error;
  }

  const auto result = run_engine(args, config);

  if (result.outcome == schemaflow::RunOutcome::InternalFailure || !result.registry) {
    std::cerr << "internal error: " << result.internal_error.value_or("unknown failure") << "\n";
    return schemaflow::exit_code(schemaflow::RunOutcome::InternalFailure);
  }

  if (args.schema_name.empty()) {
    std::cout << schemaflow::export_schemas(*result.registry).dump(2) << "\n";
    return 0;
  }

  const auto * schema = result.registry->find(args.schema_name);
  if (schema == nullptr) {
    std::cerr << "error: no schema named '" << args.schema_name << "'\n";
    return schemaflow::exit_code(schemaflow::RunOutcome::Findings);
  }
  std::cout << schemaflow::export_schema(*schema).dump(2) << "\n";
  return 0;
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(argv[0]);
    return k_usage_error;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "schemas") {
    return cmd_schemas(args);
  }

  std::cerr << "error: unknown command: " << args.command << "\n\n";
  print_usage(argv[0]);
  return k_usage_error;
}
