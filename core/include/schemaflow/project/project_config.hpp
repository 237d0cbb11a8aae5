// schemaflow/project/project_config.hpp - Project configuration (schemaflow.yaml)
//
// Parses and validates schemaflow.yaml project configuration files.
// Command-line flags override the values loaded here.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schemaflow/report/reporter.hpp"

namespace schemaflow
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (schemaflow.yaml).
 *
 *   enabled: true
 *   strict: false
 *   output_format: human   # or json
 *   jobs: 0                # 0 = one worker per hardware thread
 *   exclude: [.venv, build]
 */
struct ProjectConfig
{
  /// A disabled project checks nothing and reports clean
  bool enabled = true;

  bool strict = false;
  OutputFormat output_format = OutputFormat::Human;
  size_t jobs = 0;

  /// Directory names skipped while collecting source files
  std::vector<std::string> exclude;

  /// Directory containing schemaflow.yaml (empty for the defaults)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a schemaflow.yaml file.
 *
 * @param config_path Path to schemaflow.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Parse configuration text; `project_root` is stored as given.
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory
 * (or from the parent of a file) until the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "schemaflow.yaml";

}  // namespace schemaflow
