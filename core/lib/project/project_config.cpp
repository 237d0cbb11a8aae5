// schemaflow/project/project_config.cpp - Project configuration implementation
//
#include "schemaflow/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace schemaflow
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty file means defaults
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  if (root["enabled"]) {
    config.enabled = root["enabled"].as<bool>();
  }

  if (root["strict"]) {
    config.strict = root["strict"].as<bool>();
  }

  if (root["output_format"]) {
    const auto format = root["output_format"].as<std::string>();
    if (format == "human") {
      config.output_format = OutputFormat::Human;
    } else if (format == "json") {
      config.output_format = OutputFormat::Json;
    } else {
      return ConfigLoadResult::fail(
        "invalid output_format: '" + format + "' (must be 'human' or 'json')");
    }
  }

  if (root["jobs"]) {
    const int jobs = root["jobs"].as<int>();
    if (jobs < 0) {
      return ConfigLoadResult::fail("jobs must not be negative");
    }
    config.jobs = static_cast<size_t>(jobs);
  }

  if (root["exclude"]) {
    if (!root["exclude"].IsSequence()) {
      return ConfigLoadResult::fail("exclude must be a list");
    }
    for (const auto & entry : root["exclude"]) {
      config.exclude.push_back(entry.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace schemaflow
