// test_project_config.cpp - schemaflow.yaml parsing and discovery
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "schemaflow/project/project_config.hpp"

using namespace schemaflow;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, EmptyTextMeansDefaults)
{
  const auto result = parse_project_config("", "/proj");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.enabled);
  EXPECT_FALSE(result.config.strict);
  EXPECT_EQ(result.config.output_format, OutputFormat::Human);
  EXPECT_EQ(result.config.jobs, 0U);
  EXPECT_TRUE(result.config.exclude.empty());
  EXPECT_EQ(result.config.project_root.string(), "/proj");
}

TEST(ProjectConfig, ParsesEveryKey)
{
  const auto result = parse_project_config(
    "enabled: true\n"
    "strict: true\n"
    "output_format: json\n"
    "jobs: 4\n"
    "exclude:\n"
    "  - .venv\n"
    "  - build\n",
    "/proj");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.strict);
  EXPECT_EQ(result.config.output_format, OutputFormat::Json);
  EXPECT_EQ(result.config.jobs, 4U);
  EXPECT_EQ(result.config.exclude, (std::vector<std::string>{".venv", "build"}));
}

TEST(ProjectConfig, DisabledProject)
{
  const auto result = parse_project_config("enabled: false\n", "");
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.config.enabled);
}

TEST(ProjectConfig, RejectsInvalidValues)
{
  auto result = parse_project_config("output_format: xml\n", "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid output_format: 'xml' (must be 'human' or 'json')");

  result = parse_project_config("jobs: -1\n", "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "jobs must not be negative");

  result = parse_project_config("exclude: build\n", "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "exclude must be a list");

  result = parse_project_config("- a\n- b\n", "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration must be a map");
}

TEST(ProjectConfig, MalformedYamlIsAnError)
{
  const auto result = parse_project_config("strict: [unclosed\n", "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0U);

  const auto wrong_type = parse_project_config("strict: maybe\n", "");
  EXPECT_FALSE(wrong_type.success);
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, LoadsFromFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "schemaflow_config_load");
  const auto path = dir.path / k_project_config_file_name;
  {
    std::ofstream f(path);
    f << "strict: true\n";
  }

  const auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.strict);
  EXPECT_EQ(
    std::filesystem::weakly_canonical(result.config.project_root).string(),
    std::filesystem::weakly_canonical(dir.path).string());
}

TEST(ProjectConfig, MissingFile)
{
  const auto result = load_project_config("/nonexistent/schemaflow.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0U);
}

TEST(ProjectConfig, FindsConfigInAncestor)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "schemaflow_config_find");
  const auto nested = dir.path / "src" / "pkg";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(dir.path / k_project_config_file_name);
    f << "jobs: 2\n";
  }
  {
    std::ofstream f(nested / "module.py");
    f << "x = 1\n";
  }

  const auto from_dir = find_project_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(from_dir->filename().string(), k_project_config_file_name);
  EXPECT_EQ(
    std::filesystem::weakly_canonical(from_dir->parent_path()).string(),
    std::filesystem::weakly_canonical(dir.path).string());

  const auto from_file = find_project_config(nested / "module.py");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(from_file->string(), from_dir->string());
}
