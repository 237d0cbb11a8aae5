// test_file_collector.cpp - Python source discovery
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "schemaflow/driver/file_collector.hpp"

using namespace schemaflow;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void touch(const fs::path & p)
{
  fs::create_directories(p.parent_path());
  std::ofstream f(p);
  f << "x = 1\n";
}

}  // namespace

TEST(FileCollector, WalksDirectoriesForPythonFiles)
{
  const TempDir dir(fs::temp_directory_path() / "schemaflow_collect_walk");
  touch(dir.path / "b.py");
  touch(dir.path / "a.py");
  touch(dir.path / "pkg" / "c.py");
  touch(dir.path / "notes.txt");
  touch(dir.path / ".venv" / "lib" / "site.py");

  const auto collected = collect_source_files({dir.path}, {".venv"});
  EXPECT_TRUE(collected.missing.empty());
  ASSERT_EQ(collected.files.size(), 3U);
  EXPECT_EQ(collected.files[0].filename().string(), "a.py");
  EXPECT_EQ(collected.files[1].filename().string(), "b.py");
  EXPECT_EQ(collected.files[2].filename().string(), "c.py");
}

TEST(FileCollector, ExplicitFilesAreKeptAndDeduplicated)
{
  const TempDir dir(fs::temp_directory_path() / "schemaflow_collect_explicit");
  touch(dir.path / "script");
  touch(dir.path / "m.py");

  const auto collected =
    collect_source_files({dir.path / "script", dir.path / "m.py", dir.path / "." / "m.py"}, {});
  ASSERT_EQ(collected.files.size(), 2U);
  EXPECT_EQ(collected.files[0].filename().string(), "m.py");
  EXPECT_EQ(collected.files[1].filename().string(), "script");
}

TEST(FileCollector, ReportsMissingPaths)
{
  const auto collected = collect_source_files({"/nonexistent/schemaflow/path.py"}, {});
  EXPECT_TRUE(collected.files.empty());
  ASSERT_EQ(collected.missing.size(), 1U);
  EXPECT_EQ(collected.missing[0].string(), "/nonexistent/schemaflow/path.py");
}
