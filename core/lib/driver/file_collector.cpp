// schemaflow/driver/file_collector.cpp - Python source discovery
//
#include "schemaflow/driver/file_collector.hpp"

#include <algorithm>

namespace schemaflow
{

namespace fs = std::filesystem;

namespace
{

bool is_excluded(const fs::path & dir, const std::vector<std::string> & exclude)
{
  const std::string name = dir.filename().string();
  return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

void walk_directory(
  const fs::path & root, const std::vector<std::string> & exclude, std::vector<fs::path> & out)
{
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    if (it->is_directory(ec)) {
      if (is_excluded(it->path(), exclude)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->is_regular_file(ec) && it->path().extension() == ".py") {
      out.push_back(it->path().lexically_normal());
    }
  }
}

}  // namespace

CollectedFiles collect_source_files(
  const std::vector<fs::path> & paths, const std::vector<std::string> & exclude)
{
  CollectedFiles result;

  for (const auto & path : paths) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
      walk_directory(path, exclude, result.files);
    } else if (fs::exists(path, ec)) {
      result.files.push_back(path.lexically_normal());
    } else {
      result.missing.push_back(path);
    }
  }

  std::sort(result.files.begin(), result.files.end(), [](const auto & a, const auto & b) {
    return a.generic_string() < b.generic_string();
  });
  result.files.erase(std::unique(result.files.begin(), result.files.end()), result.files.end());
  return result;
}

}  // namespace schemaflow
