// schemaflow/driver/file_collector.hpp - Python source discovery
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace schemaflow
{

struct CollectedFiles
{
  /// `*.py` files, sorted and without duplicates
  std::vector<std::filesystem::path> files;

  /// Command-line paths that do not exist
  std::vector<std::filesystem::path> missing;
};

/**
 * Expand `paths` into Python source files.
 *
 * A file path is taken as is whatever its extension. A directory is walked
 * recursively for `*.py` files, skipping directories whose name is listed in
 * `exclude`.
 */
[[nodiscard]] CollectedFiles collect_source_files(
  const std::vector<std::filesystem::path> & paths, const std::vector<std::string> & exclude);

}  // namespace schemaflow
