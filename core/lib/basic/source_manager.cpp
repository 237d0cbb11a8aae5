// schemaflow/basic/source_manager.cpp - Source file and registry implementation
#include "schemaflow/basic/source_manager.hpp"

#include <algorithm>

namespace schemaflow
{

namespace
{

bool is_continuation_byte(char c) { return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U; }

/// Number of code points in `text` (malformed bytes count one each).
uint32_t count_code_points(std::string_view text)
{
  return static_cast<uint32_t>(
    std::count_if(text.begin(), text.end(), [](char c) { return !is_continuation_byte(c); }));
}

/// Registry key: the same file reached through different spellings maps to one id.
std::string registry_key(const fs::path & path)
{
  std::error_code ec;
  fs::path key = fs::weakly_canonical(path, ec);
  if (ec) {
    key = path.lexically_normal();
  }
  return key.generic_string();
}

}  // namespace

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  const size_t n = content_.size();
  for (size_t i = 0; i < n; ++i) {
    const char c = content_[i];
    if (c == '\r' && i + 1 < n && content_[i + 1] == '\n') {
      continue;  // the '\n' ends this line
    }
    if (c == '\n' || c == '\r') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

size_t SourceFile::line_index_of(uint32_t offset) const noexcept
{
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  return static_cast<size_t>(next - line_starts_.begin()) - 1;
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  const size_t index = line_index_of(offset);
  const uint32_t start = line_starts_[index];
  const std::string_view before = std::string_view(content_).substr(start, offset - start);
  return {static_cast<uint32_t>(index) + 1, count_code_points(before) + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  const uint32_t start = line_starts_[line_index];
  const uint32_t stop = line_index + 1 < line_starts_.size()
                          ? line_starts_[line_index + 1]
                          : static_cast<uint32_t>(content_.size());

  std::string_view line = std::string_view(content_).substr(start, stop - start);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.get_begin().offset() >= content_.size()) {
    return {};
  }
  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  return std::string_view(content_).substr(begin, end - begin);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const LineColumn begin = get_line_column(range.get_begin().offset());
  const LineColumn end = get_line_column(range.get_end().offset());

  FullSourceRange out;
  out.start_line = begin.line;
  out.start_column = begin.column;
  out.end_line = end.line;
  out.end_column = end.column;
  out.start_byte = range.get_begin().offset();
  out.end_byte = range.get_end().offset();
  return out;
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId next{static_cast<uint32_t>(files_.size())};
  const auto [it, inserted] = ids_by_key_.try_emplace(registry_key(path), next);
  if (inserted) {
    files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  }
  return it->second;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_no_path;
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : k_no_path;
}

std::optional<FileId> SourceRegistry::find_by_path(const fs::path & path) const
{
  const auto it = ids_by_key_.find(registry_key(path));
  if (it == ids_by_key_.end()) {
    return std::nullopt;
  }
  return it->second;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const SourceFile * file = get_file(loc.file_id());
  return (file != nullptr && loc.is_valid()) ? file->get_line_column(loc.offset()) : LineColumn{};
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

}  // namespace schemaflow
