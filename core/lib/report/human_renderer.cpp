// schemaflow/report/human_renderer.cpp - Human-readable diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "schemaflow/report/human_renderer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

#include "schemaflow/report/reporter.hpp"

namespace schemaflow
{

namespace
{

std::string plural(size_t n, std::string_view word)
{
  return fmt::format("{} {}{}", n, word, n == 1 ? "" : "s");
}

std::string expand_tabs(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";  // 4 spaces per tab
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

HumanRenderer::HumanRenderer(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
}

std::string HumanRenderer::location(SourceRange range, const SourceRegistry & sources)
{
  if (!range.file_id().is_valid()) {
    return std::string();
  }
  const std::string path = sources.get_path(range.file_id()).generic_string();
  const FullSourceRange fr = sources.get_full_range(range);
  if (!fr.is_valid()) {
    return path;
  }
  return fmt::format("{}:{}:{}", path, fr.start_line, fr.start_column);
}

void HumanRenderer::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag, sources);

  const FileId primary_file = diag.primary_range().file_id();
  for (const auto & label : diag.labels) {
    print_label_context(label, primary_file, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }
}

void HumanRenderer::print_all(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources, size_t files_checked)
{
  for (const auto & d : diags) {
    print(d, sources);
    fmt::print(os_, "\n");
  }

  if (use_color_) {
    os_ << rang::style::bold;
  }
  fmt::print(os_, "{}", summary(diags, files_checked));
  if (use_color_) {
    os_ << rang::style::reset;
  }
  fmt::print(os_, "\n");
}

std::string HumanRenderer::summary(const std::vector<Diagnostic> & diags, size_t files_checked)
{
  const size_t errors = count_severity(diags, Severity::Error);
  const size_t warnings = count_severity(diags, Severity::Warning);
  if (errors == 0 && warnings == 0) {
    return fmt::format("Checked {}, no issues", plural(files_checked, "file"));
  }
  return fmt::format(
    "Found {} and {} in {}", plural(errors, "error"), plural(warnings, "warning"),
    plural(files_checked, "file"));
}

// =============================================================================
// Private helpers
// =============================================================================

void HumanRenderer::print_header(const Diagnostic & diag, const SourceRegistry & sources)
{
  const std::string where = location(diag.primary_range(), sources);
  if (!where.empty()) {
    fmt::print(os_, "{} ", where);
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(diag.severity) << rang::fg::reset << rang::style::reset;
  } else {
    fmt::print(os_, "{}", to_string(diag.severity));
  }

  fmt::print(os_, ": {}", diag.message);
  if (auto suggestion = diag.suggestion()) {
    fmt::print(os_, " (did you mean '{}'?)", *suggestion);
  }
  fmt::print(os_, "\n");
}

void HumanRenderer::print_label_context(
  const Label & label, FileId primary_file, const SourceRegistry & sources)
{
  if (!label.range.is_valid()) {
    return;
  }

  const SourceFile * source = sources.get_file(label.range.file_id());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = sources.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  // Labels pointing into another file say which one.
  if (label.range.file_id() != primary_file) {
    fmt::print(os_, "   --> {}\n", location(label.range, sources));
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void HumanRenderer::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  fmt::print(os_, "      ");
  print_gutter_pipe();
  fmt::print(os_, " ");

  // Columns count code points; tabs widen to four cells.
  std::string marker_prefix;
  uint32_t col = 1;
  for (size_t i = 0; col < start_col && i < line.size(); ++i) {
    if ((static_cast<unsigned char>(line[i]) & 0xC0U) == 0x80U) {
      continue;
    }
    marker_prefix += line[i] == '\t' ? "    " : " ";
    ++col;
  }
  fmt::print(os_, "{}", marker_prefix);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void HumanRenderer::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void HumanRenderer::print_gutter_pipe()
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << '|' << rang::style::reset << rang::fg::reset;
  } else {
    os_ << '|';
  }
}

}  // namespace schemaflow
