// schemaflow/report/human_renderer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers for terminals and CI logs.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

/**
 * Renders diagnostics as human-readable blocks.
 *
 * Produces output like:
 *   app/users.py:12:4 error: Column 'emai' does not exist in UserSchema (did you mean 'email'?)
 *     12 | df["emai"]
 *        |    ^^^^^^
 *      3 | class UserSchema(Schema):
 *        |       ---------- UserSchema declared here
 *
 * followed, after the last block, by one summary line.
 */
class HumanRenderer
{
public:
  /**
   * Create a renderer.
   *
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to use terminal colors. Colors go through rang,
   *        so its global control mode still decides whether escapes are written.
   */
  explicit HumanRenderer(std::ostream & os, bool use_color = true);

  /// Print one diagnostic block.
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic in the given order, then the summary line.
  void print_all(
    const std::vector<Diagnostic> & diags, const SourceRegistry & sources, size_t files_checked);

  /// "Found 1 error and 2 warnings in 3 files" / "Checked 3 files, no issues"
  [[nodiscard]] static std::string summary(
    const std::vector<Diagnostic> & diags, size_t files_checked);

  /// "<path>:<line>:<col>" of a range, or the bare path when it has no position.
  [[nodiscard]] static std::string location(SourceRange range, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag, const SourceRegistry & sources);

  void print_label_context(
    const Label & label, FileId primary_file, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);

  void print_gutter_pipe();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace schemaflow
