// test_human_renderer.cpp - Human-readable output
//
#include <gtest/gtest.h>

#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "schemaflow/report/human_renderer.hpp"

using namespace schemaflow;

namespace
{

std::string first_line(const std::string & text) { return text.substr(0, text.find('\n')); }

/// Sets rang's process-wide control mode for one test.
class ScopedRangMode
{
public:
  explicit ScopedRangMode(rang::control mode) { rang::setControlMode(mode); }
  ~ScopedRangMode() { rang::setControlMode(rang::control::Auto); }

  ScopedRangMode(const ScopedRangMode &) = delete;
  ScopedRangMode & operator=(const ScopedRangMode &) = delete;
};

std::string render_one(bool use_color)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "df[\"x\"]\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 3, 6), "Column 'x' does not exist in S");

  std::ostringstream out;
  HumanRenderer(out, use_color).print(bag.all()[0], sources);
  return out.str();
}

}  // namespace

TEST(HumanRenderer, HeaderCarriesLocationSeverityAndSuggestion)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("src/app.py", "df = load()\ndf[\"nmae\"]\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 15, 21), "Column 'nmae' does not exist in Users")
    .with_code(codes::k_unknown_column)
    .with_fixit(SourceRange(f, 15, 21), "name");

  std::ostringstream out;
  HumanRenderer renderer(out, false);
  renderer.print(bag.all()[0], sources);

  const std::string text = out.str();
  EXPECT_EQ(
    first_line(text),
    "src/app.py:2:4 error: Column 'nmae' does not exist in Users (did you mean 'name'?)");
  EXPECT_NE(text.find("    2 | df[\"nmae\"]"), std::string::npos);
  EXPECT_NE(text.find("^^^^^^"), std::string::npos);
}

TEST(HumanRenderer, SecondaryLabelsAndHelp)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "class S:\n    pass\ndf[\"x\"] = 1\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 21, 24), "Column 'x' is not declared in S")
    .with_secondary_label(SourceRange(f, 6, 7), "S declared here")
    .with_help("declare 'x' in S");

  std::ostringstream out;
  HumanRenderer(out, false).print(bag.all()[0], sources);

  const std::string text = out.str();
  EXPECT_EQ(first_line(text), "m.py:3:4 error: Column 'x' is not declared in S");
  EXPECT_NE(text.find("- S declared here"), std::string::npos);
  EXPECT_NE(text.find("= help: declare 'x' in S"), std::string::npos);
}

TEST(HumanRenderer, DiagnosticWithoutLocation)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report_warning(SourceRange(), "No source files to check").with_code(codes::k_no_source_files);

  std::ostringstream out;
  HumanRenderer(out, false).print(bag.all()[0], sources);
  EXPECT_EQ(out.str(), "warning: No source files to check\n");
}

TEST(HumanRenderer, Location)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("dir/m.py", "a\nbc\n");
  EXPECT_EQ(HumanRenderer::location(SourceRange(f, 3, 4), sources), "dir/m.py:2:2");
  EXPECT_EQ(HumanRenderer::location(SourceRange(), sources), "");
}

TEST(HumanRenderer, Summary)
{
  EXPECT_EQ(HumanRenderer::summary({}, 1), "Checked 1 file, no issues");
  EXPECT_EQ(HumanRenderer::summary({}, 3), "Checked 3 files, no issues");

  DiagnosticBag bag;
  bag.report_error(SourceRange(), "e");
  bag.report_warning(SourceRange(), "w1");
  bag.report_warning(SourceRange(), "w2");
  EXPECT_EQ(HumanRenderer::summary(bag.all(), 3), "Found 1 error and 2 warnings in 3 files");
}

TEST(HumanRenderer, PrintAllEndsWithSummary)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "x\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 0, 1), "bad");

  std::ostringstream out;
  HumanRenderer(out, false).print_all(bag.all(), sources, 1);

  const std::string text = out.str();
  EXPECT_EQ(first_line(text), "m.py:1:1 error: bad");
  const std::string tail = "Found 1 error and 0 warnings in 1 file\n";
  ASSERT_GE(text.size(), tail.size());
  EXPECT_EQ(text.substr(text.size() - tail.size()), tail);
}

TEST(HumanRenderer, PlainRendererLeavesColorModeAlone)
{
  const ScopedRangMode forced(rang::control::Force);

  const std::string plain = render_one(false);
  const std::string colored = render_one(true);

  EXPECT_EQ(plain.find('\033'), std::string::npos);
  EXPECT_NE(colored.find("\033[31m"), std::string::npos);
  EXPECT_NE(colored.find("\033[36m"), std::string::npos);
}

TEST(HumanRenderer, ColorsFollowTerminalDetection)
{
  // A string stream is not a terminal, so no escape reaches it.
  const std::string colored = render_one(true);
  EXPECT_EQ(colored.find('\033'), std::string::npos);
  EXPECT_EQ(colored, render_one(false));
}
