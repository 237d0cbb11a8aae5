// test_json_renderer.cpp - Machine-readable output
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "schemaflow/report/json_renderer.hpp"

using namespace schemaflow;
using json = nlohmann::json;

TEST(JsonRenderer, LocatedDiagnostic)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("pkg/m.py", "df = x\ndf[\"emai\"]\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 10, 16), "Column 'emai' does not exist in Users")
    .with_code(codes::k_unknown_column)
    .with_fixit(SourceRange(f, 10, 16), "email");

  const json out = diagnostic_to_json(bag.all()[0], sources);
  EXPECT_EQ(out["file"], "pkg/m.py");
  EXPECT_EQ(out["line"], 2);
  EXPECT_EQ(out["column"], 4);
  EXPECT_EQ(out["severity"], "error");
  EXPECT_EQ(out["code"], "UnknownColumn");
  EXPECT_EQ(out["message"], "Column 'emai' does not exist in Users");
  EXPECT_EQ(out["suggestion"], "email");
}

TEST(JsonRenderer, AbsentFieldsAreNull)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report_warning(SourceRange(), "No source files to check").with_code(codes::k_no_source_files);

  const json out = diagnostic_to_json(bag.all()[0], sources);
  EXPECT_TRUE(out["file"].is_null());
  EXPECT_TRUE(out["line"].is_null());
  EXPECT_TRUE(out["column"].is_null());
  EXPECT_TRUE(out["suggestion"].is_null());
  EXPECT_EQ(out["severity"], "warning");
}

TEST(JsonRenderer, RendersAnArray)
{
  SourceRegistry sources;
  EXPECT_EQ(render_json({}, sources), "[]");

  DiagnosticBag bag;
  bag.report_error(SourceRange(), "a");
  bag.report_error(SourceRange(), "b");
  const json parsed = json::parse(render_json(bag.all(), sources, -1));
  ASSERT_TRUE(parsed.is_array());
  ASSERT_EQ(parsed.size(), 2U);
  EXPECT_EQ(parsed[1]["message"], "b");
}
