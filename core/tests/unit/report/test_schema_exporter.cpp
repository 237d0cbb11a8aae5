// test_schema_exporter.cpp - Schema export for runtime validation
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "schemaflow/report/schema_exporter.hpp"
#include "schemaflow/test_support/parse_helpers.hpp"

using namespace schemaflow;
using json = nlohmann::json;

TEST(SchemaExporter, ExportsColumnsAndFamilies)
{
  const auto project = test_support::build_project(
    "class Users(BaseSchema):\n"
    "    allow_extra_columns = False\n"
    "    user_id = Column(type=int)\n"
    "    email = Column(type=str, alias=\"email_address\", nullable=True)\n"
    "    sensors = ColumnSet(regex=\"sensor_\\\\d+\", type=float)\n"
    "    tags = ColumnSet(members=[\"red\", \"blue\"])\n"
    "    contact = ColumnGroup(members=[email])\n");
  ASSERT_TRUE(project->diags.empty());

  const json out = export_schema(*project->schema("Users"));
  EXPECT_EQ(out["name"], "Users");
  EXPECT_EQ(out["strict"], true);
  EXPECT_EQ(out["resolved"], true);
  EXPECT_EQ(out["origin"], "descriptor_class");

  const json & columns = out["columns"];
  ASSERT_EQ(columns.size(), 4U);
  EXPECT_EQ(columns[0]["name"], "user_id");
  EXPECT_TRUE(columns[0]["alias"].is_null());
  EXPECT_EQ(columns[0]["type"], "int");
  EXPECT_EQ(columns[0]["nullable"], false);
  EXPECT_FALSE(columns[0].contains("regex"));

  EXPECT_EQ(columns[1]["alias"], "email_address");
  EXPECT_EQ(columns[1]["nullable"], true);

  EXPECT_EQ(columns[2]["regex"], true);
  EXPECT_EQ(columns[2]["patterns"], json::array({"sensor_\\d+"}));
  EXPECT_EQ(columns[2]["type"], "float");

  EXPECT_EQ(columns[3]["regex"], false);
  EXPECT_EQ(columns[3]["members"], json::array({"red", "blue"}));

  ASSERT_EQ(out["groups"].size(), 1U);
  EXPECT_EQ(out["groups"][0]["name"], "contact");
}

TEST(SchemaExporter, ExportsEveryRegisteredSchemaByName)
{
  const auto project = test_support::build_project(
    "class B(BaseSchema):\n"
    "    x = Column(type=int)\n"
    "class A(BaseSchema):\n"
    "    y = Column(type=str)\n"
    "C = A + B\n");

  const json out = export_schemas(project->registry);
  ASSERT_EQ(out.size(), 3U);
  EXPECT_EQ(out[0]["name"], "A");
  EXPECT_EQ(out[1]["name"], "B");
  EXPECT_EQ(out[2]["name"], "C");
  EXPECT_EQ(out[2]["origin"], "add_expression");
  EXPECT_EQ(out[2]["strict"], false);
  EXPECT_EQ(out[2]["columns"].size(), 2U);
}
