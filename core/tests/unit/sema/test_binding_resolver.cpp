// test_binding_resolver.cpp - Schema binding resolution
//
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "schemaflow/basic/casting.hpp"
#include "schemaflow/sema/binding/binding_resolver.hpp"
#include "schemaflow/test_support/parse_helpers.hpp"

using namespace schemaflow;

namespace
{

struct RecordedAccess
{
  std::string name;
  AccessKind kind;
  AccessMode mode;
  std::string schema;
  bool accepted;
};

class RecordingSink : public AccessSink
{
public:
  void on_access(const AccessSite & site, const SchemaBinding & binding) override
  {
    records.push_back(RecordedAccess{
      site.name, site.kind, site.mode, binding.schema->name,
      binding.schema->accepts_attribute(site.name)});
  }

  std::vector<RecordedAccess> records;
};

constexpr const char * k_schemas =
  "class Users(BaseSchema):\n"
  "    id = Column(type=int)\n"
  "    name = Column(type=str)\n"
  "class Orders(BaseSchema):\n"
  "    id = Column(type=int)\n"
  "    amount = Column(type=float)\n";

/// Resolve `body` (appended to the schema declarations) and return the resolver's records.
struct Resolved
{
  std::unique_ptr<test_support::TestProject> project;
  RecordingSink sink;
  std::unique_ptr<BindingResolver> resolver;
};

std::unique_ptr<Resolved> resolve(const std::string & body)
{
  auto out = std::make_unique<Resolved>();
  out->project = test_support::build_project(std::string(k_schemas) + body);
  if (out->project->modules[0] == nullptr) {
    ADD_FAILURE() << "source did not parse";
    return out;
  }
  out->resolver = std::make_unique<BindingResolver>(
    out->project->registry, *out->project->asts[0], out->project->file_ids[0], out->sink);
  out->resolver->run(*out->project->modules[0]);
  return out;
}

std::vector<std::string> names_of(const std::vector<RecordedAccess> & records)
{
  std::vector<std::string> out;
  for (const auto & r : records) {
    out.push_back(r.name);
  }
  return out;
}

}  // namespace

// =============================================================================
// Binding sources
// =============================================================================

TEST(BindingResolver, ParameterAnnotationIsCertain)
{
  const auto r = resolve(
    "def report(df: PandasFrame[Users], other: \"DataFrame[Orders]\"):\n"
    "    total = df[\"id\"]\n"
    "    return other[\"amount\"]\n");

  ASSERT_EQ(r->sink.records.size(), 2U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");
  EXPECT_EQ(r->sink.records[1].schema, "Orders");

  const BindingScope * scope = r->resolver->function_scope("report");
  ASSERT_NE(scope, nullptr);
  const SchemaBinding * df = scope->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_EQ(df->confidence, Confidence::Certain);
}

TEST(BindingResolver, FactoryCallsBindSchemas)
{
  const auto r = resolve(
    "a = PandasFrame.read_csv(\"users.csv\", Users)\n"
    "b = load(\"orders.csv\", schema=Orders)\n"
    "c = Users.from_pandas(raw)\n"
    "d = PolarsFrame.from_schema(raw, Orders)\n"
    "a[\"id\"]\n"
    "b[\"amount\"]\n"
    "c[\"name\"]\n"
    "d[\"id\"]\n");

  ASSERT_EQ(r->sink.records.size(), 4U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");
  EXPECT_EQ(r->sink.records[1].schema, "Orders");
  EXPECT_EQ(r->sink.records[2].schema, "Users");
  EXPECT_EQ(r->sink.records[3].schema, "Orders");

  const SchemaBinding * c = r->resolver->module_scope()->lookup("c");
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->confidence, Confidence::Certain);
}

TEST(BindingResolver, UnannotatedFramesAreNotChecked)
{
  const auto r = resolve(
    "import pandas as pd\n"
    "df = pd.read_csv(\"users.csv\")\n"
    "df[\"anything\"]\n"
    "df.whatever\n");

  EXPECT_TRUE(r->sink.records.empty());
}

TEST(BindingResolver, ReturnAnnotationBindsCallResult)
{
  const auto r = resolve(
    "def load() -> DataFrame[Users]:\n"
    "    pass\n"
    "df = load()\n"
    "df[\"name\"]\n");

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");
}

TEST(BindingResolver, PreservingMethodsKeepSchema)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "top = df.sort_values(\"id\").head(10)\n"
    "top[\"name\"]\n"
    "rows = df[df[\"id\"] > 3]\n"
    "rows[\"id\"]\n");

  EXPECT_EQ(names_of(r->sink.records), (std::vector<std::string>{"name", "id", "id"}));
  for (const auto & rec : r->sink.records) {
    EXPECT_EQ(rec.schema, "Users");
  }
  const SchemaBinding * top = r->resolver->module_scope()->lookup("top");
  ASSERT_NE(top, nullptr);
  EXPECT_EQ(top->confidence, Confidence::Inferred);
}

TEST(BindingResolver, FunctionBodiesSeeFinalModuleState)
{
  const auto r = resolve(
    "def use():\n"
    "    return frame[\"id\"]\n"
    "frame = Users.from_pandas(raw)\n");

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");
}

// =============================================================================
// Control flow
// =============================================================================

TEST(BindingResolver, DivergentBranchesBecomeUnknown)
{
  const auto r = resolve(
    "if flag:\n"
    "    df = Users.from_pandas(raw)\n"
    "else:\n"
    "    df = Orders.from_pandas(raw)\n"
    "df[\"id\"]\n");

  EXPECT_TRUE(r->sink.records.empty());
  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());
}

TEST(BindingResolver, AgreeingBranchesKeepBinding)
{
  const auto r = resolve(
    "if flag:\n"
    "    df = Users.from_pandas(raw)\n"
    "else:\n"
    "    df = PandasFrame.read_csv(path, Users)\n"
    "df[\"id\"]\n");

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");
}

TEST(BindingResolver, RebindingInOneBranchDowngrades)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "for row in rows:\n"
    "    df = transform(df)\n"
    "df[\"id\"]\n");

  EXPECT_TRUE(r->sink.records.empty());
}

TEST(BindingResolver, TryHandlersAndElseMergeWithBody)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "try:\n"
    "    df = Orders.from_pandas(raw)\n"
    "except ValueError as err:\n"
    "    pass\n"
    "else:\n"
    "    kept = Users.from_pandas(raw)\n"
    "same = Users.from_pandas(raw)\n"
    "try:\n"
    "    pass\n"
    "except KeyError:\n"
    "    same = PandasFrame.read_csv(path, Users)\n"
    "df[\"id\"]\n"
    "same[\"name\"]\n");

  // A handler may run before or after the body's rebinding.
  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());

  // `else` only runs when no handler did.
  const SchemaBinding * kept = r->resolver->module_scope()->lookup("kept");
  ASSERT_NE(kept, nullptr);
  EXPECT_TRUE(kept->is_unknown());

  const SchemaBinding * err = r->resolver->module_scope()->lookup("err");
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(err->is_unknown());

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].name, "name");
  EXPECT_EQ(r->sink.records[0].schema, "Users");
}

TEST(BindingResolver, WhileLoopWithBreakMergesWithEntry)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "while pending:\n"
    "    if done:\n"
    "        break\n"
    "    df = Orders.from_pandas(raw)\n"
    "stable = Users.from_pandas(raw)\n"
    "while pending:\n"
    "    stable[\"id\"]\n"
    "    break\n"
    "df[\"id\"]\n"
    "stable[\"name\"]\n");

  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());

  EXPECT_EQ(names_of(r->sink.records), (std::vector<std::string>{"id", "name"}));
  for (const auto & rec : r->sink.records) {
    EXPECT_EQ(rec.schema, "Users");
  }
}

TEST(BindingResolver, ForElseRunsAfterLoopMerge)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "for df in frames:\n"
    "    pass\n"
    "else:\n"
    "    summary = Orders.from_pandas(raw)\n"
    "df[\"id\"]\n"
    "summary[\"amount\"]\n");

  // The loop target is rebound to something unknown.
  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].name, "amount");
  EXPECT_EQ(r->sink.records[0].schema, "Orders");
}

TEST(BindingResolver, WithTargetsForgetBindings)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "conn = Orders.from_pandas(raw)\n"
    "with open(path) as df, lock:\n"
    "    inner = Orders.from_pandas(raw)\n"
    "df[\"id\"]\n"
    "conn[\"amount\"]\n"
    "inner[\"id\"]\n");

  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());

  // The body always runs, so its bindings survive.
  EXPECT_EQ(names_of(r->sink.records), (std::vector<std::string>{"amount", "id"}));
  for (const auto & rec : r->sink.records) {
    EXPECT_EQ(rec.schema, "Orders");
  }
}

TEST(BindingResolver, DivergentMatchCasesBecomeUnknown)
{
  const auto r = resolve(
    "match source:\n"
    "    case \"users\":\n"
    "        df = Users.from_pandas(raw)\n"
    "    case {\"kind\": \"orders\", **rest}:\n"
    "        df = Orders.from_pandas(raw)\n"
    "    case _:\n"
    "        df = Users.from_pandas(raw)\n"
    "df[\"id\"]\n");

  EXPECT_TRUE(r->sink.records.empty());
  const SchemaBinding * df = r->resolver->module_scope()->lookup("df");
  ASSERT_NE(df, nullptr);
  EXPECT_TRUE(df->is_unknown());
}

TEST(BindingResolver, ExhaustiveMatchKeepsAgreeingBinding)
{
  const auto r = resolve(
    "match source:\n"
    "    case Path() if cached:\n"
    "        df = Users.from_pandas(raw)\n"
    "    case [first, *others] | (first, *others):\n"
    "        df = PandasFrame.read_csv(first, Users)\n"
    "    case other:\n"
    "        df = load(other, schema=Users)\n"
    "df[\"name\"]\n");

  ASSERT_EQ(r->sink.records.size(), 1U);
  EXPECT_EQ(r->sink.records[0].schema, "Users");

  // Without a catch-all case the subject may match nothing.
  const auto partial = resolve(
    "match source:\n"
    "    case \"users\":\n"
    "        df = Users.from_pandas(raw)\n"
    "df[\"name\"]\n");
  EXPECT_TRUE(partial->sink.records.empty());
}

TEST(BindingResolver, CasePatternCapturesShadowFrames)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "alias = Users.from_pandas(raw)\n"
    "match event:\n"
    "    case Event(frame=df) as alias:\n"
    "        pass\n"
    "    case _:\n"
    "        pass\n"
    "type Table = Users\n"
    "df[\"id\"]\n"
    "alias[\"id\"]\n");

  EXPECT_TRUE(r->sink.records.empty());
  const SchemaBinding * table = r->resolver->module_scope()->lookup("Table");
  ASSERT_NE(table, nullptr);
  EXPECT_TRUE(table->is_unknown());
}

// =============================================================================
// Derived schemas
// =============================================================================

TEST(BindingResolver, MergeUnionsSchemas)
{
  const auto r = resolve(
    "users = Users.from_pandas(a)\n"
    "orders = Orders.from_pandas(b)\n"
    "joined = users.merge(orders, on=\"id\")\n"
    "joined[\"amount\"]\n"
    "both = pd.concat([users, orders])\n"
    "both[\"name\"]\n");

  ASSERT_EQ(r->sink.records.size(), 2U);
  EXPECT_EQ(r->sink.records[0].schema, "Users + Orders");
  EXPECT_TRUE(r->sink.records[0].accepted);
  EXPECT_EQ(r->sink.records[1].schema, "Users + Orders");
  EXPECT_TRUE(r->sink.records[1].accepted);
}

TEST(BindingResolver, SelectAndDropNarrowSchema)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "ids = df[[\"id\"]]\n"
    "ids[\"name\"]\n"
    "rest = df.drop(columns=[\"name\"])\n"
    "rest[\"name\"]\n");

  ASSERT_EQ(r->sink.records.size(), 4U);
  // df[["id"]] and the dropped column are checked against the source.
  EXPECT_EQ(r->sink.records[0].schema, "Users");
  EXPECT_EQ(r->sink.records[1].schema, "Users.select(id)");
  EXPECT_FALSE(r->sink.records[1].accepted);
  EXPECT_EQ(r->sink.records[2].schema, "Users");
  EXPECT_EQ(r->sink.records[3].schema, "Users.drop(name)");
  EXPECT_FALSE(r->sink.records[3].accepted);
}

TEST(BindingResolver, WriteExtendsSchema)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "df[\"score\"] = df[\"id\"] * 2\n"
    "df[\"score\"]\n");

  ASSERT_EQ(r->sink.records.size(), 3U);
  EXPECT_EQ(r->sink.records[0].name, "id");
  EXPECT_EQ(r->sink.records[0].mode, AccessMode::Read);
  EXPECT_EQ(r->sink.records[1].name, "score");
  EXPECT_EQ(r->sink.records[1].mode, AccessMode::Write);
  EXPECT_FALSE(r->sink.records[1].accepted);
  EXPECT_EQ(r->sink.records[2].name, "score");
  EXPECT_TRUE(r->sink.records[2].accepted);
}

// =============================================================================
// Access sites
// =============================================================================

TEST(BindingResolver, AttributeAccessSites)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "df.name\n"
    "df.shape\n"
    "df._cache\n"
    "df.head()\n"
    "df.nmae.sum()\n");

  ASSERT_EQ(r->sink.records.size(), 2U);
  EXPECT_EQ(r->sink.records[0].kind, AccessKind::Attribute);
  EXPECT_EQ(r->sink.records[0].name, "name");
  EXPECT_EQ(r->sink.records[1].name, "nmae");
  EXPECT_FALSE(r->sink.records[1].accepted);
}

TEST(BindingResolver, SchemaColumnSubscript)
{
  const auto r = resolve(
    "df = Users.from_pandas(raw)\n"
    "df[Orders.amount]\n"
    "df[[Users.id, \"name\"]]\n");

  ASSERT_EQ(r->sink.records.size(), 3U);
  EXPECT_EQ(r->sink.records[0].kind, AccessKind::SchemaColumnSubscript);
  EXPECT_EQ(r->sink.records[0].name, "amount");
  EXPECT_EQ(r->sink.records[1].kind, AccessKind::SchemaColumnSubscript);
  EXPECT_EQ(r->sink.records[2].kind, AccessKind::LiteralSubscript);
}

TEST(BindingResolver, RequiresFrozenRegistry)
{
  SchemaRegistry registry;
  AstContext ast;
  RecordingSink sink;
  EXPECT_THROW((void)BindingResolver(registry, ast, FileId{0}, sink), InternalFault);
}

TEST(BindingResolver, DescribesFrameExpressions)
{
  const auto unit = test_support::parse("a.b\nload()\nx[0]\n");
  ASSERT_NE(unit.module, nullptr);

  auto expr_of = [&](size_t i) { return cast<ExprStmt>(unit.module->body[i])->expr; };
  EXPECT_EQ(describe_frame_expr(expr_of(0)), "a.b");
  EXPECT_EQ(describe_frame_expr(expr_of(1)), "load()");
  EXPECT_EQ(describe_frame_expr(expr_of(2)), "x[...]");
}
