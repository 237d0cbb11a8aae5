// test_schema_registry.cpp - Schema resolution across files
//
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <set>
#include <string>

#include "schemaflow/sema/schema/schema_registry.hpp"
#include "schemaflow/test_support/parse_helpers.hpp"

using namespace schemaflow;

namespace
{

std::set<std::string> lookup_keys(const SchemaDefinition & def)
{
  std::set<std::string> out;
  for (const auto & c : def.columns) {
    out.insert(c.lookup_key);
  }
  return out;
}

const Diagnostic * first_with_code(const DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) {
      return &d;
    }
  }
  return nullptr;
}

constexpr const char * k_user_order =
  "class UserSchema(BaseSchema):\n"
  "    id = Column(type=int)\n"
  "    name = Column(type=str)\n"
  "class OrderSchema(BaseSchema):\n"
  "    id = Column(type=int)\n"
  "    amount = Column(type=float)\n";

}  // namespace

// =============================================================================
// Classification and inheritance
// =============================================================================

TEST(SchemaRegistry, OnlySchemaDescendantsAreRegistered)
{
  const auto project = test_support::build_project(
    "class Mixin(object):\n"
    "    x = Column(type=int)\n"
    "class Users(BaseSchema):\n"
    "    id = Column(type=int)\n"
    "class Admins(Users, Mixin):\n"
    "    level = Column(type=int)\n"
    "Weird = Mixin + Users\n");

  EXPECT_TRUE(project->diags.empty());
  EXPECT_EQ(project->registry.size(), 2U);
  EXPECT_EQ(project->schema("Mixin"), nullptr);
  EXPECT_EQ(project->schema("Weird"), nullptr);

  const SchemaDefinition * admins = project->schema("Admins");
  ASSERT_NE(admins, nullptr);
  EXPECT_TRUE(admins->resolved);
  EXPECT_EQ(lookup_keys(*admins), (std::set<std::string>{"id", "level"}));
}

TEST(SchemaRegistry, InheritanceAcrossFiles)
{
  const auto project = test_support::build_project({
    {"app/models.py",
     "class Child(Base):\n"
     "    name = Column(type=str)\n"
     "class Same(Base):\n"
     "    pass\n"},
    {"lib/base.py",
     "class Base(BaseSchema):\n"
     "    id = Column(type=int)\n"
     "    name = Column(type=int)\n"},
  });

  const SchemaDefinition * child = project->schema("Child");
  ASSERT_NE(child, nullptr);
  EXPECT_EQ(lookup_keys(*child), (std::set<std::string>{"id", "name"}));
  // Own members override inherited ones.
  EXPECT_EQ(child->find_by_name("name")->value_type.tag, TypeTag::Str);
  EXPECT_EQ(child->origin, DeclarationStyle::DescriptorClass);

  const SchemaDefinition * same = project->schema("Same");
  ASSERT_NE(same, nullptr);
  EXPECT_EQ(same->origin, DeclarationStyle::Inheritance);
}

TEST(SchemaRegistry, StrictnessIsInherited)
{
  const auto project = test_support::build_project(
    "class Strict(BaseSchema):\n"
    "    allow_extra_columns = False\n"
    "    id = Column(type=int)\n"
    "class Child(Strict):\n"
    "    name = Column(type=str)\n"
    "class Loose(Strict):\n"
    "    allow_extra_columns = True\n"
    "class Plain(BaseSchema):\n"
    "    id = Column(type=int)\n");

  EXPECT_FALSE(project->schema("Strict")->allow_extra_columns);
  EXPECT_FALSE(project->schema("Child")->allow_extra_columns);
  EXPECT_TRUE(project->schema("Loose")->allow_extra_columns);
  EXPECT_TRUE(project->schema("Plain")->allow_extra_columns);
}

// =============================================================================
// Composition
// =============================================================================

TEST(SchemaRegistry, AddCompositionUnionsColumns)
{
  const auto project =
    test_support::build_project(std::string(k_user_order) + "Combined = UserSchema + OrderSchema\n");

  EXPECT_TRUE(project->diags.empty());
  const SchemaDefinition * combined = project->schema("Combined");
  ASSERT_NE(combined, nullptr);
  EXPECT_TRUE(combined->resolved);
  EXPECT_TRUE(combined->allow_extra_columns);
  EXPECT_EQ(combined->origin, DeclarationStyle::AddExpression);
  EXPECT_EQ(combined->columns.size(), 3U);
  EXPECT_EQ(lookup_keys(*combined), (std::set<std::string>{"id", "name", "amount"}));
}

TEST(SchemaRegistry, CombineSchemasMatchesAddition)
{
  const auto project = test_support::build_project(
    std::string(k_user_order) + "Combined = combine_schemas(UserSchema, OrderSchema)\n");

  const SchemaDefinition * combined = project->schema("Combined");
  ASSERT_NE(combined, nullptr);
  EXPECT_EQ(lookup_keys(*combined), (std::set<std::string>{"id", "name", "amount"}));
}

TEST(SchemaRegistry, ConflictingTypesAreReported)
{
  const auto project = test_support::build_project(
    "class A(BaseSchema):\n"
    "    id = Column(type=int)\n"
    "class B(BaseSchema):\n"
    "    id = Column(type=str)\n"
    "Combined = A + B\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
  EXPECT_EQ(d->severity, Severity::Error);
  EXPECT_EQ(d->message, "Column 'id' has conflicting types: int (A) vs str (B)");

  const SchemaDefinition * combined = project->schema("Combined");
  ASSERT_NE(combined, nullptr);
  EXPECT_FALSE(combined->resolved);
}

TEST(SchemaRegistry, ConflictVerdictDoesNotDependOnOrder)
{
  const std::string decls =
    "class A(BaseSchema):\n"
    "    id = Column(type=int)\n"
    "class B(BaseSchema):\n"
    "    score = Column(type=float)\n"
    "class C(BaseSchema):\n"
    "    id = Column(type=str)\n"
    "    score = Column(type=str)\n";

  std::array<std::string, 3> order = {"A", "B", "C"};
  do {
    const auto project = test_support::build_project(
      decls + "S = " + order[0] + " + " + order[1] + " + " + order[2] + "\n");
    ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
    const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
    EXPECT_EQ(d->message.rfind("Column 'id' has conflicting types", 0), 0U) << d->message;
    EXPECT_FALSE(project->schema("S")->resolved);
  } while (std::next_permutation(order.begin(), order.end()));
}

TEST(SchemaRegistry, CompatibleCompositionIsOrderIndependent)
{
  const std::string decls =
    "class A(BaseSchema):\n"
    "    id = Column(type=int)\n"
    "    x = Column(type=str)\n"
    "class B(BaseSchema):\n"
    "    id = Column(type=pl.Int64)\n"
    "    y = Column(type=int)\n"
    "class C(BaseSchema):\n"
    "    z = Column(type=float)\n";

  std::array<std::string, 3> order = {"A", "B", "C"};
  do {
    const auto project = test_support::build_project(
      decls + "S = " + order[0] + " + " + order[1] + " + " + order[2] + "\n");
    EXPECT_TRUE(project->diags.empty());
    const SchemaDefinition * s = project->schema("S");
    ASSERT_NE(s, nullptr);
    EXPECT_TRUE(s->resolved);
    EXPECT_EQ(lookup_keys(*s), (std::set<std::string>{"id", "x", "y", "z"}));
  } while (std::next_permutation(order.begin(), order.end()));
}

TEST(SchemaRegistry, SelectAndDrop)
{
  const auto project = test_support::build_project(
    std::string(k_user_order) +
    "Slim = UserSchema.select([UserSchema.id])\n"
    "Rest = OrderSchema.drop([\"amount\"])\n");

  EXPECT_TRUE(project->diags.empty());
  const SchemaDefinition * slim = project->schema("Slim");
  ASSERT_NE(slim, nullptr);
  EXPECT_EQ(lookup_keys(*slim), (std::set<std::string>{"id"}));
  EXPECT_EQ(slim->origin, DeclarationStyle::SubsetExpression);

  const SchemaDefinition * rest = project->schema("Rest");
  ASSERT_NE(rest, nullptr);
  EXPECT_EQ(lookup_keys(*rest), (std::set<std::string>{"id"}));
  EXPECT_EQ(rest->origin, DeclarationStyle::DropExpression);
}

TEST(SchemaRegistry, SelectingUnknownColumnIsReported)
{
  const auto project =
    test_support::build_project(std::string(k_user_order) + "Slim = UserSchema.select([\"nmae\"])\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_unknown_column), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_unknown_column);
  EXPECT_EQ(d->message, "Column 'nmae' does not exist in UserSchema");
  EXPECT_EQ(d->suggestion().value_or(""), "name");
}

// =============================================================================
// Cycles, duplicates and patterns
// =============================================================================

TEST(SchemaRegistry, CycleIsReportedOnce)
{
  const auto project = test_support::build_project(
    "class A(BaseSchema, B):\n"
    "    x = Column(type=int)\n"
    "class B(BaseSchema, A):\n"
    "    y = Column(type=int)\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
  EXPECT_EQ(d->message, "Schema 'A' is composed from itself (A -> B -> A)");
  EXPECT_FALSE(project->schema("A")->resolved);
  EXPECT_FALSE(project->schema("B")->resolved);
}

TEST(SchemaRegistry, AddExpressionCycleIsReported)
{
  const auto project = test_support::build_project(
    "class S(BaseSchema):\n"
    "    x = Column(type=int)\n"
    "A = B + S\n"
    "B = A + S\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
  EXPECT_EQ(d->message, "Schema 'A' is composed from itself (A -> B -> A)");

  ASSERT_NE(project->schema("A"), nullptr);
  ASSERT_NE(project->schema("B"), nullptr);
  EXPECT_FALSE(project->schema("A")->resolved);
  EXPECT_FALSE(project->schema("B")->resolved);
  EXPECT_TRUE(project->schema("S")->resolved);
}

TEST(SchemaRegistry, CycleThroughClassAndSelection)
{
  const auto project = test_support::build_project(
    "class S(BaseSchema):\n"
    "    x = Column(type=int)\n"
    "class C(A):\n"
    "    y = Column(type=int)\n"
    "Slim = C.select([\"x\"])\n"
    "A = Slim + S\n"
    "Unrelated = Mixin + S\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  EXPECT_EQ(
    first_with_code(project->diags, codes::k_schema_conflict)->message,
    "Schema 'A' is composed from itself (A -> Slim -> C -> A)");
  ASSERT_NE(project->schema("C"), nullptr);
  EXPECT_FALSE(project->schema("C")->resolved);
  // Operands that are not schema candidates never become schemas.
  EXPECT_EQ(project->schema("Unrelated"), nullptr);
}

TEST(SchemaRegistry, OwnAliasClashingWithInheritedKeyIsAConflict)
{
  const auto project = test_support::build_project(
    "class Base(BaseSchema):\n"
    "    email = Column(type=str)\n"
    "class Child(Base):\n"
    "    contact = Column(type=int, alias=\"email\")\n"
    "class Same(Base):\n"
    "    contact = Column(type=str, alias=\"email\")\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
  EXPECT_EQ(d->message, "Column 'email' has conflicting types: str (Base) vs int (Child)");
  EXPECT_EQ(project->sources.get_slice(d->primary_range()), "contact");

  EXPECT_TRUE(project->schema("Base")->resolved);
  EXPECT_FALSE(project->schema("Child")->resolved);
  EXPECT_TRUE(project->schema("Same")->resolved);
}

TEST(SchemaRegistry, OwnColumnsSharingAKeyMustAgree)
{
  const auto project = test_support::build_project(
    "class Wide(BaseSchema):\n"
    "    a = Column(type=int, alias=\"k\")\n"
    "    b = Column(type=float, alias=\"k\")\n");

  ASSERT_EQ(project->diags.count_with_code(codes::k_schema_conflict), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_schema_conflict);
  EXPECT_EQ(d->message, "Column 'k' has conflicting types: int (Wide) vs float (Wide)");
  EXPECT_FALSE(project->schema("Wide")->resolved);
}

TEST(SchemaRegistry, DuplicateNameKeepsFirstInPathOrder)
{
  const auto project = test_support::build_project({
    {"a.py",
     "class Users(BaseSchema):\n"
     "    id = Column(type=int)\n"},
    {"b.py",
     "class Users(BaseSchema):\n"
     "    uid = Column(type=int)\n"},
  });

  ASSERT_EQ(project->diags.count_with_code(codes::k_duplicate_schema), 1U);
  const Diagnostic * d = first_with_code(project->diags, codes::k_duplicate_schema);
  EXPECT_EQ(d->severity, Severity::Warning);
  EXPECT_EQ(d->primary_range().file_id(), project->file_ids[1]);

  const SchemaDefinition * users = project->schema("Users");
  ASSERT_NE(users, nullptr);
  EXPECT_NE(users->find_by_key("id"), nullptr);
  EXPECT_EQ(users->find_by_key("uid"), nullptr);
}

TEST(SchemaRegistry, InvalidPatternIsAWarning)
{
  const auto project = test_support::build_project(
    "class Readings(BaseSchema):\n"
    "    sensors = ColumnSet(regex=\"sensor_(\")\n"
    "    ts = Column(type=str)\n");

  EXPECT_FALSE(project->diags.has_errors());
  EXPECT_EQ(project->diags.count_with_code(codes::k_invalid_column_pattern), 1U);

  const SchemaDefinition * readings = project->schema("Readings");
  ASSERT_NE(readings, nullptr);
  EXPECT_TRUE(readings->resolved);
  EXPECT_TRUE(readings->accepts_literal("ts"));
  EXPECT_FALSE(readings->accepts_literal("sensor_1"));
}

TEST(SchemaRegistry, OverlongPatternIsRejected)
{
  const std::string pattern(k_max_column_pattern_length + 1, 'a');
  const auto project = test_support::build_project(
    "class Wide(BaseSchema):\n"
    "    cols = ColumnSet(regex=\"" + pattern + "\")\n");

  EXPECT_EQ(project->diags.count_with_code(codes::k_invalid_column_pattern), 1U);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(SchemaRegistry, QueriesRequireFrozenRegistry)
{
  SchemaRegistry registry;
  EXPECT_THROW((void)registry.find("Users"), InternalFault);
  EXPECT_THROW((void)registry.schemas(), InternalFault);
  EXPECT_THROW(registry.freeze(), InternalFault);

  DiagnosticBag diags;
  registry.resolve(diags);
  EXPECT_THROW(registry.resolve(diags), InternalFault);
  EXPECT_THROW(registry.add_file(CollectedSchemas{}), InternalFault);

  registry.freeze();
  EXPECT_EQ(registry.find("Users"), nullptr);
}

TEST(SchemaRegistry, SchemasAreOrderedByName)
{
  const auto project = test_support::build_project(std::string(k_user_order));

  const auto all = project->registry.schemas();
  ASSERT_EQ(all.size(), 2U);
  EXPECT_EQ(all[0]->name, "OrderSchema");
  EXPECT_EQ(all[1]->name, "UserSchema");
}
