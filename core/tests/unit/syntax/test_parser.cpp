// test_parser.cpp - Source Parser tests
//
#include <gtest/gtest.h>

#include <string>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/basic/casting.hpp"
#include "schemaflow/syntax/parser.hpp"
#include "schemaflow/test_support/parse_helpers.hpp"

using namespace schemaflow;

// =============================================================================
// Statements
// =============================================================================

TEST(SyntaxParser, ParsesSchemaClass)
{
  const auto unit = test_support::parse(
    "class UserSchema(BaseSchema):\n"
    "    user_id = Column(type=int)\n"
    "    email = Column(type=str, alias=\"email_address\")\n");

  ASSERT_NE(unit.module, nullptr);
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.module->body.size(), 1U);

  const auto * cls = dyn_cast<ClassDefStmt>(unit.module->body[0]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "UserSchema");
  EXPECT_EQ(unit.slice(cls->name_range), "UserSchema");
  ASSERT_EQ(cls->bases.size(), 1U);
  EXPECT_EQ(terminal_name(cls->bases[0]->value), "BaseSchema");
  ASSERT_EQ(cls->body.size(), 2U);

  const auto * assign = dyn_cast<AssignStmt>(cls->body[1]);
  ASSERT_NE(assign, nullptr);
  const auto * call = dyn_cast<CallExpr>(assign->value);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->args.size(), 2U);
  EXPECT_TRUE(call->args[1]->is_keyword());
  EXPECT_EQ(call->args[1]->name, "alias");
  const auto * alias = dyn_cast<StringLiteralExpr>(call->args[1]->value);
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->value, "email_address");
}

TEST(SyntaxParser, ParsesAnnotatedFunction)
{
  const auto unit = test_support::parse(
    "async def load(path: str, *, schema=None) -> PandasFrame[UserSchema]:\n"
    "    return await read(path)\n");

  ASSERT_NE(unit.module, nullptr);
  const auto * fn = dyn_cast<FunctionDefStmt>(unit.module->body[0]);
  ASSERT_NE(fn, nullptr);
  EXPECT_TRUE(fn->is_async);
  EXPECT_EQ(fn->name, "load");
  ASSERT_NE(fn->returns, nullptr);
  EXPECT_TRUE(isa<SubscriptExpr>(fn->returns));

  std::string params;
  for (const auto * p : fn->params) {
    params += std::string(p->name) + ",";
  }
  EXPECT_EQ(params, "path,schema,");
}

TEST(SyntaxParser, ParsesControlFlow)
{
  const auto unit = test_support::parse(
    "for row in rows:\n"
    "    if row:\n"
    "        continue\n"
    "    elif other:\n"
    "        break\n"
    "    else:\n"
    "        pass\n"
    "try:\n"
    "    x = 1\n"
    "except (ValueError, KeyError) as e:\n"
    "    raise\n"
    "finally:\n"
    "    y = 2\n"
    "with open(p) as f, lock:\n"
    "    pass\n"
    "while True:\n"
    "    break\n");

  ASSERT_NE(unit.module, nullptr) << "unexpected parse error";
  ASSERT_EQ(unit.module->body.size(), 4U);
  EXPECT_TRUE(isa<ForStmt>(unit.module->body[0]));

  const auto * try_stmt = dyn_cast<TryStmt>(unit.module->body[1]);
  ASSERT_NE(try_stmt, nullptr);
  ASSERT_EQ(try_stmt->handlers.size(), 1U);
  EXPECT_EQ(try_stmt->handlers[0]->name, "e");
  EXPECT_EQ(try_stmt->finally_body.size(), 1U);

  const auto * with = dyn_cast<WithStmt>(unit.module->body[2]);
  ASSERT_NE(with, nullptr);
  EXPECT_EQ(with->items.size(), 2U);
}

TEST(SyntaxParser, ParsesDecoratorsAndImports)
{
  const auto unit = test_support::parse(
    "import pandas as pd\n"
    "from typedframes import BaseSchema, Column as C\n"
    "@dataclass(frozen=True)\n"
    "class Config:\n"
    "    strict: ClassVar[bool] = True\n");

  ASSERT_NE(unit.module, nullptr);
  ASSERT_EQ(unit.module->body.size(), 3U);

  const auto * imp = dyn_cast<ImportStmt>(unit.module->body[0]);
  ASSERT_NE(imp, nullptr);
  EXPECT_EQ(imp->names[0]->bound_name(), "pd");

  const auto * from = dyn_cast<ImportFromStmt>(unit.module->body[1]);
  ASSERT_NE(from, nullptr);
  EXPECT_EQ(from->module, "typedframes");
  ASSERT_EQ(from->names.size(), 2U);
  EXPECT_EQ(from->names[1]->bound_name(), "C");

  const auto * cls = dyn_cast<ClassDefStmt>(unit.module->body[2]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->decorators.size(), 1U);
}

// =============================================================================
// Expressions
// =============================================================================

TEST(SyntaxParser, SubscriptAssignmentTarget)
{
  const auto unit = test_support::parse("df[\"total\"] = df[\"a\"] + df[\"b\"]\n");

  ASSERT_NE(unit.module, nullptr);
  const auto * assign = dyn_cast<AssignStmt>(unit.module->body[0]);
  ASSERT_NE(assign, nullptr);
  ASSERT_EQ(assign->targets.size(), 1U);

  const auto * target = dyn_cast<SubscriptExpr>(assign->targets[0]);
  ASSERT_NE(target, nullptr);
  const auto * key = dyn_cast<StringLiteralExpr>(target->index);
  ASSERT_NE(key, nullptr);
  EXPECT_EQ(key->value, "total");
  EXPECT_EQ(unit.slice(key->get_range()), "\"total\"");

  const auto * sum = dyn_cast<BinaryExpr>(assign->value);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->op, BinaryOp::Add);
}

TEST(SyntaxParser, AdjacentStringsAreConcatenated)
{
  const auto unit = test_support::parse("x = df[\"first\" \"_name\"]\n");

  ASSERT_NE(unit.module, nullptr);
  const auto * assign = dyn_cast<AssignStmt>(unit.module->body[0]);
  const auto * sub = dyn_cast<SubscriptExpr>(assign->value);
  ASSERT_NE(sub, nullptr);
  const auto * lit = dyn_cast<StringLiteralExpr>(sub->index);
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, "first_name");
}

TEST(SyntaxParser, FormattedAndRawStrings)
{
  const auto unit = test_support::parse(
    "a = f\"col_{i}\"\n"
    "b = r\"sensor_\\d+\"\n");

  ASSERT_NE(unit.module, nullptr);
  const auto * fstr =
    dyn_cast<StringLiteralExpr>(dyn_cast<AssignStmt>(unit.module->body[0])->value);
  ASSERT_NE(fstr, nullptr);
  EXPECT_TRUE(fstr->is_formatted);

  const auto * raw =
    dyn_cast<StringLiteralExpr>(dyn_cast<AssignStmt>(unit.module->body[1])->value);
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->value, "sensor_\\d+");
}

TEST(SyntaxParser, ComprehensionLambdaAndWalrus)
{
  const auto unit = test_support::parse(
    "cols = [c.upper() for c in df.columns if c]\n"
    "f = lambda x, y=1: x + y\n"
    "if (n := len(cols)) > 2:\n"
    "    pass\n");

  ASSERT_NE(unit.module, nullptr);
  EXPECT_TRUE(isa<ComprehensionExpr>(dyn_cast<AssignStmt>(unit.module->body[0])->value));
  EXPECT_TRUE(isa<LambdaExpr>(dyn_cast<AssignStmt>(unit.module->body[1])->value));
}

TEST(SyntaxParser, ParsesStandaloneAnnotationText)
{
  AstContext ast;
  const Expr * expr = syntax::parse_expression_text(ast, FileId{0}, "PandasFrame[UserSchema]", 7);

  ASSERT_NE(expr, nullptr);
  const auto * sub = dyn_cast<SubscriptExpr>(expr);
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(terminal_name(sub->base), "PandasFrame");
  EXPECT_EQ(sub->get_range().get_begin().offset(), 7U);
}

// =============================================================================
// Soft keywords
// =============================================================================

TEST(SyntaxParser, ParsesMatchStatement)
{
  const auto unit = test_support::parse(
    "match command:\n"
    "    case [\"go\", direction] | (\"move\", direction):\n"
    "        pass\n"
    "    case Point(x=0, y=yy) as p if yy > 0:\n"
    "        pass\n"
    "    case {\"k\": 1, **rest}:\n"
    "        pass\n"
    "    case -1 | 2 + 3j | None | Color.RED:\n"
    "        pass\n"
    "    case a, *others:\n"
    "        pass\n"
    "    case _:\n"
    "        pass\n");

  ASSERT_NE(unit.module, nullptr) << unit.diags.all()[0].message;
  ASSERT_EQ(unit.module->body.size(), 1U);
  const auto * stmt = dyn_cast<MatchStmt>(unit.module->body[0]);
  ASSERT_NE(stmt, nullptr);
  EXPECT_EQ(terminal_name(stmt->subject), "command");
  ASSERT_EQ(stmt->cases.size(), 6U);

  const auto * alternatives = dyn_cast<BinaryExpr>(stmt->cases[0]->pattern);
  ASSERT_NE(alternatives, nullptr);
  EXPECT_EQ(alternatives->op, BinaryOp::BitOr);
  EXPECT_TRUE(isa<ListExpr>(alternatives->lhs));
  EXPECT_TRUE(isa<TupleExpr>(alternatives->rhs));

  const auto * as_pattern = dyn_cast<AsPatternExpr>(stmt->cases[1]->pattern);
  ASSERT_NE(as_pattern, nullptr);
  EXPECT_EQ(as_pattern->target->name, "p");
  const auto * class_pattern = dyn_cast<CallExpr>(as_pattern->pattern);
  ASSERT_NE(class_pattern, nullptr);
  EXPECT_EQ(class_pattern->args.size(), 2U);
  EXPECT_NE(stmt->cases[1]->guard, nullptr);

  const auto * mapping = dyn_cast<DictExpr>(stmt->cases[2]->pattern);
  ASSERT_NE(mapping, nullptr);
  ASSERT_EQ(mapping->keys.size(), 2U);
  EXPECT_EQ(mapping->keys[1], nullptr);

  const auto * open_sequence = dyn_cast<TupleExpr>(stmt->cases[4]->pattern);
  ASSERT_NE(open_sequence, nullptr);
  ASSERT_EQ(open_sequence->elements.size(), 2U);
  EXPECT_TRUE(isa<StarredExpr>(open_sequence->elements[1]));

  const auto * wildcard = dyn_cast<NameExpr>(stmt->cases[5]->pattern);
  ASSERT_NE(wildcard, nullptr);
  EXPECT_EQ(wildcard->name, "_");
  EXPECT_EQ(stmt->cases[5]->guard, nullptr);
}

TEST(SyntaxParser, SoftKeywordsRemainNames)
{
  const auto unit = test_support::parse(
    "match = re.match(p, s)\n"
    "match(x)\n"
    "match[0]: int = 1\n"
    "type = \"csv\"\n"
    "print(type(x), match.group(0))\n"
    "case = 1\n");

  ASSERT_NE(unit.module, nullptr) << unit.diags.all()[0].message;
  ASSERT_EQ(unit.module->body.size(), 6U);
  EXPECT_TRUE(isa<AssignStmt>(unit.module->body[0]));
  EXPECT_TRUE(isa<ExprStmt>(unit.module->body[1]));
  EXPECT_TRUE(isa<AnnAssignStmt>(unit.module->body[2]));
  EXPECT_TRUE(isa<AssignStmt>(unit.module->body[3]));
  EXPECT_TRUE(isa<ExprStmt>(unit.module->body[4]));
  EXPECT_TRUE(isa<AssignStmt>(unit.module->body[5]));
}

TEST(SyntaxParser, ParsesTypeParameters)
{
  const auto unit = test_support::parse(
    "type Vector = list[float]\n"
    "type Pair[T: (int, str), *Ts, **P] = tuple[T, T]\n"
    "def first[T](items: list[T]) -> T:\n"
    "    return items[0]\n"
    "class Box[T = int](Generic):\n"
    "    pass\n");

  ASSERT_NE(unit.module, nullptr) << unit.diags.all()[0].message;
  ASSERT_EQ(unit.module->body.size(), 4U);

  const auto * vector = dyn_cast<TypeAliasStmt>(unit.module->body[0]);
  ASSERT_NE(vector, nullptr);
  EXPECT_EQ(vector->name->name, "Vector");
  EXPECT_TRUE(vector->type_params.empty());
  EXPECT_TRUE(isa<SubscriptExpr>(vector->value));

  const auto * pair = dyn_cast<TypeAliasStmt>(unit.module->body[1]);
  ASSERT_NE(pair, nullptr);
  ASSERT_EQ(pair->type_params.size(), 3U);
  EXPECT_NE(pair->type_params[0]->annotation, nullptr);
  EXPECT_EQ(pair->type_params[1]->param_kind, ParamKind::VarArgs);
  EXPECT_EQ(pair->type_params[2]->param_kind, ParamKind::KwArgs);

  const auto * fn = dyn_cast<FunctionDefStmt>(unit.module->body[2]);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->type_params.size(), 1U);
  EXPECT_EQ(fn->type_params[0]->name, "T");
  EXPECT_EQ(fn->params.size(), 1U);

  const auto * cls = dyn_cast<ClassDefStmt>(unit.module->body[3]);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->type_params.size(), 1U);
  EXPECT_NE(cls->type_params[0]->default_value, nullptr);
  EXPECT_EQ(cls->bases.size(), 1U);
}

// =============================================================================
// Errors
// =============================================================================

TEST(SyntaxParser, SyntaxErrorYieldsOneParseError)
{
  const auto unit = test_support::parse(
    "def broken(:\n"
    "    pass\n"
    "x = (\n");

  EXPECT_EQ(unit.module, nullptr);
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, codes::k_parse_error);
  EXPECT_EQ(unit.diags.all()[0].severity, Severity::Error);

  const auto fr = unit.full_range(unit.diags.all()[0].primary_range());
  EXPECT_EQ(fr.start_line, 1U);
}

TEST(SyntaxParser, UnterminatedStringIsReported)
{
  const auto unit = test_support::parse("x = \"abc\n");

  EXPECT_EQ(unit.module, nullptr);
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_NE(unit.diags.all()[0].message.find("unterminated"), std::string::npos);
}

TEST(SyntaxParser, CaseOutsideSequenceIsReported)
{
  const auto unit = test_support::parse(
    "match x:\n"
    "    case *rest:\n"
    "        pass\n");

  EXPECT_EQ(unit.module, nullptr);
  EXPECT_EQ(unit.diags.count_with_code(codes::k_parse_error), 1U);
}

TEST(SyntaxParser, InvalidAssignmentTargetIsReported)
{
  const auto unit = test_support::parse("f() = 1\n");

  EXPECT_EQ(unit.module, nullptr);
  EXPECT_TRUE(unit.diags.has_errors());
}
