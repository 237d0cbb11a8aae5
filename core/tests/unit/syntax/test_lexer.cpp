#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "schemaflow/syntax/lexer.hpp"
#include "schemaflow/syntax/token.hpp"

using schemaflow::FileId;
using schemaflow::syntax::Lexer;
using schemaflow::syntax::Token;
using schemaflow::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(FileId{0}, src);
  return lexer.lex_all();
}

size_t count_kind(const std::vector<Token> & toks, TokenKind kind)
{
  size_t n = 0;
  for (const auto & t : toks) {
    if (t.kind == kind) {
      ++n;
    }
  }
  return n;
}

}  // namespace

TEST(SyntaxLexer, EndsWithEof)
{
  const auto toks = lex("");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, IndentAndDedentBalance)
{
  const std::string_view src =
    "class S(BaseSchema):\n"
    "    a = Column(type=int)\n"
    "    if x:\n"
    "        pass\n"
    "y = 1\n";

  const auto toks = lex(src);
  EXPECT_EQ(count_kind(toks, TokenKind::Indent), 2U);
  EXPECT_EQ(count_kind(toks, TokenKind::Dedent), 2U);
  EXPECT_EQ(count_kind(toks, TokenKind::Unknown), 0U);
}

TEST(SyntaxLexer, BlankAndCommentLinesDoNotAffectIndentation)
{
  const std::string_view src =
    "def f():\n"
    "    x = 1\n"
    "\n"
    "# comment at column zero\n"
    "    y = 2\n";

  const auto toks = lex(src);
  EXPECT_EQ(count_kind(toks, TokenKind::Indent), 1U);
  EXPECT_EQ(count_kind(toks, TokenKind::Unknown), 0U);
}

TEST(SyntaxLexer, NewlinesInsideBracketsAreJoined)
{
  const std::string_view src =
    "x = f(\n"
    "    a,\n"
    "    b,\n"
    ")\n";

  const auto toks = lex(src);
  EXPECT_EQ(count_kind(toks, TokenKind::Newline), 1U);
  EXPECT_EQ(count_kind(toks, TokenKind::Indent), 0U);
}

TEST(SyntaxLexer, StringPrefixesAreSingleTokens)
{
  const auto toks = lex("p = r\"sensor_\\d+\"\n");

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].kind, TokenKind::Eq);
  EXPECT_EQ(toks[2].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[2].text, "r\"sensor_\\d+\"");
}

TEST(SyntaxLexer, TripleQuotedStringSpansLines)
{
  const auto toks = lex("doc = \"\"\"line one\nline two\"\"\"\n");

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[2].kind, TokenKind::StringLiteral);
  EXPECT_EQ(count_kind(toks, TokenKind::Newline), 1U);
}

TEST(SyntaxLexer, LongestOperatorWins)
{
  const auto toks = lex("a **= 2\n");

  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[1].kind, TokenKind::DoubleStarEq);
}

TEST(SyntaxLexer, RangesAreShiftedByBaseOffset)
{
  Lexer lexer(FileId{3}, "Frame[S]", 10);
  const auto toks = lexer.lex_all();

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].range.file_id(), FileId{3});
  EXPECT_EQ(toks[0].begin(), 10U);
  EXPECT_EQ(toks[0].end(), 15U);
}

TEST(SyntaxLexer, InconsistentDedentIsReported)
{
  const std::string_view src =
    "if x:\n"
    "        a = 1\n"
    "    b = 2\n";

  const auto toks = lex(src);
  bool found = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Unknown && !t.detail.empty()) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}
