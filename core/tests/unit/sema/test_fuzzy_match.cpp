// test_fuzzy_match.cpp - "Did you mean" suggestions
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "schemaflow/sema/check/fuzzy_match.hpp"

using schemaflow::best_match;
using schemaflow::edit_distance;

TEST(FuzzyMatch, EditDistance)
{
  EXPECT_EQ(edit_distance("", ""), 0U);
  EXPECT_EQ(edit_distance("email", "email"), 0U);
  EXPECT_EQ(edit_distance("emai", "email"), 1U);
  EXPECT_EQ(edit_distance("emai", "emails"), 2U);
  EXPECT_EQ(edit_distance("kitten", "sitting"), 3U);
  EXPECT_EQ(edit_distance("", "abc"), 3U);
}

TEST(FuzzyMatch, MultiByteCharactersCountOnce)
{
  EXPECT_EQ(edit_distance("caf\xC3\xA9", "cafe"), 1U);
  EXPECT_EQ(edit_distance("\xE6\x97\xA5\xE4\xBB\x98", "\xE6\x97\xA5"), 1U);
}

TEST(FuzzyMatch, ClosestCandidateWins)
{
  const std::vector<std::string> columns = {"email", "emails"};
  EXPECT_EQ(best_match("emai", columns).value_or(""), "email");
  EXPECT_EQ(best_match("emailz", columns).value_or(""), "email");
}

TEST(FuzzyMatch, NothingBeyondThreshold)
{
  const std::vector<std::string> columns = {"email", "user_id"};
  EXPECT_FALSE(best_match("xyz", columns).has_value());
  EXPECT_FALSE(best_match("em", columns).has_value());
  EXPECT_TRUE(best_match("em", columns, 3).has_value());
  EXPECT_FALSE(best_match("anything", {}).has_value());
}

TEST(FuzzyMatch, ExactMatchIsNotASuggestion)
{
  EXPECT_EQ(best_match("email", {"email", "emails"}).value_or(""), "emails");
  EXPECT_FALSE(best_match("id", {"id"}).has_value());
}

TEST(FuzzyMatch, TiesPreferShorterThenLexicographic)
{
  EXPECT_EQ(best_match("abcd", {"abcde", "abc"}).value_or(""), "abc");
  EXPECT_EQ(best_match("abc", {"abx", "abd"}).value_or(""), "abd");
}

TEST(FuzzyMatch, TieLengthCountsCodePoints)
{
  // "colóur" is 6 code points in 7 bytes; "colours" is 7 of each.
  EXPECT_EQ(best_match("colour", {"colours", "col\xC3\xB3ur"}).value_or(""), "col\xC3\xB3ur");
  EXPECT_EQ(best_match("colour", {"col\xC3\xB3ur", "colours"}).value_or(""), "col\xC3\xB3ur");
}
