// test_source_manager.cpp - Source files, ranges and line tables
//
#include <gtest/gtest.h>

#include "schemaflow/basic/source_manager.hpp"

using namespace schemaflow;

TEST(SourceManager, LineColumnIsOneBased)
{
  const SourceFile file("m.py", "ab\ncd\n\nef");
  EXPECT_EQ(file.get_line_column(0).line, 1U);
  EXPECT_EQ(file.get_line_column(0).column, 1U);
  EXPECT_EQ(file.get_line_column(4).line, 2U);
  EXPECT_EQ(file.get_line_column(4).column, 2U);
  EXPECT_EQ(file.get_line_column(7).line, 4U);
  EXPECT_EQ(file.get_line_column(7).column, 1U);
}

TEST(SourceManager, LinesWithoutTerminators)
{
  const SourceFile file("m.py", "first\r\nsecond\n\nlast");
  EXPECT_EQ(file.get_line(0), "first");
  EXPECT_EQ(file.get_line(1), "second");
  EXPECT_EQ(file.get_line(2), "");
  EXPECT_EQ(file.get_line(3), "last");
  EXPECT_EQ(file.get_line(9), "");
}

TEST(SourceManager, ColumnsCountCharacters)
{
  const SourceFile file("m.py", "caf\xC3\xA9 = 1\nx\r\ny\rz");
  EXPECT_EQ(file.get_line_column(6).line, 1U);
  EXPECT_EQ(file.get_line_column(6).column, 6U);

  // "\r\n" and a lone "\r" both end a line.
  EXPECT_EQ(file.line_count(), 4U);
  EXPECT_EQ(file.get_line(2), "y");
  EXPECT_EQ(file.get_line_column(15).line, 4U);
  EXPECT_EQ(file.get_line_column(15).column, 1U);
}

TEST(SourceManager, SlicesAndFullRanges)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("m.py", "x = df[\"col\"]\n");

  const SourceRange range(id, 7, 12);
  EXPECT_EQ(sources.get_slice(range), "\"col\"");

  const FullSourceRange fr = sources.get_full_range(range);
  EXPECT_EQ(fr.start_line, 1U);
  EXPECT_EQ(fr.start_column, 8U);
  EXPECT_EQ(fr.end_column, 13U);

  EXPECT_EQ(sources.get_slice(SourceRange()), "");
  EXPECT_FALSE(sources.get_full_range(SourceRange()).is_valid());
}

TEST(SourceManager, RegisteringAPathTwiceReturnsTheFirstId)
{
  SourceRegistry sources;
  const FileId a = sources.register_file("pkg/a.py", "one");
  const FileId b = sources.register_file("pkg/b.py", "two");
  const FileId again = sources.register_file("pkg/./a.py", "three");

  EXPECT_NE(a, b);
  EXPECT_EQ(again, a);
  EXPECT_EQ(sources.size(), 2U);
  EXPECT_EQ(sources.get_file(a)->content(), "one");
  ASSERT_TRUE(sources.find_by_path("pkg/b.py").has_value());
  EXPECT_EQ(*sources.find_by_path("pkg/b.py"), b);
  EXPECT_FALSE(sources.find_by_path("pkg/c.py").has_value());
}

TEST(SourceManager, InvalidIdsAreHarmless)
{
  SourceRegistry sources;
  EXPECT_EQ(sources.get_file(FileId::invalid()), nullptr);
  EXPECT_TRUE(sources.get_path(FileId{7}).empty());
}
