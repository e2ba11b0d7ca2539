#include "core/source.hpp"
#include <gtest/gtest.h>

TEST(SourceTest, MapsBytesToLines) {
  Source source(0, "main.txt", "ab\ncd\n\nef");

  EXPECT_EQ(source.len_lines(), 4u);
  EXPECT_EQ(source.byte_to_line(0), 0u);
  EXPECT_EQ(source.byte_to_line(2), 0u);
  EXPECT_EQ(source.byte_to_line(3), 1u);
  EXPECT_EQ(source.byte_to_line(6), 2u);
  EXPECT_EQ(source.byte_to_line(9), 3u);
  EXPECT_FALSE(source.byte_to_line(10).has_value());
}

TEST(SourceTest, LineRangesExcludeTerminators) {
  Source source(0, "main.txt", "one\r\ntwo\nthree");

  EXPECT_EQ(source.line_to_range(0), std::make_pair(std::size_t{0}, std::size_t{3}));
  EXPECT_EQ(source.line_to_range(1), std::make_pair(std::size_t{5}, std::size_t{8}));
  EXPECT_EQ(source.line_to_range(2), std::make_pair(std::size_t{9}, std::size_t{14}));
  EXPECT_FALSE(source.line_to_range(3).has_value());
}

TEST(SourceTest, ColumnsCountCharactersNotBytes) {
  // "é" is two bytes.
  Source source(0, "main.txt", "x\n\xC3\xA9t");

  EXPECT_EQ(source.byte_to_column(2), 0u);
  EXPECT_FALSE(source.byte_to_column(3).has_value());
  EXPECT_EQ(source.byte_to_column(4), 1u);
  EXPECT_EQ(source.byte_to_column(5), 2u);
}

TEST(SourceTest, EmptyTextHasOneLine) {
  Source source(3, "empty.txt", "");
  EXPECT_EQ(source.id(), 3u);
  EXPECT_EQ(source.len_lines(), 1u);
  EXPECT_EQ(source.line_to_range(0), std::make_pair(std::size_t{0}, std::size_t{0}));
}
