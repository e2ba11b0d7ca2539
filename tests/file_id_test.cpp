#include "core/file_id.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

TEST(FileIdTest, SymlinkResolvesToTargetIdentity) {
  TempDir dir;
  fs::path target = dir.write("main.txt", "hello");
  fs::path link = dir.path() / "link.txt";
  fs::create_symlink(target, link);

  auto a = FileId::resolve(target);
  auto b = FileId::resolve(link);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, *b);
}

TEST(FileIdTest, HardlinkResolvesToSameIdentity) {
  TempDir dir;
  fs::path target = dir.write("main.txt", "hello");
  fs::path link = dir.path() / "hard.txt";
  fs::create_hard_link(target, link);

  EXPECT_EQ(FileId::resolve(target).value(), FileId::resolve(link).value());
}

TEST(FileIdTest, RelativeAndAbsoluteSpellingsAgree) {
  TempDir dir;
  dir.write("sub/doc.txt", "x");
  fs::path dotted = dir.path() / "sub" / ".." / "sub" / "doc.txt";

  EXPECT_EQ(FileId::resolve(dotted).value(),
            FileId::resolve(dir.path() / "sub/doc.txt").value());
}

TEST(FileIdTest, DistinctFilesHaveDistinctIdentities) {
  TempDir dir;
  auto a = FileId::resolve(dir.write("a.txt", "same"));
  auto b = FileId::resolve(dir.write("b.txt", "same"));
  ASSERT_TRUE(a && b);
  EXPECT_NE(*a, *b);
}

TEST(FileIdTest, MissingFileIsNotFoundError) {
  TempDir dir;
  fs::path missing = dir.path() / "nope.txt";

  auto id = FileId::resolve(missing);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().kind(), FileError::Kind::NotFound);
  EXPECT_EQ(id.error().path(), missing);
  EXPECT_NE(id.error().message().find(missing.string()), std::string::npos);
}
