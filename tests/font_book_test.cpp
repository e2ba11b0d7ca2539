#include "core/font_book.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {

FontBook sample_book() {
  FontBook book;
  book.push({"Serif", {FontStyle::Normal, 400, 100.0}});
  book.push({"Serif", {FontStyle::Italic, 400, 100.0}});
  book.push({"Serif", {FontStyle::Normal, 700, 100.0}});
  book.push({"Mono", {FontStyle::Normal, 400, 87.5}});
  return book;
}

} // namespace

TEST(FontBookTest, SelectPrefersClosestVariant) {
  FontBook book = sample_book();

  EXPECT_EQ(book.select("Serif"), 0u);
  EXPECT_EQ(book.select("serif", {FontStyle::Italic, 400, 100.0}), 1u);
  EXPECT_EQ(book.select("SERIF", {FontStyle::Normal, 800, 100.0}), 2u);
  EXPECT_EQ(book.select("Mono", {FontStyle::Italic, 400, 100.0}), 3u);
  EXPECT_FALSE(book.select("Sans").has_value());
}

TEST(FontBookTest, FamiliesAreSorted) {
  auto families = sample_book().families();

  ASSERT_EQ(families.size(), 2u);
  EXPECT_EQ(families.begin()->first, "Mono");
  EXPECT_EQ(families.at("Serif"), (std::vector<std::size_t>{0, 1, 2}));
}

TEST(FontBookTest, PrintFamilies) {
  FontBook book = sample_book();

  std::ostringstream names;
  print_families(names, book, false);
  EXPECT_EQ(names.str(), "Mono\nSerif\n");

  std::ostringstream variants;
  print_families(variants, book, true);
  EXPECT_EQ(variants.str(), "Mono\n"
                            "- Style: Normal, Weight: 400, Stretch: 87.5%\n"
                            "Serif\n"
                            "- Style: Normal, Weight: 400, Stretch: 100%\n"
                            "- Style: Italic, Weight: 400, Stretch: 100%\n"
                            "- Style: Normal, Weight: 700, Stretch: 100%\n");
}
