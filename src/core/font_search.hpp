#pragma once

#include "font_book.hpp"
#include "freetype.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// Where a discovered face lives on disk.
struct FontLocation {
  fs::path path;
  std::uint32_t index = 0;
};

// Walks font directories and indexes every face it can open.
class FontSearcher {
public:
  FontSearcher();

  void search_system();
  void search_dir(const fs::path &dir);
  void search_file(const fs::path &path);

  const FontBook &book() const { return book_; }
  const std::vector<FontLocation> &locations() const { return locations_; }

  FontBook take_book() { return std::move(book_); }
  std::vector<FontLocation> take_locations() { return std::move(locations_); }

private:
  FreeTypeLibrary library_;
  FontBook book_;
  std::vector<FontLocation> locations_;
};
