#ifndef FONT_BOOK_HPP
#define FONT_BOOK_HPP

#include "slot_cache.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

enum class FontStyle { Normal, Italic, Oblique };

std::string_view to_string(FontStyle style);

struct FontVariant {
  FontStyle style = FontStyle::Normal;
  // OS/2 weight class, 100..900.
  std::uint16_t weight = 400;
  // Width as a percentage of normal, 50..200.
  double stretch = 100.0;
};

struct FontInfo {
  std::string family;
  FontVariant variant;
};

// A loaded font face: the bytes of its file plus the face index inside it.
struct Font {
  Buffer data;
  std::uint32_t index = 0;
};

// Metadata of every discovered face, indexed like the world's font slots.
class FontBook {
public:
  void push(FontInfo info) { infos_.push_back(std::move(info)); }

  std::size_t size() const { return infos_.size(); }
  bool empty() const { return infos_.empty(); }
  const FontInfo &info(std::size_t index) const { return infos_.at(index); }

  // Family name -> indices of its faces, sorted by family name.
  std::map<std::string, std::vector<std::size_t>> families() const;

  // Closest face of `family` (case-insensitive) to `variant`.
  std::optional<std::size_t> select(std::string_view family,
                                    const FontVariant &variant = {}) const;

private:
  std::vector<FontInfo> infos_;
};

// One family name per line in sorted order; with `variants`, every face of
// the family follows as "- Style: ..., Weight: ..., Stretch: ...%".
void print_families(std::ostream &os, const FontBook &book, bool variants);

#endif // FONT_BOOK_HPP
