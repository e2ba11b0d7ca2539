#include "font_book.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <limits>

std::string_view to_string(FontStyle style) {
  switch (style) {
  case FontStyle::Italic:
    return "Italic";
  case FontStyle::Oblique:
    return "Oblique";
  case FontStyle::Normal:
    break;
  }
  return "Normal";
}

static bool equals_ignore_case(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::map<std::string, std::vector<std::size_t>> FontBook::families() const {
  std::map<std::string, std::vector<std::size_t>> result;
  for (std::size_t i = 0; i < infos_.size(); ++i) {
    result[infos_[i].family].push_back(i);
  }
  return result;
}

std::optional<std::size_t> FontBook::select(std::string_view family,
                                            const FontVariant &variant) const {
  std::optional<std::size_t> best;
  double best_distance = std::numeric_limits<double>::max();

  for (std::size_t i = 0; i < infos_.size(); ++i) {
    const FontInfo &info = infos_[i];
    if (!equals_ignore_case(info.family, family)) {
      continue;
    }

    // Style mismatches dominate, then weight, then stretch.
    double distance =
        (info.variant.style == variant.style ? 0.0 : 10000.0) +
        std::abs(static_cast<int>(info.variant.weight) -
                 static_cast<int>(variant.weight)) +
        std::abs(info.variant.stretch - variant.stretch);

    if (distance < best_distance) {
      best_distance = distance;
      best = i;
    }
  }

  return best;
}

void print_families(std::ostream &os, const FontBook &book, bool variants) {
  for (const auto &[family, faces] : book.families()) {
    os << family << "\n";
    if (!variants) {
      continue;
    }
    for (std::size_t index : faces) {
      const FontVariant &variant = book.info(index).variant;
      os << std::format("- Style: {}, Weight: {}, Stretch: {}%\n",
                        to_string(variant.style), variant.weight,
                        variant.stretch);
    }
  }
}
