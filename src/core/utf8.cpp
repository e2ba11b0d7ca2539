#include "utf8.hpp"

namespace utf8 {

std::optional<char32_t> decode(std::string_view text, std::size_t &pos) {
  if (pos >= text.size()) {
    return std::nullopt;
  }

  auto byte = [&](std::size_t i) {
    return static_cast<unsigned char>(text[i]);
  };

  unsigned char lead = byte(pos);
  std::size_t length = 0;
  char32_t cp = 0;

  if (lead < 0x80) {
    ++pos;
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    return std::nullopt;
  }

  if (pos + length > text.size()) {
    return std::nullopt;
  }

  for (std::size_t i = 1; i < length; ++i) {
    unsigned char cont = byte(pos + i);
    if ((cont & 0xC0) != 0x80) {
      return std::nullopt;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong forms, surrogates and values past U+10FFFF.
  static constexpr char32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < min_for_length[length] || cp > 0x10FFFF ||
      (cp >= 0xD800 && cp <= 0xDFFF)) {
    return std::nullopt;
  }

  pos += length;
  return cp;
}

bool is_valid(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!decode(text, pos)) {
      return false;
    }
  }
  return true;
}

std::size_t count(std::string_view text) {
  std::size_t pos = 0;
  std::size_t n = 0;
  while (pos < text.size()) {
    if (!decode(text, pos)) {
      ++pos;
    }
    ++n;
  }
  return n;
}

} // namespace utf8
