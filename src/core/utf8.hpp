#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace utf8 {

// Decodes the code point starting at `pos` and advances `pos` past it.
// Returns nullopt and leaves `pos` untouched on a malformed sequence.
std::optional<char32_t> decode(std::string_view text, std::size_t &pos);

bool is_valid(std::string_view text);

// Number of code points in `text`, counting malformed bytes as one each.
std::size_t count(std::string_view text);

} // namespace utf8
