#include "source.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <string_view>

Source::Source(SourceId id, fs::path path, std::string text)
    : id_(id), path_(std::move(path)), text_(std::move(text)) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

std::optional<std::size_t> Source::byte_to_line(std::size_t byte) const {
  if (byte > text_.size()) {
    return std::nullopt;
  }
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), byte);
  return static_cast<std::size_t>(it - line_starts_.begin()) - 1;
}

std::optional<std::pair<std::size_t, std::size_t>>
Source::line_to_range(std::size_t line) const {
  if (line >= line_starts_.size()) {
    return std::nullopt;
  }

  std::size_t start = line_starts_[line];
  std::size_t end = line + 1 < line_starts_.size() ? line_starts_[line + 1] - 1
                                                   : text_.size();
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }
  return std::make_pair(start, end);
}

std::optional<std::size_t> Source::byte_to_column(std::size_t byte) const {
  auto line = byte_to_line(byte);
  if (!line) {
    return std::nullopt;
  }

  if (byte < text_.size() &&
      (static_cast<unsigned char>(text_[byte]) & 0xC0) == 0x80) {
    return std::nullopt;
  }

  std::size_t start = line_starts_[*line];
  return utf8::count(std::string_view(text_).substr(start, byte - start));
}
