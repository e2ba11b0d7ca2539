#ifndef SOURCE_HPP
#define SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Dense index into the source store of one cache generation. Never keep one
// across SlotCache::reset().
using SourceId = std::uint32_t;

// Byte range inside a source.
struct Span {
  SourceId source = 0;
  std::size_t start = 0;
  std::size_t end = 0;
};

class Source {
public:
  Source(SourceId id, fs::path path, std::string text);

  SourceId id() const { return id_; }
  const fs::path &path() const { return path_; }
  const std::string &text() const { return text_; }

  std::size_t len_bytes() const { return text_.size(); }
  std::size_t len_lines() const { return line_starts_.size(); }

  // Zero-based line containing the byte offset.
  std::optional<std::size_t> byte_to_line(std::size_t byte) const;

  // Byte range of a zero-based line, excluding its terminator.
  std::optional<std::pair<std::size_t, std::size_t>>
  line_to_range(std::size_t line) const;

  // Zero-based column in characters; nullopt when `byte` is past the end or
  // inside a multi-byte character.
  std::optional<std::size_t> byte_to_column(std::size_t byte) const;

private:
  SourceId id_;
  fs::path path_;
  std::string text_;
  std::vector<std::size_t> line_starts_;
};

#endif // SOURCE_HPP
