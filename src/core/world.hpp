#pragma once

#include "file_error.hpp"
#include "font_book.hpp"
#include "slot_cache.hpp"
#include "source.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

// Everything a document engine may read. Engines reach files and fonts only
// through this interface.
class World {
public:
  virtual ~World() = default;

  // Directory that absolute (`/`-prefixed) document paths are resolved in.
  virtual const fs::path &root() const = 0;
  virtual const Source &main() const = 0;

  virtual std::expected<SourceId, FileError>
  resolve(const fs::path &path) const = 0;
  virtual const Source &source(SourceId id) const = 0;
  virtual std::expected<Buffer, FileError> file(const fs::path &path) const = 0;

  virtual const FontBook &book() const = 0;
  virtual std::optional<Font> font(std::size_t index) const = 0;
};
