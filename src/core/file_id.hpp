#pragma once

#include "file_error.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

// Identity of the entity behind a path. Paths that name the same file through
// symlinks, hardlinks or relative spellings resolve to equal ids.
class FileId {
public:
  static std::expected<FileId, FileError> resolve(const fs::path &path);

  std::uint64_t value() const { return value_; }

  bool operator==(const FileId &other) const = default;

private:
  explicit FileId(std::uint64_t value) : value_(value) {}

  std::uint64_t value_;
};

template <> struct std::hash<FileId> {
  std::size_t operator()(const FileId &id) const noexcept {
    return static_cast<std::size_t>(id.value());
  }
};
