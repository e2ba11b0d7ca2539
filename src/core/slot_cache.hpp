#ifndef SLOT_CACHE_HPP
#define SLOT_CACHE_HPP

#include "file_error.hpp"
#include "file_id.hpp"
#include "source.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

using Buffer = std::shared_ptr<const std::vector<std::uint8_t>>;

using FileReader = std::function<std::expected<std::vector<std::uint8_t>, FileError>(
    const fs::path &)>;

// Reads a whole file, refusing directories.
std::expected<std::vector<std::uint8_t>, FileError>
read_file(const fs::path &path);

// Per-generation cache of everything read from disk during one compilation.
//
// Paths are mapped to a FileId, ids to a Slot holding the decoded source and
// the raw bytes of that file. Each slot field is loaded at most once per
// generation; failures are cached like successes. Lookups of different keys
// may run concurrently. reset() starts a new generation and must not race
// with lookups.
class SlotCache {
public:
  explicit SlotCache(FileReader reader = read_file);

  SlotCache(const SlotCache &) = delete;
  SlotCache &operator=(const SlotCache &) = delete;

  std::expected<SourceId, FileError> get_or_load_source(const fs::path &path);
  std::expected<Buffer, FileError> get_or_load_bytes(const fs::path &path);

  // `id` must come from the current generation.
  const Source &source_by_id(SourceId id) const;

  void reset();

  // Whether `path` was looked up in this generation, under any of the keys it
  // was recorded with.
  bool knows_path(const fs::path &path) const;

  bool knows_identity(const FileId &id) const;

  std::size_t source_count() const;
  std::size_t slot_count() const;

private:
  struct Slot {
    std::once_flag source_once;
    std::optional<std::expected<SourceId, FileError>> source;
    std::once_flag buffer_once;
    std::optional<std::expected<Buffer, FileError>> buffer;
  };

  std::expected<Slot *, FileError> slot(const fs::path &path);
  SourceId insert(const fs::path &path, std::string text);

  static std::string normalize(const fs::path &path);
  static std::optional<std::string> canonical_key(const fs::path &path);

  FileReader reader_;

  mutable std::mutex slots_mutex_;
  std::unordered_map<std::string, std::expected<FileId, FileError>> ids_;
  std::unordered_map<FileId, std::unique_ptr<Slot>> slots_;

  mutable std::shared_mutex sources_mutex_;
  std::vector<std::unique_ptr<Source>> sources_;
};

#endif // SLOT_CACHE_HPP
