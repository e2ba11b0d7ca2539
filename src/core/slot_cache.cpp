#include "slot_cache.hpp"
#include "utf8.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <system_error>

std::expected<std::vector<std::uint8_t>, FileError>
read_file(const fs::path &path) {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (ec) {
    return std::unexpected(FileError::from_error_code(ec, path));
  }
  if (fs::is_directory(status)) {
    return std::unexpected(FileError(FileError::Kind::IsDirectory, path));
  }

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    int err = errno;
    return std::unexpected(err != 0 ? FileError::from_errno(err, path)
                                    : FileError(FileError::Kind::Other, path));
  }

  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::unexpected(FileError(FileError::Kind::Other, path));
  }
  return data;
}

SlotCache::SlotCache(FileReader reader) : reader_(std::move(reader)) {}

std::string SlotCache::normalize(const fs::path &path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  return absolute.lexically_normal().string();
}

std::optional<std::string> SlotCache::canonical_key(const fs::path &path) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return canonical.lexically_normal().string();
}

std::expected<SlotCache::Slot *, FileError>
SlotCache::slot(const fs::path &path) {
  std::lock_guard<std::mutex> lock(slots_mutex_);

  auto it = ids_.find(path.string());
  std::expected<FileId, FileError> id =
      it != ids_.end() ? it->second : FileId::resolve(path);

  if (it == ids_.end()) {
    // Filesystem events report absolute, canonical paths; record those too so
    // the dependency check can match them against what the compiler asked for.
    ids_.emplace(path.string(), id);
    ids_.emplace(normalize(path), id);

    // Missing files have no canonical path; resolve the existing prefix.
    if (auto canonical = canonical_key(path)) {
      ids_.emplace(*canonical, id);
    }
  }

  if (!id) {
    return std::unexpected(id.error());
  }

  auto &slot = slots_[*id];
  if (!slot) {
    slot = std::make_unique<Slot>();
  }
  return slot.get();
}

SourceId SlotCache::insert(const fs::path &path, std::string text) {
  std::unique_lock<std::shared_mutex> lock(sources_mutex_);
  auto id = static_cast<SourceId>(sources_.size());
  sources_.push_back(std::make_unique<Source>(id, path, std::move(text)));
  return id;
}

std::expected<SourceId, FileError>
SlotCache::get_or_load_source(const fs::path &path) {
  auto found = slot(path);
  if (!found) {
    return std::unexpected(found.error());
  }

  Slot *entry = *found;
  std::call_once(entry->source_once, [&] {
    auto data = reader_(path);
    if (!data) {
      entry->source = std::unexpected(data.error());
      return;
    }

    std::string text(data->begin(), data->end());
    if (!utf8::is_valid(text)) {
      entry->source =
          std::unexpected(FileError(FileError::Kind::InvalidUtf8, path));
      return;
    }

    entry->source = insert(path, std::move(text));
  });
  return *entry->source;
}

std::expected<Buffer, FileError>
SlotCache::get_or_load_bytes(const fs::path &path) {
  auto found = slot(path);
  if (!found) {
    return std::unexpected(found.error());
  }

  Slot *entry = *found;
  std::call_once(entry->buffer_once, [&] {
    auto data = reader_(path);
    if (!data) {
      entry->buffer = std::unexpected(data.error());
      return;
    }
    entry->buffer = std::make_shared<const std::vector<std::uint8_t>>(
        std::move(*data));
  });
  return *entry->buffer;
}

const Source &SlotCache::source_by_id(SourceId id) const {
  std::shared_lock<std::shared_mutex> lock(sources_mutex_);
  if (id >= sources_.size()) {
    throw std::out_of_range("source id " + std::to_string(id) +
                            " does not belong to this cache generation");
  }
  return *sources_[id];
}

void SlotCache::reset() {
  std::scoped_lock lock(slots_mutex_, sources_mutex_);
  ids_.clear();
  slots_.clear();
  sources_.clear();
}

bool SlotCache::knows_path(const fs::path &path) const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  if (ids_.contains(path.string()) || ids_.contains(normalize(path))) {
    return true;
  }
  auto canonical = canonical_key(path);
  return canonical && ids_.contains(*canonical);
}

bool SlotCache::knows_identity(const FileId &id) const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  return slots_.contains(id);
}

std::size_t SlotCache::source_count() const {
  std::shared_lock<std::shared_mutex> lock(sources_mutex_);
  return sources_.size();
}

std::size_t SlotCache::slot_count() const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  return slots_.size();
}
