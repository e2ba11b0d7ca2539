#include "system_world.hpp"
#include <stdexcept>

SystemWorld::SystemWorld(fs::path root, const std::vector<fs::path> &font_paths,
                         bool system_fonts, FileReader reader)
    : root_(std::move(root)), cache_(std::move(reader)) {
  FontSearcher searcher;
  if (system_fonts) {
    searcher.search_system();
  }
  for (const auto &path : font_paths) {
    searcher.search_dir(path);
  }

  book_ = searcher.take_book();
  for (auto &location : searcher.take_locations()) {
    auto slot = std::make_unique<FontSlot>();
    slot->location = std::move(location);
    fonts_.push_back(std::move(slot));
  }
}

const Source &SystemWorld::main() const {
  if (!main_) {
    throw std::logic_error("no main source has been resolved");
  }
  return cache_.source_by_id(*main_);
}

std::expected<SourceId, FileError>
SystemWorld::resolve(const fs::path &path) const {
  return cache_.get_or_load_source(path);
}

const Source &SystemWorld::source(SourceId id) const {
  return cache_.source_by_id(id);
}

std::expected<Buffer, FileError>
SystemWorld::file(const fs::path &path) const {
  return cache_.get_or_load_bytes(path);
}

std::optional<Font> SystemWorld::font(std::size_t index) const {
  if (index >= fonts_.size()) {
    return std::nullopt;
  }

  // Loaded once for the lifetime of the world, unlike file slots.
  FontSlot &slot = *fonts_[index];
  std::call_once(slot.once, [&] {
    auto data = cache_.get_or_load_bytes(slot.location.path);
    if (data) {
      slot.font = Font{*data, slot.location.index};
    }
  });
  return slot.font;
}

void SystemWorld::reset() {
  cache_.reset();
  main_.reset();
}
