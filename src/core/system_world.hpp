#ifndef SYSTEM_WORLD_HPP
#define SYSTEM_WORLD_HPP

#include "font_search.hpp"
#include "slot_cache.hpp"
#include "world.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// World backed by the local filesystem and the fonts found at startup.
class SystemWorld : public World {
public:
  SystemWorld(fs::path root, const std::vector<fs::path> &font_paths,
              bool system_fonts = true, FileReader reader = read_file);

  const fs::path &root() const override { return root_; }
  const Source &main() const override;

  std::expected<SourceId, FileError>
  resolve(const fs::path &path) const override;
  const Source &source(SourceId id) const override;
  std::expected<Buffer, FileError> file(const fs::path &path) const override;

  const FontBook &book() const override { return book_; }
  std::optional<Font> font(std::size_t index) const override;

  // Starts a new cache generation. Invalidates every SourceId handed out.
  void reset();
  void set_main(SourceId id) { main_ = id; }

  const SlotCache &cache() const { return cache_; }

private:
  struct FontSlot {
    FontLocation location;
    std::once_flag once;
    std::optional<Font> font;
  };

  fs::path root_;
  FontBook book_;
  std::vector<std::unique_ptr<FontSlot>> fonts_;
  mutable SlotCache cache_;
  std::optional<SourceId> main_;
};

#endif // SYSTEM_WORLD_HPP
