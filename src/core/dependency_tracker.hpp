#pragma once

#include "slot_cache.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// A filesystem notification, independent of the watcher backend.
struct FsEvent {
  enum class Kind {
    Create,
    ModifyContent,
    ModifyMetadata,
    ModifyName,
    Remove,
    Access,
    Other
  };

  Kind kind = Kind::Other;
  // A rename carries the old path first and the new path second.
  std::vector<fs::path> paths;
};

std::string_view to_string(FsEvent::Kind kind);

// Answers whether a filesystem change can affect the next compilation, based
// on what the cache recorded during the most recent one.
class DependencyTracker {
public:
  explicit DependencyTracker(const SlotCache &cache) : cache_(cache) {}

  bool touched(const fs::path &path) const;
  bool is_relevant(const FsEvent &event) const;

private:
  const SlotCache &cache_;
};
