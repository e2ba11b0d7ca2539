#include "dependency_tracker.hpp"
#include "file_id.hpp"
#include <algorithm>

std::string_view to_string(FsEvent::Kind kind) {
  switch (kind) {
  case FsEvent::Kind::Create:
    return "create";
  case FsEvent::Kind::ModifyContent:
    return "modify";
  case FsEvent::Kind::ModifyMetadata:
    return "metadata";
  case FsEvent::Kind::ModifyName:
    return "rename";
  case FsEvent::Kind::Remove:
    return "remove";
  case FsEvent::Kind::Access:
    return "access";
  case FsEvent::Kind::Other:
    break;
  }
  return "other";
}

bool DependencyTracker::touched(const fs::path &path) const {
  if (cache_.knows_path(path)) {
    return true;
  }

  auto id = FileId::resolve(path);
  return id && cache_.knows_identity(*id);
}

bool DependencyTracker::is_relevant(const FsEvent &event) const {
  switch (event.kind) {
  case FsEvent::Kind::ModifyMetadata:
  case FsEvent::Kind::Access:
  case FsEvent::Kind::Other:
    return false;
  case FsEvent::Kind::Create:
  case FsEvent::Kind::ModifyContent:
  case FsEvent::Kind::ModifyName:
  case FsEvent::Kind::Remove:
    break;
  }

  return std::any_of(event.paths.begin(), event.paths.end(),
                     [this](const fs::path &path) { return touched(path); });
}
