#include "file_watcher_listener.hpp"

namespace fs = std::filesystem;

WatchListener::WatchListener(Sink sink) : sink_(std::move(sink)) {}

FsEvent WatchListener::translate(const std::string &dir,
                                 const std::string &filename,
                                 efsw::Action action,
                                 const std::string &oldFilename) {
  FsEvent event;
  fs::path path = (fs::path(dir) / filename).lexically_normal();

  switch (action) {
  case efsw::Actions::Add:
    event.kind = FsEvent::Kind::Create;
    break;
  case efsw::Actions::Delete:
    event.kind = FsEvent::Kind::Remove;
    break;
  case efsw::Actions::Modified:
    event.kind = FsEvent::Kind::ModifyContent;
    break;
  case efsw::Actions::Moved:
    event.kind = FsEvent::Kind::ModifyName;
    if (!oldFilename.empty()) {
      // efsw reports the old name relative to the same directory.
      event.paths.push_back((fs::path(dir) / oldFilename).lexically_normal());
    }
    break;
  default:
    event.kind = FsEvent::Kind::Other;
    break;
  }

  event.paths.push_back(std::move(path));
  return event;
}

void WatchListener::handleFileAction(efsw::WatchID watchid,
                                     const std::string &dir,
                                     const std::string &filename,
                                     efsw::Action action,
                                     std::string oldFilename) {
  (void)watchid;

  if (filename.empty()) {
    return;
  }

  sink_(translate(dir, filename, action, oldFilename));
}
