#pragma once

#include "core/dependency_tracker.hpp"
#include <efsw/efsw.hpp>
#include <filesystem>
#include <functional>
#include <string>

// Translates efsw callbacks into FsEvents and hands them on. Runs on efsw's
// watcher thread, so the sink must be thread-safe.
class WatchListener : public efsw::FileWatchListener {
public:
  using Sink = std::function<void(FsEvent)>;

  explicit WatchListener(Sink sink);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

  static FsEvent translate(const std::string &dir, const std::string &filename,
                           efsw::Action action,
                           const std::string &oldFilename);

private:
  Sink sink_;
};
