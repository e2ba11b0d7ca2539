#include "utils/file_watcher_listener.hpp"
#include <gtest/gtest.h>
#include <vector>

TEST(WatchListenerTest, TranslatesActions) {
  EXPECT_EQ(WatchListener::translate("/doc", "a.txt", efsw::Actions::Add, "").kind,
            FsEvent::Kind::Create);
  EXPECT_EQ(
      WatchListener::translate("/doc", "a.txt", efsw::Actions::Delete, "").kind,
      FsEvent::Kind::Remove);
  EXPECT_EQ(WatchListener::translate("/doc", "a.txt", efsw::Actions::Modified,
                                     "")
                .kind,
            FsEvent::Kind::ModifyContent);
}

TEST(WatchListenerTest, MoveReportsOldAndNewPaths) {
  FsEvent event = WatchListener::translate("/doc/", "new.txt",
                                           efsw::Actions::Moved, "old.txt");

  EXPECT_EQ(event.kind, FsEvent::Kind::ModifyName);
  ASSERT_EQ(event.paths.size(), 2u);
  EXPECT_EQ(event.paths[0], fs::path("/doc/old.txt"));
  EXPECT_EQ(event.paths[1], fs::path("/doc/new.txt"));
}

TEST(WatchListenerTest, ForwardsToSinkAndSkipsDirectoryEvents) {
  std::vector<FsEvent> events;
  WatchListener listener([&events](FsEvent event) {
    events.push_back(std::move(event));
  });

  listener.handleFileAction(1, "/doc", "", efsw::Actions::Modified);
  listener.handleFileAction(1, "/doc", "ch1.txt", efsw::Actions::Modified);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].paths.front(), fs::path("/doc/ch1.txt"));
}
