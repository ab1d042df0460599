// Copyright 2026 The clipforge Authors
// Tests for: ScaleTracker, SourceSizeWatcher

#include <atomic>
#include <chrono>
#include <thread>

#include "core/source_size_watcher.h"
#include "gtest/gtest.h"

using clipforge::internal::Resolution;
using clipforge::internal::ScaleTracker;
using clipforge::internal::SourceSizeWatcher;

// ---------------------------------------------------------------------------
// ScaleTracker
// ---------------------------------------------------------------------------

TEST(ScaleTrackerTest, FirstNonZeroSizeProducesScale) {
  ScaleTracker tracker(Resolution{1920, 1080});
  float scale = 0.0f;
  ASSERT_TRUE(tracker.Update(960, 540, &scale));
  EXPECT_FLOAT_EQ(scale, 2.0f);
  EXPECT_EQ(tracker.last(), (Resolution{960, 540}));
}

TEST(ScaleTrackerTest, ZeroSizeIsIgnored) {
  ScaleTracker tracker(Resolution{1920, 1080});
  float scale = -1.0f;
  EXPECT_FALSE(tracker.Update(0, 0, &scale));
  EXPECT_FALSE(tracker.Update(1920, 0, &scale));
  EXPECT_FLOAT_EQ(scale, -1.0f);
}

TEST(ScaleTrackerTest, UnchangedSizeIsIgnored) {
  ScaleTracker tracker(Resolution{1920, 1080});
  float scale = 0.0f;
  ASSERT_TRUE(tracker.Update(1280, 720, &scale));
  EXPECT_FALSE(tracker.Update(1280, 720, &scale));
  ASSERT_TRUE(tracker.Update(3840, 2160, &scale));
  EXPECT_FLOAT_EQ(scale, 0.5f);
}

TEST(ScaleTrackerTest, ScaleUsesWidthOnly) {
  ScaleTracker tracker(Resolution{1920, 1080});
  float scale = 0.0f;
  ASSERT_TRUE(tracker.Update(1920, 1200, &scale));
  EXPECT_FLOAT_EQ(scale, 1.0f);
}

// ---------------------------------------------------------------------------
// SourceSizeWatcher
// ---------------------------------------------------------------------------

TEST(SourceSizeWatcherTest, TicksUntilStopped) {
  std::atomic<int> ticks{0};
  SourceSizeWatcher watcher;
  ASSERT_TRUE(watcher.Start([&ticks] { ++ticks; },
                            std::chrono::milliseconds(5)));
  EXPECT_TRUE(watcher.running());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (ticks < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  watcher.Stop();
  EXPECT_GE(ticks.load(), 3);
  EXPECT_FALSE(watcher.running());

  int after_stop = ticks.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(ticks.load(), after_stop);
}

TEST(SourceSizeWatcherTest, StopIsPromptWithLongInterval) {
  SourceSizeWatcher watcher;
  ASSERT_TRUE(watcher.Start([] {}, std::chrono::hours(1)));
  auto begin = std::chrono::steady_clock::now();
  watcher.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST(SourceSizeWatcherTest, RestartReplacesPreviousTimer) {
  std::atomic<int> first{0};
  std::atomic<int> second{0};
  SourceSizeWatcher watcher;
  ASSERT_TRUE(watcher.Start([&first] { ++first; },
                            std::chrono::milliseconds(5)));
  ASSERT_TRUE(watcher.Start([&second] { ++second; },
                            std::chrono::milliseconds(5)));
  int first_at_restart = first.load();

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (second < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  watcher.Stop();
  EXPECT_EQ(first.load(), first_at_restart);
  EXPECT_GE(second.load(), 2);
}

TEST(SourceSizeWatcherTest, StopWithoutStartIsSafe) {
  SourceSizeWatcher watcher;
  watcher.Stop();
  EXPECT_FALSE(watcher.running());
}
