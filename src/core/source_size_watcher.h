// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_SOURCE_SIZE_WATCHER_H_
#define CLIPFORGE_CORE_SOURCE_SIZE_WATCHER_H_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "core/resolution.h"

namespace clipforge {
namespace internal {

/// Interval between two polls of the capture source size.
constexpr std::chrono::milliseconds kSizePollInterval{5000};

/// Decides when the scene item must be re-scaled. Pure, no engine access.
class ScaleTracker {
 public:
  explicit ScaleTracker(const Resolution& base) : base_(base) {}

  /// Feed the size the source currently reports.
  /// @return true with @p out_scale set when the size is non-zero and
  ///         differs from the previously applied one.
  bool Update(int width, int height, float* out_scale);

  const Resolution& base() const { return base_; }
  const Resolution& last() const { return last_; }

 private:
  Resolution base_;
  Resolution last_;  // 0x0 until the first non-zero report.
};

/// Runs a callback on a background thread at a fixed interval.
///
/// One timer at a time: Start() cancels any previous one first. Stop() and
/// the destructor join the thread, so the callback never outlives the owner.
class SourceSizeWatcher {
 public:
  SourceSizeWatcher() = default;
  ~SourceSizeWatcher() { Stop(); }

  // Non-copyable.
  SourceSizeWatcher(const SourceSizeWatcher&) = delete;
  SourceSizeWatcher& operator=(const SourceSizeWatcher&) = delete;

  /// @return false when the polling thread could not be created.
  bool Start(std::function<void()> tick,
             std::chrono::milliseconds interval = kSizePollInterval);
  void Stop();

  bool running() const;

 private:
  void Loop(std::function<void()> tick, std::chrono::milliseconds interval);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::thread thread_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_SOURCE_SIZE_WATCHER_H_
