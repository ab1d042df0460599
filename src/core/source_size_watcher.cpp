// Copyright 2026 The clipforge Authors

#include "core/source_size_watcher.h"

#include <system_error>
#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

bool ScaleTracker::Update(int width, int height, float* out_scale) {
  if (width == 0 || height == 0) return false;
  if (width == last_.width && height == last_.height) return false;

  last_.width = width;
  last_.height = height;
  *out_scale = static_cast<float>(base_.width) / static_cast<float>(width);
  return true;
}

bool SourceSizeWatcher::Start(std::function<void()> tick,
                              std::chrono::milliseconds interval) {
  Stop();

  std::lock_guard<std::mutex> lock(mu_);
  stop_requested_ = false;
  try {
    thread_ = std::thread(&SourceSizeWatcher::Loop, this, std::move(tick),
                          interval);
  } catch (const std::system_error& e) {
    CLIPFORGE_LOG_ERROR("Cannot start source size watcher: {}", e.what());
    return false;
  }
  CLIPFORGE_LOG_DEBUG("Source size watcher started ({} ms)", interval.count());
  return true;
}

void SourceSizeWatcher::Stop() {
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!thread_.joinable()) return;
    stop_requested_ = true;
    thread = std::move(thread_);
  }
  cv_.notify_all();
  thread.join();
  CLIPFORGE_LOG_DEBUG("Source size watcher stopped");
}

bool SourceSizeWatcher::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return thread_.joinable();
}

void SourceSizeWatcher::Loop(std::function<void()> tick,
                             std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
      return;
    }
    lock.unlock();
    tick();
    lock.lock();
  }
}

}  // namespace internal
}  // namespace clipforge
