// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_CALLBACK_SINK_H_
#define CLIPFORGE_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "clipforge/clipforge.h"

namespace clipforge {
namespace internal {

/// spdlog sink that forwards formatted messages to the host's C callback.
///
/// Thread safety: inherits from base_sink which is guarded by Mutex. Engine
/// threads (bus watcher, size poll) log through here as well.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Passing nullptr as callback disables forwarding.
  void SetCallback(clipforge_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    spdlog::sinks::base_sink<std::mutex>::formatter_->format(msg, formatted);
    std::string text(formatted.data(), formatted.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }

    callback_(MapLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static ClipForgeLogLevel MapLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kClipForgeLogTrace;
      case spdlog::level::debug:    return kClipForgeLogDebug;
      case spdlog::level::info:     return kClipForgeLogInfo;
      case spdlog::level::warn:     return kClipForgeLogWarn;
      case spdlog::level::err:      return kClipForgeLogError;
      case spdlog::level::critical: return kClipForgeLogFatal;
      case spdlog::level::off:      return kClipForgeLogFatal;
      default:                      return kClipForgeLogInfo;
    }
  }

  clipforge_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_CALLBACK_SINK_H_
