// Copyright 2026 The clipforge Authors

#include "core/signal_channel.h"

#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

void SignalChannel::Push(EngineSignal signal) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(std::move(signal));
  }
  cv_.notify_one();
}

bool SignalChannel::WaitNext(std::chrono::milliseconds timeout,
                             EngineSignal* out) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
    return false;
  }
  if (out) *out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

size_t SignalChannel::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  size_t dropped = queue_.size();
  queue_.clear();
  return dropped;
}

size_t SignalChannel::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

ClipForgeError SignalChannel::AwaitSignal(const std::string& expected,
                                          std::string* out_message,
                                          std::chrono::milliseconds timeout) {
  EngineSignal signal;
  if (!WaitNext(timeout, &signal)) {
    if (out_message) {
      *out_message = "Engine didn't signal " + expected + " in time";
    }
    CLIPFORGE_LOG_ERROR("Engine didn't signal '{}' within {} ms", expected,
                        timeout.count());
    return kClipForgeErrorSignalTimeout;
  }

  if (signal.type != kRecordingSignalType) {
    if (out_message) {
      *out_message = "Engine signal type unexpected: '" + signal.type +
                     "' (waiting for " + expected + ")";
    }
    CLIPFORGE_LOG_ERROR("Engine signal type unexpected: type='{}' signal='{}', "
                        "expected '{}'",
                        signal.type, signal.signal, expected);
    return kClipForgeErrorUnexpectedSignalType;
  }

  if (signal.signal != expected) {
    if (out_message) {
      *out_message = "Engine signal value unexpected: got '" + signal.signal +
                     "', expected '" + expected + "'";
    }
    CLIPFORGE_LOG_ERROR("Engine signal value unexpected: got '{}' (code {}), "
                        "expected '{}'",
                        signal.signal, signal.code, expected);
    return kClipForgeErrorUnexpectedSignalValue;
  }

  CLIPFORGE_LOG_DEBUG("Asserted engine signal: {}", expected);
  return kClipForgeOk;
}

}  // namespace internal
}  // namespace clipforge
