// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_SIGNAL_CHANNEL_H_
#define CLIPFORGE_CORE_SIGNAL_CHANNEL_H_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

#include "clipforge/clipforge.h"
#include "core/engine.h"

namespace clipforge {
namespace internal {

/// How long a single expected signal may take to arrive.
constexpr std::chrono::milliseconds kSignalTimeout{5000};

/// Signal type of every output lifecycle signal the recorder consumes.
constexpr char kRecordingSignalType[] = "recording";

/// Unbounded FIFO between the engine's signal callback (producer, engine
/// thread) and the recorder's start/stop calls (consumer).
///
/// Thread safety: all methods are safe to call concurrently.
class SignalChannel {
 public:
  SignalChannel() = default;

  // Non-copyable.
  SignalChannel(const SignalChannel&) = delete;
  SignalChannel& operator=(const SignalChannel&) = delete;

  /// Append a signal and wake one waiter.
  void Push(EngineSignal signal);

  /// Pop the next signal, waiting at most @p timeout. Either a signal is
  /// taken or the wait times out; never both.
  /// @return false on timeout.
  bool WaitNext(std::chrono::milliseconds timeout, EngineSignal* out);

  /// Drop all queued signals. Returns how many were dropped.
  size_t Clear();

  size_t size() const;

  /// Wait for the next signal and check it is {"recording", @p expected}.
  /// No retry: any mismatch or timeout is returned to the caller.
  /// @param out_message  Receives a description on failure (may be NULL).
  ClipForgeError AwaitSignal(const std::string& expected,
                             std::string* out_message,
                             std::chrono::milliseconds timeout = kSignalTimeout);

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<EngineSignal> queue_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_SIGNAL_CHANNEL_H_
