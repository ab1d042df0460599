// Copyright 2026 The clipforge Authors

#include "core/engine_connection.h"

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

std::atomic<bool> g_connection_claimed{false};

/// "clipforge-<pid>-<64 random bits>", unique per connection attempt.
std::string MakeChannelId() {
  std::random_device rd;
  uint64_t bits = (static_cast<uint64_t>(rd()) << 32) | rd();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "clipforge-%d-%016llx",
                static_cast<int>(getpid()),
                static_cast<unsigned long long>(bits));
  return buf;
}

}  // namespace

std::string DefaultEngineDataDir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0] != '\0') return std::string(xdg) + "/clipforge/engine";

  const char* home = std::getenv("HOME");
  if (home && home[0] != '\0') {
    return std::string(home) + "/.config/clipforge/engine";
  }
  return "/tmp/clipforge/engine";
}

std::string DescribeInitFailure(int code) {
  switch (code) {
    case -2:
      return "The X11 display could not be opened. Make sure a graphical "
             "session is running and DISPLAY is set, then try again.";
    case -5:
      return "Failed to initialize the capture engine. Your video drivers may "
             "be out of date, or the engine may not be supported on your "
             "system.";
    default:
      return "An unknown error #" + std::to_string(code) +
             " was encountered while initializing the capture engine.";
  }
}

EngineConnection::~EngineConnection() {
  if (!live_) return;
  std::string error;
  if (Close(&error) != kClipForgeOk) {
    CLIPFORGE_LOG_ERROR("Engine connection not closed cleanly: {}", error);
  }
}

bool EngineConnection::AnyLive() {
  return g_connection_claimed.load(std::memory_order_acquire);
}

ClipForgeError EngineConnection::Open(const std::string& data_dir,
                                      SignalCallback on_signal,
                                      std::string* out_error) {
  if (live_) return kClipForgeOk;

  bool expected = false;
  if (!g_connection_claimed.compare_exchange_strong(expected, true)) {
    *out_error = "Another recorder already holds the engine connection";
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorEngineInitFailure;
  }

  channel_id_ = MakeChannelId();
  CLIPFORGE_LOG_DEBUG("Initializing engine on channel {}", channel_id_);

  if (!engine_->Connect(channel_id_)) {
    *out_error = "Could not connect to the capture engine";
    CLIPFORGE_LOG_ERROR("{} (channel {})", *out_error, channel_id_);
    ReleaseProcessSlot();
    return kClipForgeErrorEngineInitFailure;
  }

  int result = engine_->InitApi(kEngineLocale, data_dir,
                                CLIPFORGE_VERSION_STRING);
  if (result != 0) {
    *out_error = DescribeInitFailure(result);
    CLIPFORGE_LOG_ERROR("Engine init failure: {}", *out_error);
    if (!engine_->Disconnect()) {
      CLIPFORGE_LOG_WARN("Engine did not disconnect after init failure");
    }
    ReleaseProcessSlot();
    return kClipForgeErrorEngineInitFailure;
  }

  engine_->ConnectOutputSignals(std::move(on_signal));
  live_ = true;
  CLIPFORGE_LOG_DEBUG("Engine initialized (data dir {})", data_dir);
  return kClipForgeOk;
}

ClipForgeError EngineConnection::Close(std::string* out_error) {
  if (!live_) return kClipForgeOk;

  CLIPFORGE_LOG_DEBUG("Shutting down engine connection {}", channel_id_);
  engine_->RemoveOutputSignals();
  bool disconnected = engine_->Disconnect();
  std::string channel = channel_id_;

  live_ = false;
  ReleaseProcessSlot();

  if (!disconnected) {
    *out_error = "Engine failed to disconnect from channel " + channel;
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorShutdownFailure;
  }
  CLIPFORGE_LOG_DEBUG("Engine shutdown successfully");
  return kClipForgeOk;
}

void EngineConnection::ReleaseProcessSlot() {
  g_connection_claimed.store(false, std::memory_order_release);
  channel_id_.clear();
}

}  // namespace internal
}  // namespace clipforge
