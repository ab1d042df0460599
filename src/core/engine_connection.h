// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_ENGINE_CONNECTION_H_
#define CLIPFORGE_CORE_ENGINE_CONNECTION_H_

#include <string>

#include "clipforge/clipforge.h"
#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Locale passed to the engine on init.
constexpr char kEngineLocale[] = "en-US";

/// Directory where the engine keeps its settings and logs:
/// $XDG_CONFIG_HOME/clipforge/engine, falling back to ~/.config and /tmp.
std::string DefaultEngineDataDir();

/// Human-readable reason for a non-zero engine init result.
std::string DescribeInitFailure(int code);

/// Owns the live connection to the native engine.
///
/// The engine is a process-wide resource: at most one EngineConnection may be
/// open at a time. Opening a second one fails with EngineInitFailure.
class EngineConnection {
 public:
  explicit EngineConnection(Engine* engine) : engine_(engine) {}
  ~EngineConnection();

  // Non-copyable.
  EngineConnection(const EngineConnection&) = delete;
  EngineConnection& operator=(const EngineConnection&) = delete;

  /// Host the engine on a fresh channel, initialize its API and subscribe
  /// @p on_signal to output signals. On failure the connection is torn down
  /// again and the process slot released.
  ClipForgeError Open(const std::string& data_dir, SignalCallback on_signal,
                      std::string* out_error);

  /// Unsubscribe from signals and disconnect. The process slot is released
  /// even if the engine fails to disconnect.
  ClipForgeError Close(std::string* out_error);

  bool live() const { return live_; }
  const std::string& channel_id() const { return channel_id_; }

  /// Whether any connection in this process is open.
  static bool AnyLive();

 private:
  void ReleaseProcessSlot();

  Engine* engine_;  // Non-owning.
  bool live_ = false;
  std::string channel_id_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_ENGINE_CONNECTION_H_
