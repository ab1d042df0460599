// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_RECORDER_IMPL_H_
#define CLIPFORGE_CORE_RECORDER_IMPL_H_

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clipforge/clipforge.h"
#include "core/audio_track_allocator.h"
#include "core/capture_source.h"
#include "core/engine.h"
#include "core/engine_connection.h"
#include "core/preview_projector.h"
#include "core/recorder_options.h"
#include "core/settings_bridge.h"
#include "core/signal_channel.h"
#include "core/source_size_watcher.h"

namespace clipforge {
namespace internal {

/// Internal implementation of the opaque ClipForgeRecorder handle.
///
/// Drives the native engine through its lifecycle and keeps the scene and
/// audio tracks in sync with the recorder options. Every public operation
/// holds mu_; only the signal waits inside Start()/Stop() block.
class ClipForgeRecorderImpl {
 public:
  /// @param engine  Native engine; the recorder takes ownership.
  /// @param data_dir  Engine data directory; empty selects
  ///                  DefaultEngineDataDir().
  explicit ClipForgeRecorderImpl(std::unique_ptr<Engine> engine,
                                 std::string data_dir = std::string());
  ~ClipForgeRecorderImpl();

  // Non-copyable.
  ClipForgeRecorderImpl(const ClipForgeRecorderImpl&) = delete;
  ClipForgeRecorderImpl& operator=(const ClipForgeRecorderImpl&) = delete;

  // -- Error state --

  ClipForgeError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(ClipForgeError code, const std::string& message);
  void ClearError();

  // -- Lifecycle --

  ClipForgeRecorderState state() const;

  /// Open the engine connection and apply @p options. A warning no-op when
  /// the connection is already live.
  ClipForgeError Initialize(const RecorderOptions& options);

  /// Re-apply engine settings, rebuild the scene and the audio tracks.
  /// @param options  New options, or nullptr to keep the stored ones.
  ClipForgeError Reconfigure(const RecorderOptions* options);

  ClipForgeError Start();
  ClipForgeError Stop();

  /// @return 1 when the connection was closed, 0 when none was open,
  ///         kClipForgeErrorShutdownFailure if the engine failed to
  ///         disconnect.
  int Shutdown();

  // -- Queries --

  ClipForgeError GetAvailableResolutions(ClipForgeResolutionKind kind,
                                         std::vector<std::string>* out);
  ClipForgeError GetAvailableEncoders(std::vector<std::string>* out);
  ClipForgeError GetLastRecording(std::string* out_path);

  std::vector<DisplayInfo> EnumerateDisplays();

  /// Empty until the engine connection is live.
  std::vector<AudioDeviceInfo> EnumerateAudioDevices(bool is_input);

  // -- Preview --

  ClipForgeError SetupPreview(ClipForgeWindowId host_window,
                              const ClipForgeBounds& bounds, int* out_height);
  ClipForgeError ResizePreview(const ClipForgeBounds& bounds, int* out_height);

  // -- Introspection --

  OutputTrackTable tracks() const;
  RecorderOptions options() const;

  /// One size poll: rescale the scene item if the capture source changed
  /// size. Skipped while another operation holds the recorder.
  void PollSourceSize();

  /// Per-signal wait budget of Start()/Stop().
  void set_signal_timeout(std::chrono::milliseconds timeout);

 private:
  ClipForgeError ReconfigureLocked();
  void ApplyEngineSettings(const RecorderOptions& options);
  void SetRecordingEncoder(const RecorderOptions& options);
  void StartSizePoll();
  ClipForgeError AwaitSignals(const std::vector<const char*>& expected);
  ClipForgeError Fail(ClipForgeError code, const std::string& message);

  mutable std::mutex mu_;

  std::unique_ptr<Engine> engine_;
  std::string data_dir_;
  EngineConnection connection_;
  SettingsBridge settings_;
  CaptureSourceBuilder capture_builder_;
  AudioTrackAllocator tracks_;
  PreviewProjector preview_;
  SignalChannel signals_;

  RecorderOptions options_;
  ClipForgeRecorderState state_ = kClipForgeStateUninitialized;
  CaptureScene scene_;
  std::unique_ptr<ScaleTracker> scale_tracker_;
  std::chrono::milliseconds signal_timeout_ = kSignalTimeout;

  // Ticks PollSourceSize() on its own thread.
  SourceSizeWatcher size_watcher_;

  // Error state (per-recorder).
  ClipForgeError last_error_ = kClipForgeOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_RECORDER_IMPL_H_
