// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_ENGINE_H_
#define CLIPFORGE_CORE_ENGINE_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "clipforge/clipforge.h"

namespace clipforge {
namespace internal {

/// Handle of an engine source (capture input or scene). 0 means "none".
using SourceId = uint64_t;

/// Handle of an item inside a scene. 0 means "none".
using SceneItemId = uint64_t;

constexpr SourceId kNoSource = 0;

/// The engine exposes 64 output channels; channel 1 carries the mixed scene.
constexpr int kMaxOutputSlots = 64;

/// Source type identifiers understood by every engine implementation.
constexpr char kDisplayCaptureSourceType[] = "display_capture";
constexpr char kWindowCaptureSourceType[] = "window_capture";
constexpr char kAudioInputSourceType[] = "audio_input_capture";
constexpr char kAudioOutputSourceType[] = "audio_output_capture";

/// Free-form source settings (engine-specific keys, string values).
using SourceSettings = std::map<std::string, std::string>;

/// One leaf of the engine settings tree.
struct SettingsParameter {
  std::string name;
  std::string current_value;
  std::vector<std::string> values;  // Permitted values; empty = free-form.
};

/// A named group of parameters inside a category.
struct SettingsSubcategory {
  std::string name;
  std::vector<SettingsParameter> parameters;
};

/// Full settings tree of one category ("Output", "Video", ...).
using SettingsCategory = std::vector<SettingsSubcategory>;

/// Asynchronous lifecycle notification emitted by the engine.
struct EngineSignal {
  std::string type;    // "recording" for output lifecycle signals
  std::string signal;  // start | stopping | stop | wrote
  int code = 0;        // Engine error code carried by a failing "stop"
};

using SignalCallback = std::function<void(const EngineSignal&)>;

/// Physical display as seen by the engine.
struct DisplayInfo {
  int index = 0;  // 0-based
  int x = 0;
  int y = 0;
  int width = 0;   // Physical pixels
  int height = 0;  // Physical pixels
  bool is_primary = false;
  std::string name;
};

/// Audio device the engine can capture from.
struct AudioDeviceInfo {
  std::string id;           // Engine device ID
  std::string name;         // Human-readable name
  bool is_default = false;  // Whether this is the default device
  bool is_input = false;    // true = microphone, false = loopback/system audio
};

/// Abstract interface of the native capture-and-encode engine.
///
/// Mirrors the engine's own object model: reference-counted sources (scenes
/// are sources too), scene items, 64 output channels, a category/subcategory/
/// parameter settings tree and an asynchronous output-signal subscription.
///
/// Reference rules: CreateSource/CreateScene return one reference owned by
/// the caller. SetOutputSource and AddSceneItem take their own reference.
/// GetOutputSource returns an added reference the caller must release.
///
/// Linux: GStreamer (platform/linux/gst_engine.cpp)
class Engine {
 public:
  virtual ~Engine() = default;

  // Non-copyable.
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // -- Connection --

  /// Host the engine on a per-process channel. Returns false if already
  /// connected or the engine process cannot be reached.
  virtual bool Connect(const std::string& channel_id) = 0;

  /// Initialize the engine API. Returns 0 on success, a negative engine code
  /// otherwise (-2: display system unavailable, -5: video driver failure).
  virtual int InitApi(const std::string& locale, const std::string& data_dir,
                      const std::string& version) = 0;

  /// Tear the connection down. Returns false if the engine failed to
  /// disconnect cleanly.
  virtual bool Disconnect() = 0;

  // -- Settings tree --

  /// Read the whole tree of @p category. Returns false if unknown.
  virtual bool GetSettings(const std::string& category,
                           SettingsCategory* out_settings) = 0;

  /// Persist the whole tree of @p category.
  virtual bool SaveSettings(const std::string& category,
                            const SettingsCategory& settings) = 0;

  // -- Sources and scenes --

  virtual SourceId CreateSource(const std::string& type,
                                const std::string& name,
                                const SourceSettings& settings) = 0;
  virtual SourceSettings GetSourceSettings(SourceId source) = 0;
  virtual void UpdateSource(SourceId source,
                            const SourceSettings& settings) = 0;

  /// Current pixel size reported by a video source (0 when unknown).
  virtual int GetSourceWidth(SourceId source) = 0;
  virtual int GetSourceHeight(SourceId source) = 0;

  virtual void SetSourceMuted(SourceId source, bool muted) = 0;
  virtual void SetSourceAudioMixers(SourceId source, uint64_t mixers) = 0;

  /// Drop one reference; the source is destroyed at zero.
  virtual void ReleaseSource(SourceId source) = 0;

  /// Mark a source removed so scenes and outputs stop using it.
  virtual void RemoveSource(SourceId source) = 0;

  virtual SourceId CreateScene(const std::string& name) = 0;
  virtual std::string GetSourceName(SourceId source) = 0;
  virtual SceneItemId AddSceneItem(SourceId scene, SourceId source) = 0;
  virtual void SetSceneItemScale(SceneItemId item, float scale_x,
                                 float scale_y) = 0;

  // -- Output channels --

  /// Bind @p source (or kNoSource to clear) to output @p channel.
  virtual void SetOutputSource(int channel, SourceId source) = 0;
  virtual SourceId GetOutputSource(int channel) = 0;

  // -- Recording --

  virtual void StartRecording() = 0;
  virtual void StopRecording() = 0;

  /// Subscribe to output signals; invoked on an engine thread.
  virtual void ConnectOutputSignals(SignalCallback callback) = 0;
  virtual void RemoveOutputSignals() = 0;

  /// Path of the file written by the last recording ("" if none).
  virtual std::string GetLastRecording() = 0;

  // -- Preview display --

  virtual bool CreatePreviewDisplay(ClipForgeWindowId window,
                                    const std::string& scene_name,
                                    const std::string& display_id) = 0;
  virtual void DestroyPreviewDisplay(const std::string& display_id) = 0;
  virtual void SetPreviewShouldDrawUI(const std::string& display_id,
                                      bool draw_ui) = 0;
  virtual void SetPreviewPaddingSize(const std::string& display_id,
                                     int padding) = 0;
  virtual void ResizePreviewDisplay(const std::string& display_id, int width,
                                    int height) = 0;
  virtual void MovePreviewDisplay(const std::string& display_id, int x,
                                  int y) = 0;

  // -- Enumeration (synchronous, side-effect free) --

  virtual std::vector<DisplayInfo> EnumerateDisplays() = 0;
  virtual std::vector<AudioDeviceInfo> EnumerateAudioDevices(
      bool is_input) = 0;

 protected:
  Engine() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_engine.cpp.
std::unique_ptr<Engine> CreatePlatformEngine();

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_ENGINE_H_
