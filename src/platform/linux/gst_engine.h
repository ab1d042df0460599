// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_PLATFORM_LINUX_GST_ENGINE_H_
#define CLIPFORGE_PLATFORM_LINUX_GST_ENGINE_H_

#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gst/gst.h>

#include "core/engine.h"
#include "platform/linux/gst_pipeline_description.h"
#include "platform/linux/gst_settings_store.h"
#include "platform/linux/pulse_device_enumerator.h"
#include "platform/linux/x11_display_backend.h"

namespace clipforge {
namespace internal {

/// Linux capture engine on GStreamer.
///
/// Keeps the source/scene/output object model in memory and turns it into a
/// gst_parse_launch pipeline when recording starts: ximagesrc into a
/// compositor canvas, H.264 into mp4mux, and one pulsesrc per audio source
/// mixed into the AAC tracks its mixer mask selects. A bus thread reports the
/// pipeline lifecycle as output signals.
class GstEngine : public Engine {
 public:
  GstEngine() = default;
  ~GstEngine() override;

  bool Connect(const std::string& channel_id) override;
  int InitApi(const std::string& locale, const std::string& data_dir,
              const std::string& version) override;
  bool Disconnect() override;

  bool GetSettings(const std::string& category,
                   SettingsCategory* out_settings) override;
  bool SaveSettings(const std::string& category,
                    const SettingsCategory& settings) override;

  SourceId CreateSource(const std::string& type, const std::string& name,
                        const SourceSettings& settings) override;
  SourceSettings GetSourceSettings(SourceId source) override;
  void UpdateSource(SourceId source, const SourceSettings& settings) override;
  int GetSourceWidth(SourceId source) override;
  int GetSourceHeight(SourceId source) override;
  void SetSourceMuted(SourceId source, bool muted) override;
  void SetSourceAudioMixers(SourceId source, uint64_t mixers) override;
  void ReleaseSource(SourceId source) override;
  void RemoveSource(SourceId source) override;

  SourceId CreateScene(const std::string& name) override;
  std::string GetSourceName(SourceId source) override;
  SceneItemId AddSceneItem(SourceId scene, SourceId source) override;
  void SetSceneItemScale(SceneItemId item, float scale_x,
                         float scale_y) override;

  void SetOutputSource(int channel, SourceId source) override;
  SourceId GetOutputSource(int channel) override;

  void StartRecording() override;
  void StopRecording() override;
  void ConnectOutputSignals(SignalCallback callback) override;
  void RemoveOutputSignals() override;
  std::string GetLastRecording() override;

  bool CreatePreviewDisplay(ClipForgeWindowId window,
                            const std::string& scene_name,
                            const std::string& display_id) override;
  void DestroyPreviewDisplay(const std::string& display_id) override;
  void SetPreviewShouldDrawUI(const std::string& display_id,
                              bool draw_ui) override;
  void SetPreviewPaddingSize(const std::string& display_id,
                             int padding) override;
  void ResizePreviewDisplay(const std::string& display_id, int width,
                            int height) override;
  void MovePreviewDisplay(const std::string& display_id, int x,
                          int y) override;

  std::vector<DisplayInfo> EnumerateDisplays() override;
  std::vector<AudioDeviceInfo> EnumerateAudioDevices(bool is_input) override;

 private:
  struct SourceRecord {
    std::string type;
    std::string name;
    SourceSettings settings;
    int refs = 1;
    bool removed = false;
    bool muted = false;
    uint64_t mixers = 0;
    bool is_scene = false;
    std::vector<SceneItemId> items;  // Scenes only
    uint64_t window = 0;             // Window capture: resolved XID
  };

  struct ItemRecord {
    SourceId scene = kNoSource;
    SourceId source = kNoSource;
    float scale_x = 1.0f;
    float scale_y = 1.0f;
  };

  struct PreviewDisplay {
    GstElement* pipeline = nullptr;
    GstElement* sink = nullptr;
    bool draw_ui = true;
    int padding = 0;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
  };

  // All private helpers expect mu_ to be held.
  SourceRecord* FindSource(SourceId source);
  void AddRef(SourceId source);
  void Unref(SourceId source);
  bool SourceSize(SourceRecord* record, int* width, int* height);
  uint64_t ResolveWindow(SourceRecord* record);
  const ItemRecord* FirstItem(SourceId scene, SceneItemId* out_id);
  VideoInput ResolveVideoInput(SourceId scene);
  Resolution SettingResolution(const char* parameter);
  SettingsChoices ProbeChoices();
  std::string NextRecordingPath();
  void ApplyCanvasItemSize(SceneItemId item);
  void ApplyRenderRectangle(PreviewDisplay* preview);
  void DestroyPreviewLocked(const std::string& display_id);
  void TeardownRecording();

  void Emit(const std::string& signal, int code = 0);
  void BusLoop(GstElement* pipeline, std::string path);

  std::mutex mu_;
  bool connected_ = false;
  bool initialized_ = false;
  std::string channel_id_;
  std::string data_dir_;

  X11DisplayBackend x11_;
  PulseDeviceEnumerator pulse_;
  GstSettingsStore settings_;

  std::map<SourceId, SourceRecord> sources_;
  std::map<SceneItemId, ItemRecord> items_;
  std::array<SourceId, kMaxOutputSlots> channels_{};
  SourceId next_source_id_ = 1;
  SceneItemId next_item_id_ = 1;

  // Recording pipeline.
  GstElement* pipeline_ = nullptr;
  GstElement* canvas_ = nullptr;
  std::thread bus_thread_;
  std::atomic<bool> bus_running_{false};
  std::atomic<int> end_code_{0};  // Code of the "stop" the bus thread sent

  // Written by the bus thread.
  std::mutex recording_mu_;
  std::string last_recording_;

  std::map<std::string, PreviewDisplay> previews_;

  std::mutex signal_mu_;
  SignalCallback signal_callback_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_PLATFORM_LINUX_GST_ENGINE_H_
