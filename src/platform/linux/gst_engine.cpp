// Copyright 2026 The clipforge Authors

#include "platform/linux/gst_engine.h"

#if defined(__linux__)

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <utility>

#include <gst/video/videooverlay.h>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

/// Engine init results understood by the recorder.
constexpr int kInitNotConnected = -1;
constexpr int kInitDisplayUnavailable = -2;
constexpr int kInitDriverFailure = -5;

/// Codes carried by a failing "stop" signal.
constexpr int kStopPipelineError = -1;
constexpr int kStopNoEncoder = -3;
constexpr int kStopLaunchFailed = -4;

/// H.264 encoders in the order the engine lists them. Hardware encoders come
/// last so automatic selection prefers them.
const char* const kEncoderCandidates[] = {"x264enc", "openh264enc",
                                          "vaapih264enc", "nvh264enc"};

const char* const kAacCandidates[] = {"fdkaacenc", "avenc_aac", "voaacenc"};

/// Elements every recording pipeline needs.
const char* const kRequiredElements[] = {"ximagesrc", "compositor",
                                         "videoconvert", "videoscale",
                                         "h264parse", "mp4mux", "filesink"};

bool HasElement(const char* name) {
  GstElementFactory* factory = gst_element_factory_find(name);
  if (!factory) return false;
  gst_object_unref(factory);
  return true;
}

/// Split "title:class:executable" from the right; titles may contain ':'.
void SplitWindowSetting(const std::string& value, std::string* title,
                        std::string* window_class, std::string* executable) {
  size_t last = value.rfind(':');
  size_t middle =
      last == std::string::npos || last == 0 ? std::string::npos
                                             : value.rfind(':', last - 1);
  if (last == std::string::npos || middle == std::string::npos) {
    *title = value;
    window_class->clear();
    executable->clear();
    return;
  }
  *title = value.substr(0, middle);
  *window_class = value.substr(middle + 1, last - middle - 1);
  *executable = value.substr(last + 1);
}

int ToInt(const SourceSettings& settings, const char* key, int fallback) {
  auto it = settings.find(key);
  if (it == settings.end()) return fallback;
  char* end = nullptr;
  long value = std::strtol(it->second.c_str(), &end, 10);
  return end == it->second.c_str() ? fallback : static_cast<int>(value);
}

}  // namespace

GstEngine::~GstEngine() {
  if (connected_) Disconnect();
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

bool GstEngine::Connect(const std::string& channel_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (connected_) {
    CLIPFORGE_LOG_ERROR("Engine already connected on channel {}", channel_id_);
    return false;
  }
  connected_ = true;
  channel_id_ = channel_id;
  return true;
}

int GstEngine::InitApi(const std::string& locale, const std::string& data_dir,
                       const std::string& version) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connected_) return kInitNotConnected;

  GError* error = nullptr;
  if (!gst_init_check(nullptr, nullptr, &error)) {
    CLIPFORGE_LOG_ERROR("GStreamer init failed: {}",
                        error ? error->message : "unknown");
    if (error) g_error_free(error);
    return kInitDriverFailure;
  }

  if (!x11_.Open()) return kInitDisplayUnavailable;

  for (const char* element : kRequiredElements) {
    if (!HasElement(element)) {
      CLIPFORGE_LOG_ERROR("GStreamer element '{}' is not installed", element);
      return kInitDriverFailure;
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(data_dir, ec);
  if (ec) {
    CLIPFORGE_LOG_WARN("Cannot create engine data dir {}: {}", data_dir,
                       ec.message());
  }
  data_dir_ = data_dir;

  settings_.Reset(ProbeChoices());
  settings_.Load(data_dir + "/settings.ini");

  initialized_ = true;
  CLIPFORGE_LOG_INFO("GStreamer engine {} ready (clipforge {}, locale {}, "
                     "display {})",
                     gst_version_string(), version, locale,
                     x11_.display_name());
  return 0;
}

bool GstEngine::Disconnect() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connected_) return false;

  TeardownRecording();
  while (!previews_.empty()) DestroyPreviewLocked(previews_.begin()->first);

  sources_.clear();
  items_.clear();
  channels_.fill(kNoSource);
  x11_.Close();

  connected_ = false;
  initialized_ = false;
  CLIPFORGE_LOG_DEBUG("Engine channel {} disconnected", channel_id_);
  channel_id_.clear();
  return true;
}

SettingsChoices GstEngine::ProbeChoices() {
  SettingsChoices choices;
  for (const char* encoder : kEncoderCandidates) {
    if (HasElement(encoder)) choices.encoders.push_back(encoder);
  }
  if (choices.encoders.empty()) {
    CLIPFORGE_LOG_WARN("No H.264 encoder element is installed");
  }

  std::vector<std::string> common = CommonResolutions();
  for (const auto& display : x11_.GetDisplays()) {
    std::string native =
        FormatResolution(Resolution{display.width, display.height});
    if (std::find(choices.base_resolutions.begin(),
                  choices.base_resolutions.end(),
                  native) == choices.base_resolutions.end()) {
      choices.base_resolutions.push_back(native);
    }
  }
  for (const auto& res : common) {
    if (std::find(choices.base_resolutions.begin(),
                  choices.base_resolutions.end(),
                  res) == choices.base_resolutions.end()) {
      choices.base_resolutions.push_back(res);
    }
  }
  choices.output_resolutions = common;
  return choices;
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

bool GstEngine::GetSettings(const std::string& category,
                            SettingsCategory* out_settings) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return false;
  return settings_.Get(category, out_settings);
}

bool GstEngine::SaveSettings(const std::string& category,
                             const SettingsCategory& settings) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return false;
  return settings_.Save(category, settings);
}

// ---------------------------------------------------------------------------
// Sources and scenes
// ---------------------------------------------------------------------------

GstEngine::SourceRecord* GstEngine::FindSource(SourceId source) {
  auto it = sources_.find(source);
  return it == sources_.end() ? nullptr : &it->second;
}

void GstEngine::AddRef(SourceId source) {
  SourceRecord* record = FindSource(source);
  if (record) ++record->refs;
}

void GstEngine::Unref(SourceId source) {
  SourceRecord* record = FindSource(source);
  if (!record) return;
  if (--record->refs > 0) return;

  std::vector<SceneItemId> items = std::move(record->items);
  CLIPFORGE_LOG_TRACE("Destroying source '{}' ({})", record->name, source);
  sources_.erase(source);

  for (SceneItemId item : items) {
    auto it = items_.find(item);
    if (it == items_.end()) continue;
    SourceId child = it->second.source;
    items_.erase(it);
    Unref(child);
  }
}

SourceId GstEngine::CreateSource(const std::string& type,
                                 const std::string& name,
                                 const SourceSettings& settings) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return kNoSource;

  if (type != kDisplayCaptureSourceType && type != kWindowCaptureSourceType &&
      type != kAudioInputSourceType && type != kAudioOutputSourceType) {
    CLIPFORGE_LOG_ERROR("Unknown source type '{}'", type);
    return kNoSource;
  }

  SourceId id = next_source_id_++;
  SourceRecord record;
  record.type = type;
  record.name = name;
  record.settings = settings;
  sources_.emplace(id, std::move(record));
  return id;
}

SourceSettings GstEngine::GetSourceSettings(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  return record ? record->settings : SourceSettings();
}

void GstEngine::UpdateSource(SourceId source, const SourceSettings& settings) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  if (!record) return;
  for (const auto& kv : settings) record->settings[kv.first] = kv.second;
  record->window = 0;
}

uint64_t GstEngine::ResolveWindow(SourceRecord* record) {
  int width = 0;
  int height = 0;
  if (record->window != 0 &&
      x11_.GetWindowSize(record->window, &width, &height)) {
    return record->window;
  }

  std::string title, window_class, executable;
  auto it = record->settings.find("window");
  if (it == record->settings.end()) return 0;
  SplitWindowSetting(it->second, &title, &window_class, &executable);
  record->window = x11_.FindWindow(title, window_class, executable);
  return record->window;
}

bool GstEngine::SourceSize(SourceRecord* record, int* width, int* height) {
  if (record->type == kDisplayCaptureSourceType) {
    int index = ToInt(record->settings, "monitor", 0);
    for (const auto& display : x11_.GetDisplays()) {
      if (display.index != index) continue;
      *width = display.width;
      *height = display.height;
      return true;
    }
    return false;
  }
  if (record->type == kWindowCaptureSourceType) {
    uint64_t window = ResolveWindow(record);
    return window != 0 && x11_.GetWindowSize(window, width, height);
  }
  return false;
}

int GstEngine::GetSourceWidth(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  int width = 0;
  int height = 0;
  if (!record || !SourceSize(record, &width, &height)) return 0;
  return width;
}

int GstEngine::GetSourceHeight(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  int width = 0;
  int height = 0;
  if (!record || !SourceSize(record, &width, &height)) return 0;
  return height;
}

void GstEngine::SetSourceMuted(SourceId source, bool muted) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  if (record) record->muted = muted;
}

void GstEngine::SetSourceAudioMixers(SourceId source, uint64_t mixers) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  if (record) record->mixers = mixers;
}

void GstEngine::ReleaseSource(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  Unref(source);
}

void GstEngine::RemoveSource(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  if (record) record->removed = true;
}

SourceId GstEngine::CreateScene(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return kNoSource;

  SourceId id = next_source_id_++;
  SourceRecord record;
  record.type = "scene";
  record.name = name;
  record.is_scene = true;
  sources_.emplace(id, std::move(record));
  return id;
}

std::string GstEngine::GetSourceName(SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* record = FindSource(source);
  return record ? record->name : std::string();
}

SceneItemId GstEngine::AddSceneItem(SourceId scene, SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  SourceRecord* scene_record = FindSource(scene);
  SourceRecord* source_record = FindSource(source);
  if (!scene_record || !scene_record->is_scene || !source_record ||
      source_record->is_scene) {
    return 0;
  }

  SceneItemId id = next_item_id_++;
  ItemRecord item;
  item.scene = scene;
  item.source = source;
  items_.emplace(id, item);
  scene_record->items.push_back(id);
  ++source_record->refs;
  return id;
}

void GstEngine::SetSceneItemScale(SceneItemId item, float scale_x,
                                  float scale_y) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = items_.find(item);
  if (it == items_.end()) return;
  it->second.scale_x = scale_x;
  it->second.scale_y = scale_y;
  ApplyCanvasItemSize(item);
}

const GstEngine::ItemRecord* GstEngine::FirstItem(SourceId scene,
                                                  SceneItemId* out_id) {
  SourceRecord* record = FindSource(scene);
  if (!record || !record->is_scene || record->items.empty()) return nullptr;
  auto it = items_.find(record->items.front());
  if (it == items_.end()) return nullptr;
  if (out_id) *out_id = it->first;
  return &it->second;
}

// ---------------------------------------------------------------------------
// Output channels
// ---------------------------------------------------------------------------

void GstEngine::SetOutputSource(int channel, SourceId source) {
  std::lock_guard<std::mutex> lock(mu_);
  if (channel < 0 || channel >= kMaxOutputSlots) return;

  SourceId previous = channels_[channel];
  if (source != kNoSource) {
    if (!FindSource(source)) return;
    AddRef(source);
  }
  channels_[channel] = source;
  if (previous != kNoSource) Unref(previous);
}

SourceId GstEngine::GetOutputSource(int channel) {
  std::lock_guard<std::mutex> lock(mu_);
  if (channel < 0 || channel >= kMaxOutputSlots) return kNoSource;
  SourceId source = channels_[channel];
  if (source != kNoSource) AddRef(source);
  return source;
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

Resolution GstEngine::SettingResolution(const char* parameter) {
  Resolution res;
  if (!ParseResolution(settings_.Value("Video", parameter), &res)) {
    res = Resolution{1920, 1080};
  }
  return res;
}

VideoInput GstEngine::ResolveVideoInput(SourceId scene) {
  VideoInput input;
  input.display_name = x11_.display_name();
  input.item = SettingResolution("Base");

  const ItemRecord* item = FirstItem(scene, nullptr);
  if (!item) {
    CLIPFORGE_LOG_WARN("Scene has no video item; recording a blank canvas");
    return input;
  }
  SourceRecord* source = FindSource(item->source);
  if (!source || source->removed) return input;

  if (source->type == kDisplayCaptureSourceType) {
    input.kind = VideoInput::Kind::kScreen;
    input.screen = ToInt(source->settings, "monitor", 0);
  } else if (source->type == kWindowCaptureSourceType) {
    input.xid = ResolveWindow(source);
    if (input.xid == 0) {
      CLIPFORGE_LOG_WARN("Capture window '{}' not found; recording a blank "
                         "canvas",
                         source->settings["window"]);
      return input;
    }
    input.kind = VideoInput::Kind::kWindow;
    input.show_pointer = source->settings["capture_cursor"] != "false";
  }

  int width = 0;
  int height = 0;
  if (SourceSize(source, &width, &height)) {
    input.item.width = static_cast<int>(std::lround(width * item->scale_x));
    input.item.height = static_cast<int>(std::lround(height * item->scale_y));
  }
  return input;
}

std::string GstEngine::NextRecordingPath() {
  std::string dir = settings_.Value("Output", "RecFilePath");
  if (dir.empty()) dir = data_dir_;

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);

  char stamp[32];
  std::time_t now = std::time(nullptr);
  std::tm local_tm;
  localtime_r(&now, &local_tm);
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H-%M-%S", &local_tm);

  std::string format = settings_.Value("Output", "RecFormat");
  if (format.empty()) format = "mp4";
  return (std::filesystem::path(dir) / (std::string(stamp) + "." + format))
      .string();
}

void GstEngine::StartRecording() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    CLIPFORGE_LOG_ERROR("StartRecording before engine init");
    return;
  }
  if (bus_running_.load(std::memory_order_acquire)) {
    CLIPFORGE_LOG_WARN("Recording already active");
    return;
  }
  TeardownRecording();

  RecordingGraph graph;
  graph.video = ResolveVideoInput(channels_[1]);
  graph.base = SettingResolution("Base");
  graph.output = SettingResolution("Output");
  graph.fps = static_cast<int>(settings_.IntValue("Video", "FPSCommon", 30));
  if (graph.fps <= 0) graph.fps = 30;

  graph.encoder.factory = settings_.Value("Output", "RecEncoder");
  if (graph.encoder.factory.empty()) {
    CLIPFORGE_LOG_ERROR("No recording encoder configured");
    Emit("stop", kStopNoEncoder);
    return;
  }
  graph.encoder.bitrate_bps = settings_.IntValue("Output", "Recbitrate", 2500);
  graph.encoder.max_kbps = settings_.IntValue("Output", "Recmax_bitrate", 0);
  graph.encoder.vbr = settings_.Value("Output", "Recrate_control") == "VBR";

  for (const char* aac : kAacCandidates) {
    if (HasElement(aac)) {
      graph.audio_encoder = aac;
      break;
    }
  }
  if (graph.audio_encoder.empty()) {
    CLIPFORGE_LOG_WARN("No AAC encoder installed; recording video only");
  }

  graph.recorded_tracks =
      static_cast<uint64_t>(settings_.IntValue("Output", "RecTracks", 1));
  for (int channel = 2; channel < kMaxOutputSlots; ++channel) {
    SourceRecord* source = FindSource(channels_[channel]);
    if (!source || source->removed) continue;
    if (source->type != kAudioInputSourceType &&
        source->type != kAudioOutputSourceType) {
      continue;
    }
    AudioInput audio;
    audio.device = source->settings["device_id"];
    audio.muted = source->muted;
    audio.mixers = source->mixers;
    graph.audio.push_back(std::move(audio));
  }

  graph.container = settings_.Value("Output", "RecFormat");
  graph.location = NextRecordingPath();

  std::string description = DescribeRecordingPipeline(graph);
  CLIPFORGE_LOG_DEBUG("Recording pipeline: {}", description);

  GError* error = nullptr;
  GstElement* pipeline = gst_parse_launch(description.c_str(), &error);
  if (!pipeline || error) {
    CLIPFORGE_LOG_ERROR("GStreamer pipeline creation failed: {}",
                        error ? error->message : "unknown");
    if (error) g_error_free(error);
    if (pipeline) gst_object_unref(pipeline);
    Emit("stop", kStopLaunchFailed);
    return;
  }

  pipeline_ = pipeline;
  canvas_ = gst_bin_get_by_name(GST_BIN(pipeline_), kCanvasElement);

  end_code_.store(0, std::memory_order_release);
  bus_running_.store(true, std::memory_order_release);
  bus_thread_ = std::thread(&GstEngine::BusLoop, this,
                            GST_ELEMENT(gst_object_ref(pipeline_)),
                            graph.location);

  if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) ==
      GST_STATE_CHANGE_FAILURE) {
    CLIPFORGE_LOG_ERROR("Failed to set GStreamer pipeline to PLAYING");
    TeardownRecording();
    Emit("stop", kStopPipelineError);
    return;
  }
  CLIPFORGE_LOG_INFO("Recording to {} ({}x{} -> {}x{} @{}fps, {}, {} audio "
                     "source(s))",
                     graph.location, graph.base.width, graph.base.height,
                     graph.output.width, graph.output.height, graph.fps,
                     graph.encoder.factory, graph.audio.size());
}

void GstEngine::StopRecording() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!pipeline_) {
    CLIPFORGE_LOG_WARN("StopRecording without an active recording");
    return;
  }
  if (!bus_running_.load(std::memory_order_acquire)) {
    // The pipeline already ended by itself; its own "stop" was reported
    // then. Complete the handshake so the caller leaves the recording state.
    CLIPFORGE_LOG_WARN("Recording had already ended (code {})",
                       end_code_.load(std::memory_order_acquire));
    Emit("stopping");
    Emit("stop");
    Emit("wrote");
    return;
  }

  Emit("stopping");
  // Let the muxer finalize the file before the pipeline goes down.
  gst_element_send_event(pipeline_, gst_event_new_eos());
}

void GstEngine::TeardownRecording() {
  bus_running_.store(false, std::memory_order_release);
  if (bus_thread_.joinable()) bus_thread_.join();

  if (canvas_) {
    gst_object_unref(canvas_);
    canvas_ = nullptr;
  }
  if (pipeline_) {
    gst_element_set_state(pipeline_, GST_STATE_NULL);
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;
  }
}

void GstEngine::ApplyCanvasItemSize(SceneItemId item) {
  if (!canvas_) return;
  SceneItemId first = 0;
  const ItemRecord* record = FirstItem(channels_[1], &first);
  if (!record || first != item) return;

  SourceRecord* source = FindSource(record->source);
  int width = 0;
  int height = 0;
  if (!source || !SourceSize(source, &width, &height)) return;

  GstPad* pad = gst_element_get_static_pad(canvas_, "sink_0");
  if (!pad) return;
  g_object_set(pad, "width",
               static_cast<gint>(std::lround(width * record->scale_x)),
               "height",
               static_cast<gint>(std::lround(height * record->scale_y)),
               nullptr);
  gst_object_unref(pad);
}

void GstEngine::BusLoop(GstElement* pipeline, std::string path) {
  GstBus* bus = gst_element_get_bus(pipeline);
  bool started = false;

  while (bus_running_.load(std::memory_order_acquire)) {
    GstMessage* msg = gst_bus_timed_pop_filtered(
        bus, 100 * GST_MSECOND,
        static_cast<GstMessageType>(GST_MESSAGE_STATE_CHANGED |
                                    GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
    if (!msg) continue;

    switch (GST_MESSAGE_TYPE(msg)) {
      case GST_MESSAGE_STATE_CHANGED: {
        if (GST_MESSAGE_SRC(msg) != GST_OBJECT(pipeline) || started) break;
        GstState old_state, new_state;
        gst_message_parse_state_changed(msg, &old_state, &new_state, nullptr);
        if (new_state == GST_STATE_PLAYING) {
          started = true;
          Emit("start");
        }
        break;
      }
      case GST_MESSAGE_EOS:
        gst_element_set_state(pipeline, GST_STATE_NULL);
        {
          std::lock_guard<std::mutex> lock(recording_mu_);
          last_recording_ = path;
        }
        CLIPFORGE_LOG_INFO("Recording written: {}", path);
        Emit("stop");
        Emit("wrote");
        bus_running_.store(false, std::memory_order_release);
        break;
      case GST_MESSAGE_ERROR: {
        GError* err = nullptr;
        gchar* debug = nullptr;
        gst_message_parse_error(msg, &err, &debug);
        CLIPFORGE_LOG_ERROR("GStreamer pipeline error: {} ({})",
                            err ? err->message : "unknown",
                            debug ? debug : "");
        if (err) g_error_free(err);
        g_free(debug);
        gst_element_set_state(pipeline, GST_STATE_NULL);
        end_code_.store(kStopPipelineError, std::memory_order_release);
        Emit("stop", kStopPipelineError);
        bus_running_.store(false, std::memory_order_release);
        break;
      }
      default:
        break;
    }
    gst_message_unref(msg);
  }

  gst_object_unref(bus);
  gst_object_unref(pipeline);
}

void GstEngine::ConnectOutputSignals(SignalCallback callback) {
  std::lock_guard<std::mutex> lock(signal_mu_);
  signal_callback_ = std::move(callback);
}

void GstEngine::RemoveOutputSignals() {
  std::lock_guard<std::mutex> lock(signal_mu_);
  signal_callback_ = nullptr;
}

void GstEngine::Emit(const std::string& signal, int code) {
  std::lock_guard<std::mutex> lock(signal_mu_);
  if (!signal_callback_) return;
  EngineSignal s;
  s.type = "recording";
  s.signal = signal;
  s.code = code;
  signal_callback_(s);
}

std::string GstEngine::GetLastRecording() {
  std::lock_guard<std::mutex> lock(recording_mu_);
  return last_recording_;
}

// ---------------------------------------------------------------------------
// Preview display
// ---------------------------------------------------------------------------

bool GstEngine::CreatePreviewDisplay(ClipForgeWindowId window,
                                     const std::string& scene_name,
                                     const std::string& display_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) return false;

  // The newest scene of that name wins.
  SourceId scene = kNoSource;
  for (const auto& kv : sources_) {
    if (kv.second.is_scene && !kv.second.removed &&
        kv.second.name == scene_name) {
      scene = kv.first;
    }
  }
  if (scene == kNoSource) {
    CLIPFORGE_LOG_ERROR("No scene named '{}' for preview", scene_name);
    return false;
  }

  DestroyPreviewLocked(display_id);

  int fps = static_cast<int>(settings_.IntValue("Video", "FPSCommon", 30));
  std::string description = DescribePreviewPipeline(
      ResolveVideoInput(scene), SettingResolution("Base"), fps > 0 ? fps : 30);

  GError* error = nullptr;
  GstElement* pipeline = gst_parse_launch(description.c_str(), &error);
  if (!pipeline || error) {
    CLIPFORGE_LOG_ERROR("Preview pipeline creation failed: {}",
                        error ? error->message : "unknown");
    if (error) g_error_free(error);
    if (pipeline) gst_object_unref(pipeline);
    return false;
  }

  PreviewDisplay preview;
  preview.pipeline = pipeline;
  preview.sink = gst_bin_get_by_name(GST_BIN(pipeline), kPreviewSinkElement);
  if (!preview.sink) {
    gst_object_unref(pipeline);
    return false;
  }
  gst_video_overlay_set_window_handle(GST_VIDEO_OVERLAY(preview.sink),
                                      static_cast<guintptr>(window));

  if (gst_element_set_state(pipeline, GST_STATE_PLAYING) ==
      GST_STATE_CHANGE_FAILURE) {
    CLIPFORGE_LOG_ERROR("Failed to start preview pipeline");
    gst_object_unref(preview.sink);
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(pipeline);
    return false;
  }

  previews_[display_id] = preview;
  return true;
}

void GstEngine::DestroyPreviewLocked(const std::string& display_id) {
  auto it = previews_.find(display_id);
  if (it == previews_.end()) return;
  gst_element_set_state(it->second.pipeline, GST_STATE_NULL);
  gst_object_unref(it->second.sink);
  gst_object_unref(it->second.pipeline);
  previews_.erase(it);
}

void GstEngine::DestroyPreviewDisplay(const std::string& display_id) {
  std::lock_guard<std::mutex> lock(mu_);
  DestroyPreviewLocked(display_id);
}

void GstEngine::SetPreviewShouldDrawUI(const std::string& display_id,
                                       bool draw_ui) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = previews_.find(display_id);
  if (it != previews_.end()) it->second.draw_ui = draw_ui;
}

void GstEngine::SetPreviewPaddingSize(const std::string& display_id,
                                      int padding) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = previews_.find(display_id);
  if (it == previews_.end()) return;
  it->second.padding = padding;
  ApplyRenderRectangle(&it->second);
}

void GstEngine::ResizePreviewDisplay(const std::string& display_id, int width,
                                     int height) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = previews_.find(display_id);
  if (it == previews_.end()) return;
  it->second.width = width;
  it->second.height = height;
  ApplyRenderRectangle(&it->second);
}

void GstEngine::MovePreviewDisplay(const std::string& display_id, int x,
                                   int y) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = previews_.find(display_id);
  if (it == previews_.end()) return;
  it->second.x = x;
  it->second.y = y;
  ApplyRenderRectangle(&it->second);
}

void GstEngine::ApplyRenderRectangle(PreviewDisplay* preview) {
  int width = preview->width - 2 * preview->padding;
  int height = preview->height - 2 * preview->padding;
  if (width <= 0 || height <= 0) return;
  auto* overlay = GST_VIDEO_OVERLAY(preview->sink);
  gst_video_overlay_set_render_rectangle(overlay, preview->x + preview->padding,
                                         preview->y + preview->padding, width,
                                         height);
  gst_video_overlay_expose(overlay);
}

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

std::vector<DisplayInfo> GstEngine::EnumerateDisplays() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!x11_.is_open() && !x11_.Open()) return {};
  return x11_.GetDisplays();
}

std::vector<AudioDeviceInfo> GstEngine::EnumerateAudioDevices(bool is_input) {
  return pulse_.Enumerate(is_input);
}

// Factory function.
std::unique_ptr<Engine> CreatePlatformEngine() {
  return std::make_unique<GstEngine>();
}

}  // namespace internal
}  // namespace clipforge

#endif  // __linux__
