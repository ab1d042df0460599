// Copyright 2026 The clipforge Authors

#include "core/recorder_impl.h"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

constexpr char kOutputModeAdvanced[] = "Advanced";
constexpr char kRecordingFormat[] = "mp4";
constexpr char kRateControl[] = "VBR";

// Without this the engine caps VBR at its default maximum.
constexpr long long kMaxBitrate = 300000;

const char* StateName(ClipForgeRecorderState state) {
  switch (state) {
    case kClipForgeStateUninitialized: return "uninitialized";
    case kClipForgeStateInitialized:   return "initialized";
    case kClipForgeStateConfigured:    return "configured";
    case kClipForgeStateRecording:     return "recording";
    case kClipForgeStateShutDown:      return "shut down";
  }
  return "unknown";
}

}  // namespace

ClipForgeRecorderImpl::ClipForgeRecorderImpl(std::unique_ptr<Engine> engine,
                                             std::string data_dir)
    : engine_(std::move(engine)),
      data_dir_(data_dir.empty() ? DefaultEngineDataDir()
                                 : std::move(data_dir)),
      connection_(engine_.get()),
      settings_(engine_.get()),
      capture_builder_(engine_.get(), &settings_),
      tracks_(engine_.get(), &settings_),
      preview_(engine_.get()) {}

ClipForgeRecorderImpl::~ClipForgeRecorderImpl() {
  size_watcher_.Stop();
  if (Shutdown() < 0) {
    CLIPFORGE_LOG_ERROR("Recorder destroyed with a failed shutdown: {}",
                        last_error_message_);
  }
}

void ClipForgeRecorderImpl::SetError(ClipForgeError code,
                                     const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  CLIPFORGE_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void ClipForgeRecorderImpl::ClearError() {
  last_error_ = kClipForgeOk;
  last_error_message_ = "No error";
}

ClipForgeError ClipForgeRecorderImpl::Fail(ClipForgeError code,
                                           const std::string& message) {
  SetError(code, message);
  return code;
}

ClipForgeRecorderState ClipForgeRecorderImpl::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

ClipForgeError ClipForgeRecorderImpl::Initialize(
    const RecorderOptions& options) {
  std::lock_guard<std::mutex> lock(mu_);

  if (connection_.live()) {
    CLIPFORGE_LOG_WARN("Engine is already initialized");
    ClearError();
    return kClipForgeOk;
  }
  if (state_ == kClipForgeStateShutDown) {
    return Fail(kClipForgeErrorNotInitialized, "Recorder was shut down");
  }

  std::string error;
  ClipForgeError err = connection_.Open(
      data_dir_,
      [this](const EngineSignal& signal) {
        CLIPFORGE_LOG_DEBUG("Engine signal: type={} signal={} code={}",
                            signal.type, signal.signal, signal.code);
        signals_.Push(signal);
      },
      &error);
  if (err != kClipForgeOk) return Fail(err, error);

  state_ = kClipForgeStateInitialized;
  options_ = options;
  return ReconfigureLocked();
}

ClipForgeError ClipForgeRecorderImpl::Reconfigure(
    const RecorderOptions* options) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }
  if (options) options_ = *options;
  return ReconfigureLocked();
}

ClipForgeError ClipForgeRecorderImpl::ReconfigureLocked() {
  CLIPFORGE_LOG_INFO("Configuring engine ({})", StateName(state_));

  // The old poll must not touch the scene being replaced.
  size_watcher_.Stop();

  ApplyEngineSettings(options_);

  CaptureScene scene;
  std::string error;
  ClipForgeError err = capture_builder_.Build(options_, &scene, &error);
  if (err != kClipForgeOk) {
    if (scene_.scene != kNoSource) {
      // Keep polling the graph that is still in place.
      StartSizePoll();
    }
    return Fail(err, error);
  }

  // Slot 1 still references the old scene, so it outlives this release
  // until ClearSources() detaches it.
  capture_builder_.Release(&scene_);
  scene_ = scene;
  scale_tracker_ = std::make_unique<ScaleTracker>(scene_.base);

  tracks_.ClearSources();
  tracks_.AllocateTracks(scene_.scene, options_.audio_input_device,
                         options_.audio_output_device);

  StartSizePoll();

  if (state_ != kClipForgeStateRecording) state_ = kClipForgeStateConfigured;
  ClearError();
  return kClipForgeOk;
}

void ClipForgeRecorderImpl::ApplyEngineSettings(
    const RecorderOptions& options) {
  settings_.SetValue(SettingKey::kOutputMode, kOutputModeAdvanced);

  SetRecordingEncoder(options);

  settings_.SetValue(SettingKey::kRecFilePath, options.buffer_storage_dir);
  settings_.SetValue(SettingKey::kRecFormat, kRecordingFormat);
  settings_.SetValue(SettingKey::kRecRateControl, kRateControl);
  settings_.SetValue(SettingKey::kRecBitrate,
                     static_cast<long long>(options.kbit_rate) * 1024);
  settings_.SetValue(SettingKey::kRecMaxBitrate, kMaxBitrate);
  settings_.SetValue(SettingKey::kVideoFps,
                     static_cast<long long>(options.fps));

  CLIPFORGE_LOG_DEBUG("Engine configured");
}

void ClipForgeRecorderImpl::SetRecordingEncoder(
    const RecorderOptions& options) {
  std::vector<std::string> available =
      settings_.GetAvailableValues(SettingKey::kRecEncoder);
  if (available.empty()) {
    CLIPFORGE_LOG_WARN("Engine offers no recording encoder; keeping its "
                       "current one");
    return;
  }

  std::string encoder = options.encoder;
  bool auto_pick = encoder.empty() || encoder == kAutoEncoder;
  if (!auto_pick &&
      std::find(available.begin(), available.end(), encoder) ==
          available.end()) {
    CLIPFORGE_LOG_WARN("Configured encoder '{}' is not available", encoder);
    auto_pick = true;
  }
  if (auto_pick) {
    encoder = available.back();
    CLIPFORGE_LOG_INFO("Selecting encoder automatically: {}", encoder);
  }

  settings_.SetValue(SettingKey::kRecEncoder, encoder);
}

ClipForgeError ClipForgeRecorderImpl::Start() {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }

  CLIPFORGE_LOG_INFO("Starting recording");
  size_t stale = signals_.Clear();
  if (stale > 0) CLIPFORGE_LOG_WARN("Dropped {} stale engine signal(s)", stale);

  engine_->StartRecording();
  ClipForgeError err = AwaitSignals({"start"});
  if (err != kClipForgeOk) return err;

  state_ = kClipForgeStateRecording;
  ClearError();
  return kClipForgeOk;
}

ClipForgeError ClipForgeRecorderImpl::Stop() {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }

  CLIPFORGE_LOG_INFO("Stopping recording");
  size_t stale = signals_.Clear();
  if (stale > 0) CLIPFORGE_LOG_WARN("Dropped {} stale engine signal(s)", stale);

  engine_->StopRecording();
  ClipForgeError err = AwaitSignals({"stopping", "stop", "wrote"});
  if (err != kClipForgeOk) return err;

  state_ = kClipForgeStateConfigured;
  ClearError();
  return kClipForgeOk;
}

ClipForgeError ClipForgeRecorderImpl::AwaitSignals(
    const std::vector<const char*>& expected) {
  for (const char* signal : expected) {
    std::string error;
    ClipForgeError err = signals_.AwaitSignal(signal, &error, signal_timeout_);
    if (err != kClipForgeOk) return Fail(err, error);
  }
  return kClipForgeOk;
}

int ClipForgeRecorderImpl::Shutdown() {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    CLIPFORGE_LOG_DEBUG("Engine is already shut down");
    return 0;
  }

  CLIPFORGE_LOG_DEBUG("Shutting down engine");
  size_watcher_.Stop();
  scale_tracker_.reset();
  preview_.Destroy();
  capture_builder_.Release(&scene_);

  std::string error;
  ClipForgeError err = connection_.Close(&error);
  state_ = kClipForgeStateShutDown;
  if (err != kClipForgeOk) {
    SetError(kClipForgeErrorShutdownFailure,
             "Failed to shut down the engine connection: " + error);
    return kClipForgeErrorShutdownFailure;
  }

  ClearError();
  return 1;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

ClipForgeError ClipForgeRecorderImpl::GetAvailableResolutions(
    ClipForgeResolutionKind kind, std::vector<std::string>* out) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }
  SettingKey key = kind == kClipForgeResolutionBase
                       ? SettingKey::kBaseResolution
                       : SettingKey::kOutputResolution;
  *out = settings_.GetAvailableValues(key);
  ClearError();
  return kClipForgeOk;
}

ClipForgeError ClipForgeRecorderImpl::GetAvailableEncoders(
    std::vector<std::string>* out) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }
  *out = settings_.GetAvailableValues(SettingKey::kRecEncoder);
  ClearError();
  return kClipForgeOk;
}

ClipForgeError ClipForgeRecorderImpl::GetLastRecording(std::string* out_path) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }
  std::string path = engine_->GetLastRecording();
  if (path.empty()) {
    out_path->clear();
  } else {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(path, ec);
    *out_path = ec ? path : abs.lexically_normal().string();
  }
  ClearError();
  return kClipForgeOk;
}

std::vector<DisplayInfo> ClipForgeRecorderImpl::EnumerateDisplays() {
  return engine_->EnumerateDisplays();
}

std::vector<AudioDeviceInfo> ClipForgeRecorderImpl::EnumerateAudioDevices(
    bool is_input) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!connection_.live()) return {};
  return engine_->EnumerateAudioDevices(is_input);
}

// ---------------------------------------------------------------------------
// Preview
// ---------------------------------------------------------------------------

ClipForgeError ClipForgeRecorderImpl::SetupPreview(
    ClipForgeWindowId host_window, const ClipForgeBounds& bounds,
    int* out_height) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live() || scene_.scene == kNoSource) {
    return Fail(kClipForgeErrorNotInitialized,
                "Preview needs an initialized recorder with a scene");
  }

  std::string error;
  ClipForgeError err =
      preview_.Setup(host_window, engine_->GetSourceName(scene_.scene), bounds,
                     out_height, &error);
  if (err != kClipForgeOk) return Fail(err, error);
  ClearError();
  return kClipForgeOk;
}

ClipForgeError ClipForgeRecorderImpl::ResizePreview(
    const ClipForgeBounds& bounds, int* out_height) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!connection_.live()) {
    return Fail(kClipForgeErrorNotInitialized, "Engine not initialized");
  }

  std::string error;
  ClipForgeError err = preview_.Resize(bounds, out_height, &error);
  if (err != kClipForgeOk) return Fail(err, error);
  ClearError();
  return kClipForgeOk;
}

// ---------------------------------------------------------------------------
// Introspection and size polling
// ---------------------------------------------------------------------------

OutputTrackTable ClipForgeRecorderImpl::tracks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tracks_.table();
}

RecorderOptions ClipForgeRecorderImpl::options() const {
  std::lock_guard<std::mutex> lock(mu_);
  return options_;
}

void ClipForgeRecorderImpl::set_signal_timeout(
    std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  signal_timeout_ = timeout;
}

void ClipForgeRecorderImpl::StartSizePoll() {
  // Recording works without the poll; the item just keeps its scale.
  if (!size_watcher_.Start([this] { PollSourceSize(); })) {
    CLIPFORGE_LOG_WARN("Capture source size will not be tracked");
  }
}

void ClipForgeRecorderImpl::PollSourceSize() {
  std::unique_lock<std::mutex> lock(mu_, std::try_to_lock);
  if (!lock.owns_lock()) return;
  if (!scale_tracker_ || scene_.video_source == kNoSource) return;

  int width = engine_->GetSourceWidth(scene_.video_source);
  int height = engine_->GetSourceHeight(scene_.video_source);

  float scale = 1.0f;
  if (!scale_tracker_->Update(width, height, &scale)) return;

  engine_->SetSceneItemScale(scene_.item, scale, scale);
  CLIPFORGE_LOG_INFO("Adjusting scene item scale to {:.4f}: base {}, input "
                     "{}x{}",
                     scale, FormatResolution(scale_tracker_->base()), width,
                     height);
}

}  // namespace internal
}  // namespace clipforge
