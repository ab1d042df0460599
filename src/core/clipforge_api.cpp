// Copyright 2026 The clipforge Authors
//
// This file implements all public C API functions declared in clipforge.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "clipforge/clipforge.h"

#include <algorithm>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <cstdlib>
#include <cstring>

#include "core/callback_sink.h"
#include "core/engine.h"
#include "core/logger.h"
#include "core/recorder_impl.h"
#include "core/recorder_options.h"
#include "core/resolution.h"

using clipforge::internal::AudioDeviceInfo;
using clipforge::internal::ClipForgeRecorderImpl;
using clipforge::internal::DisplayInfo;
using clipforge::internal::Engine;
using clipforge::internal::RecorderOptions;
using clipforge::internal::Resolution;

// ---------------------------------------------------------------------------
// The opaque ClipForgeRecorder struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct ClipForgeRecorder {
  explicit ClipForgeRecorder(std::unique_ptr<Engine> engine)
      : impl(std::move(engine)) {}

  ClipForgeRecorderImpl impl;
};

// Copy @p src into a fixed-size, null-terminated C buffer.
template <size_t N>
static void CopyToBuffer(const std::string& src, char (&dst)[N]) {
  size_t len = (std::min)(src.size(), N - 1);
  std::memcpy(dst, src.c_str(), len);
  dst[len] = '\0';
}

// Validate and convert public options; records InvalidParam on failure.
static bool ToInternal(ClipForgeRecorder* recorder,
                       const ClipForgeRecorderOptions* options,
                       RecorderOptions* out) {
  std::string error;
  if (!clipforge::internal::ConvertOptions(*options, out, &error)) {
    recorder->impl.SetError(kClipForgeErrorInvalidParam, error);
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

void clipforge_recorder_options_init(ClipForgeRecorderOptions* options) {
  if (!options) return;
  clipforge::internal::FillDefaultOptions(options);
}

// ---------------------------------------------------------------------------
// Recorder lifecycle
// ---------------------------------------------------------------------------

ClipForgeRecorder* clipforge_recorder_create(void) {
  std::unique_ptr<Engine> engine = clipforge::internal::CreatePlatformEngine();
  if (!engine) {
    CLIPFORGE_LOG_ERROR("No capture engine available on this platform");
    return nullptr;
  }
  return new (std::nothrow) ClipForgeRecorder(std::move(engine));
}

void clipforge_recorder_destroy(ClipForgeRecorder* recorder) {
  delete recorder;
}

ClipForgeError clipforge_recorder_get_last_error(
    const ClipForgeRecorder* recorder) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  return recorder->impl.last_error();
}

const char* clipforge_recorder_get_last_error_message(
    const ClipForgeRecorder* recorder) {
  if (!recorder) return "Invalid recorder (NULL)";
  return recorder->impl.last_error_message();
}

ClipForgeRecorderState clipforge_recorder_get_state(
    const ClipForgeRecorder* recorder) {
  if (!recorder) return kClipForgeStateUninitialized;
  return recorder->impl.state();
}

ClipForgeError clipforge_recorder_initialize(
    ClipForgeRecorder* recorder, const ClipForgeRecorderOptions* options) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  if (!options) {
    recorder->impl.SetError(kClipForgeErrorInvalidParam, "options is NULL");
    return kClipForgeErrorInvalidParam;
  }

  RecorderOptions opts;
  if (!ToInternal(recorder, options, &opts)) return kClipForgeErrorInvalidParam;
  return recorder->impl.Initialize(opts);
}

ClipForgeError clipforge_recorder_reconfigure(
    ClipForgeRecorder* recorder, const ClipForgeRecorderOptions* options) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  if (!options) return recorder->impl.Reconfigure(nullptr);

  RecorderOptions opts;
  if (!ToInternal(recorder, options, &opts)) return kClipForgeErrorInvalidParam;
  return recorder->impl.Reconfigure(&opts);
}

ClipForgeError clipforge_recorder_start(ClipForgeRecorder* recorder) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  return recorder->impl.Start();
}

ClipForgeError clipforge_recorder_stop(ClipForgeRecorder* recorder) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  return recorder->impl.Stop();
}

int clipforge_recorder_shutdown(ClipForgeRecorder* recorder) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  return recorder->impl.Shutdown();
}

// ---------------------------------------------------------------------------
// Engine queries
// ---------------------------------------------------------------------------

int clipforge_recorder_get_available_resolutions(
    ClipForgeRecorder* recorder, ClipForgeResolutionKind kind,
    ClipForgeResolution* out_resolutions, int max_count) {
  if (!recorder || !out_resolutions || max_count <= 0) return -1;
  if (kind != kClipForgeResolutionBase && kind != kClipForgeResolutionOutput) {
    recorder->impl.SetError(kClipForgeErrorInvalidParam,
                            "Unknown resolution kind");
    return -1;
  }

  std::vector<std::string> values;
  if (recorder->impl.GetAvailableResolutions(kind, &values) != kClipForgeOk) {
    return -1;
  }

  int count = (std::min)(static_cast<int>(values.size()), max_count);
  for (int i = 0; i < count; ++i) {
    std::memset(&out_resolutions[i], 0, sizeof(ClipForgeResolution));
    Resolution res;
    if (clipforge::internal::ParseResolution(values[i], &res)) {
      out_resolutions[i].width = res.width;
      out_resolutions[i].height = res.height;
    }
    CopyToBuffer(values[i], out_resolutions[i].text);
  }
  return count;
}

int clipforge_recorder_get_available_encoders(
    ClipForgeRecorder* recorder, ClipForgeEncoderInfo* out_encoders,
    int max_count) {
  if (!recorder || !out_encoders || max_count <= 0) return -1;

  std::vector<std::string> encoders;
  if (recorder->impl.GetAvailableEncoders(&encoders) != kClipForgeOk) {
    return -1;
  }

  int count = (std::min)(static_cast<int>(encoders.size()), max_count);
  for (int i = 0; i < count; ++i) {
    std::memset(&out_encoders[i], 0, sizeof(ClipForgeEncoderInfo));
    CopyToBuffer(encoders[i], out_encoders[i].name);
  }
  return count;
}

char* clipforge_recorder_get_last_recording(ClipForgeRecorder* recorder) {
  if (!recorder) return nullptr;

  std::string path;
  if (recorder->impl.GetLastRecording(&path) != kClipForgeOk) return nullptr;
  if (path.empty()) return nullptr;

  char* result = static_cast<char*>(std::malloc(path.size() + 1));
  if (!result) return nullptr;
  std::memcpy(result, path.c_str(), path.size() + 1);
  return result;
}

void clipforge_free_string(char* str) {
  std::free(str);
}

int clipforge_recorder_enumerate_displays(ClipForgeRecorder* recorder,
                                          ClipForgeDisplayInfo* out_displays,
                                          int max_count) {
  if (!recorder || !out_displays || max_count <= 0) return -1;

  std::vector<DisplayInfo> displays = recorder->impl.EnumerateDisplays();
  int count = (std::min)(static_cast<int>(displays.size()), max_count);
  for (int i = 0; i < count; ++i) {
    const DisplayInfo& d = displays[i];
    ClipForgeDisplayInfo& out = out_displays[i];
    std::memset(&out, 0, sizeof(ClipForgeDisplayInfo));
    out.index = d.index;
    out.x = d.x;
    out.y = d.y;
    out.width = d.width;
    out.height = d.height;
    out.is_primary = d.is_primary ? 1 : 0;
    CopyToBuffer(d.name, out.name);
  }
  return count;
}

int clipforge_recorder_enumerate_audio_devices(
    ClipForgeRecorder* recorder, int is_input,
    ClipForgeAudioDeviceInfo* out_devices, int max_count) {
  if (!recorder || !out_devices || max_count <= 0) return -1;

  std::vector<AudioDeviceInfo> devices =
      recorder->impl.EnumerateAudioDevices(is_input != 0);
  int count = (std::min)(static_cast<int>(devices.size()), max_count);
  for (int i = 0; i < count; ++i) {
    std::memset(&out_devices[i], 0, sizeof(ClipForgeAudioDeviceInfo));
    CopyToBuffer(devices[i].id, out_devices[i].id);
    CopyToBuffer(devices[i].name, out_devices[i].name);
    out_devices[i].is_default = devices[i].is_default ? 1 : 0;
    out_devices[i].is_input = devices[i].is_input ? 1 : 0;
  }
  return count;
}

// ---------------------------------------------------------------------------
// Preview
// ---------------------------------------------------------------------------

ClipForgeError clipforge_recorder_setup_preview(ClipForgeRecorder* recorder,
                                                ClipForgeWindowId host_window,
                                                const ClipForgeBounds* bounds,
                                                int* out_height) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  if (!bounds || host_window == 0) {
    recorder->impl.SetError(kClipForgeErrorInvalidParam,
                            "host_window is 0 or bounds is NULL");
    return kClipForgeErrorInvalidParam;
  }
  return recorder->impl.SetupPreview(host_window, *bounds, out_height);
}

ClipForgeError clipforge_recorder_resize_preview(ClipForgeRecorder* recorder,
                                                 const ClipForgeBounds* bounds,
                                                 int* out_height) {
  if (!recorder) return kClipForgeErrorInvalidParam;
  if (!bounds) {
    recorder->impl.SetError(kClipForgeErrorInvalidParam, "bounds is NULL");
    return kClipForgeErrorInvalidParam;
  }
  return recorder->impl.ResizePreview(*bounds, out_height);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

const char* clipforge_version_string(void) {
  return CLIPFORGE_VERSION_STRING;
}

int clipforge_version_major(void) { return CLIPFORGE_VERSION_MAJOR; }
int clipforge_version_minor(void) { return CLIPFORGE_VERSION_MINOR; }
int clipforge_version_patch(void) { return CLIPFORGE_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void clipforge_set_log_level(ClipForgeLogLevel level) {
  clipforge::internal::SetLogLevel(level);
}

void clipforge_set_log_callback(clipforge_log_callback_t callback,
                                void* userdata) {
  auto sink = clipforge::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void clipforge_log(ClipForgeLogLevel level, const char* message) {
  if (!message) return;
  auto logger = clipforge::internal::GetLogger();
  if (logger) {
    logger->log(clipforge::internal::ToSpdlogLevel(level), "{}", message);
  }
}
