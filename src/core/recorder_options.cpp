// Copyright 2026 The clipforge Authors

#include "core/recorder_options.h"

#include <utility>

#include "core/resolution.h"

namespace clipforge {
namespace internal {

namespace {

void CopyString(const char* src, std::string* dst) {
  if (src) *dst = src;
}

}  // namespace

void FillDefaultOptions(ClipForgeRecorderOptions* out) {
  out->capture_mode = kClipForgeCaptureDisplay;
  out->display_index = 1;
  out->output_resolution = "1920x1080";
  out->kbit_rate = 15000;
  out->fps = 60;
  out->encoder = kAutoEncoder;
  out->buffer_storage_dir = nullptr;
  out->audio_input_device_id = "all";
  out->audio_output_device_id = "all";
  out->window_title = nullptr;
  out->window_class = nullptr;
  out->window_executable = nullptr;
}

bool ConvertOptions(const ClipForgeRecorderOptions& in, RecorderOptions* out,
                    std::string* out_error) {
  RecorderOptions opts;
  opts.capture_mode = in.capture_mode;
  opts.display_index = in.display_index;
  opts.kbit_rate = in.kbit_rate;
  opts.fps = in.fps;
  CopyString(in.output_resolution, &opts.output_resolution);
  CopyString(in.encoder, &opts.encoder);
  CopyString(in.buffer_storage_dir, &opts.buffer_storage_dir);
  CopyString(in.audio_input_device_id, &opts.audio_input_device);
  CopyString(in.audio_output_device_id, &opts.audio_output_device);
  CopyString(in.window_title, &opts.window.title);
  CopyString(in.window_class, &opts.window.window_class);
  CopyString(in.window_executable, &opts.window.executable);

  if (opts.kbit_rate <= 0) {
    *out_error = "Bitrate must be positive, got " +
                 std::to_string(opts.kbit_rate) + " kbit/s";
    return false;
  }
  if (opts.fps <= 0) {
    *out_error = "Frame rate must be positive, got " + std::to_string(opts.fps);
    return false;
  }
  Resolution res;
  if (!ParseResolution(opts.output_resolution, &res)) {
    *out_error = "Malformed output resolution '" + opts.output_resolution + "'";
    return false;
  }
  if (opts.encoder.empty()) opts.encoder = kAutoEncoder;

  *out = std::move(opts);
  return true;
}

}  // namespace internal
}  // namespace clipforge
