// Copyright 2026 The clipforge Authors
//
// C++ RAII wrapper for the clipforge C API.
// Header-only; just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "clipforge/clipforge.hpp"
//   clipforge::Options opts;
//   opts.buffer_storage_dir = "/home/me/Videos/clips";
//   clipforge::Recorder rec;
//   rec.Initialize(opts);
//   rec.Start();
//   ...
//   rec.Stop();
//   std::string path = rec.LastRecording();

#ifndef CLIPFORGE_CLIPFORGE_HPP_
#define CLIPFORGE_CLIPFORGE_HPP_

#include "clipforge/clipforge.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace clipforge {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(ClipForgeError code, const char* msg)
      : std::runtime_error(msg ? msg : "clipforge error"), code_(code) {}
  ClipForgeError code() const noexcept { return code_; }

 private:
  ClipForgeError code_;
};

// ---------------------------------------------------------------------------
// Options  (owning counterpart of ClipForgeRecorderOptions)
// ---------------------------------------------------------------------------

struct Options {
  ClipForgeCaptureMode capture_mode = kClipForgeCaptureDisplay;
  int display_index = 1;
  std::string output_resolution = "1920x1080";
  int kbit_rate = 15000;
  int fps = 60;
  std::string encoder = "auto";
  std::string buffer_storage_dir;
  std::string audio_input_device_id = "all";
  std::string audio_output_device_id = "all";
  std::string window_title;       // Empty keeps the library default.
  std::string window_class;       // Empty keeps the library default.
  std::string window_executable;  // Empty keeps the library default.

  /// View valid while *this is alive and unmodified.
  ClipForgeRecorderOptions to_c() const {
    ClipForgeRecorderOptions o;
    clipforge_recorder_options_init(&o);
    o.capture_mode = capture_mode;
    o.display_index = display_index;
    o.output_resolution = output_resolution.c_str();
    o.kbit_rate = kbit_rate;
    o.fps = fps;
    o.encoder = encoder.c_str();
    o.buffer_storage_dir = buffer_storage_dir.c_str();
    o.audio_input_device_id = audio_input_device_id.c_str();
    o.audio_output_device_id = audio_output_device_id.c_str();
    if (!window_title.empty()) o.window_title = window_title.c_str();
    if (!window_class.empty()) o.window_class = window_class.c_str();
    if (!window_executable.empty())
      o.window_executable = window_executable.c_str();
    return o;
  }
};

// ---------------------------------------------------------------------------
// Recorder  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Recorder {
 public:
  Recorder() : raw_(clipforge_recorder_create()) {
    if (!raw_) throw Error(kClipForgeErrorEngineFailure, "Recorder creation failed");
  }
  ~Recorder() { clipforge_recorder_destroy(raw_); }

  Recorder(Recorder&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Recorder& operator=(Recorder&& o) noexcept {
    if (this != &o) {
      clipforge_recorder_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Recorder(const Recorder&) = delete;
  Recorder& operator=(const Recorder&) = delete;

  ClipForgeRecorder* get() const noexcept { return raw_; }

  ClipForgeError last_error() const {
    return clipforge_recorder_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return clipforge_recorder_get_last_error_message(raw_);
  }
  ClipForgeRecorderState state() const {
    return clipforge_recorder_get_state(raw_);
  }

  // -- Lifecycle --

  void Initialize(const Options& options) {
    ClipForgeRecorderOptions o = options.to_c();
    check(clipforge_recorder_initialize(raw_, &o));
  }

  void Reconfigure(const Options& options) {
    ClipForgeRecorderOptions o = options.to_c();
    check(clipforge_recorder_reconfigure(raw_, &o));
  }

  /// Re-apply the stored options.
  void Reconfigure() { check(clipforge_recorder_reconfigure(raw_, nullptr)); }

  void Start() { check(clipforge_recorder_start(raw_)); }
  void Stop() { check(clipforge_recorder_stop(raw_)); }

  /// @return false if the recorder was not initialized.
  bool Shutdown() {
    int rc = clipforge_recorder_shutdown(raw_);
    if (rc < 0) check(static_cast<ClipForgeError>(rc));
    return rc == 1;
  }

  // -- Queries --

  std::vector<ClipForgeResolution> AvailableResolutions(
      ClipForgeResolutionKind kind, int max_count = 64) {
    std::vector<ClipForgeResolution> buf(max_count);
    int n = clipforge_recorder_get_available_resolutions(raw_, kind,
                                                         buf.data(), max_count);
    if (n < 0) throw_last("AvailableResolutions failed");
    buf.resize(n);
    return buf;
  }

  std::vector<std::string> AvailableEncoders(int max_count = 32) {
    std::vector<ClipForgeEncoderInfo> buf(max_count);
    int n = clipforge_recorder_get_available_encoders(raw_, buf.data(),
                                                      max_count);
    if (n < 0) throw_last("AvailableEncoders failed");
    std::vector<std::string> names;
    for (int i = 0; i < n; ++i) names.emplace_back(buf[i].name);
    return names;
  }

  /// Empty if the engine has not recorded anything yet.
  std::string LastRecording() {
    char* path = clipforge_recorder_get_last_recording(raw_);
    if (!path) {
      if (last_error() != kClipForgeOk) throw_last("LastRecording failed");
      return std::string();
    }
    std::string result(path);
    clipforge_free_string(path);
    return result;
  }

  std::vector<ClipForgeDisplayInfo> EnumerateDisplays(int max_count = 16) {
    std::vector<ClipForgeDisplayInfo> buf(max_count);
    int n = clipforge_recorder_enumerate_displays(raw_, buf.data(), max_count);
    if (n < 0) n = 0;
    buf.resize(n);
    return buf;
  }

  std::vector<ClipForgeAudioDeviceInfo> EnumerateAudioDevices(
      bool is_input, int max_count = 64) {
    std::vector<ClipForgeAudioDeviceInfo> buf(max_count);
    int n = clipforge_recorder_enumerate_audio_devices(
        raw_, is_input ? 1 : 0, buf.data(), max_count);
    if (n < 0) n = 0;
    buf.resize(n);
    return buf;
  }

  // -- Preview --

  /// @return The preview height in pixels.
  int SetupPreview(ClipForgeWindowId host_window, const ClipForgeBounds& bounds) {
    int height = 0;
    check(clipforge_recorder_setup_preview(raw_, host_window, &bounds, &height));
    return height;
  }

  /// @return The preview height in pixels.
  int ResizePreview(const ClipForgeBounds& bounds) {
    int height = 0;
    check(clipforge_recorder_resize_preview(raw_, &bounds, &height));
    return height;
  }

 private:
  void check(ClipForgeError err) {
    if (err != kClipForgeOk)
      throw Error(err, clipforge_recorder_get_last_error_message(raw_));
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = clipforge_recorder_get_last_error(raw_);
    const char* msg = clipforge_recorder_get_last_error_message(raw_);
    throw Error(err != kClipForgeOk ? err : kClipForgeErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  ClipForgeRecorder* raw_ = nullptr;
};

inline const char* version_string() { return clipforge_version_string(); }

}  // namespace clipforge

#endif  // CLIPFORGE_CLIPFORGE_HPP_
