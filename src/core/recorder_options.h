// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_RECORDER_OPTIONS_H_
#define CLIPFORGE_CORE_RECORDER_OPTIONS_H_

#include <string>

#include "clipforge/clipforge.h"

namespace clipforge {
namespace internal {

constexpr char kAutoEncoder[] = "auto";

/// Window a window-capture source attaches to. Matched on the exact title.
struct WindowTarget {
  std::string title = "World of Warcraft";
  std::string window_class = "GxWindowClass";
  std::string executable = "Wow.exe";
};

/// Validated, owning copy of ClipForgeRecorderOptions.
struct RecorderOptions {
  int capture_mode = kClipForgeCaptureDisplay;  // ClipForgeCaptureMode
  int display_index = 1;  // 1-based
  std::string output_resolution = "1920x1080";
  int kbit_rate = 15000;
  int fps = 60;
  std::string encoder = kAutoEncoder;
  std::string buffer_storage_dir;
  std::string audio_input_device = "all";
  std::string audio_output_device = "all";
  WindowTarget window;
};

/// Fill the public struct with the RecorderOptions defaults. String fields
/// point at static storage.
void FillDefaultOptions(ClipForgeRecorderOptions* out);

/// Copy @p in into @p out. NULL string fields keep the default value.
/// The capture mode is copied unchecked; it is validated when the scene is
/// built.
/// @return false (with @p out_error set) on a malformed bitrate, frame rate
///         or output resolution.
bool ConvertOptions(const ClipForgeRecorderOptions& in, RecorderOptions* out,
                    std::string* out_error);

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_RECORDER_OPTIONS_H_
