// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_PLATFORM_LINUX_GST_PIPELINE_DESCRIPTION_H_
#define CLIPFORGE_PLATFORM_LINUX_GST_PIPELINE_DESCRIPTION_H_

#include <cstdint>
#include <string>
#include <vector>

#include "core/resolution.h"

namespace clipforge {
namespace internal {

/// Element names the engine looks up in a launched pipeline.
constexpr char kCanvasElement[] = "canvas";
constexpr char kPreviewSinkElement[] = "preview";

/// Where the video of the scene comes from.
struct VideoInput {
  enum class Kind { kScreen, kWindow, kBlank };

  Kind kind = Kind::kBlank;
  std::string display_name;  // X display, e.g. ":0"
  int screen = 0;            // kScreen
  uint64_t xid = 0;          // kWindow
  bool show_pointer = true;
  Resolution item;  // Size of the scene item on the canvas
};

/// One audio capture source feeding one or more tracks.
struct AudioInput {
  std::string device;   // pulsesrc device name
  bool muted = false;
  uint64_t mixers = 0;  // Bit n set: feeds track n+1
};

struct EncoderParams {
  std::string factory;          // GStreamer encoder element
  long long bitrate_bps = 0;    // Target bitrate
  long long max_kbps = 0;       // Upper bound, 0 = none
  bool vbr = false;
};

/// Everything needed to launch a recording.
struct RecordingGraph {
  VideoInput video;
  Resolution base;    // Canvas
  Resolution output;  // Encoded frame size
  int fps = 30;
  EncoderParams encoder;
  std::vector<AudioInput> audio;
  uint64_t recorded_tracks = 1;  // Bit n set: track n+1 is written
  std::string audio_encoder;     // AAC element, empty = no audio
  std::string container = "mp4";
  std::string location;
};

/// Quote @p text for gst_parse_launch property values.
std::string QuoteLaunchValue(const std::string& text);

/// Capture element chain producing raw video at @p fps.
std::string DescribeVideoSource(const VideoInput& input, const Resolution& base,
                                int fps);

/// Encoder element with rate control properties.
std::string DescribeEncoder(const EncoderParams& params, int fps);

std::string DescribeRecordingPipeline(const RecordingGraph& graph);

/// Live view of @p input into an ximagesink named kPreviewSinkElement.
std::string DescribePreviewPipeline(const VideoInput& input,
                                    const Resolution& base, int fps);

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_PLATFORM_LINUX_GST_PIPELINE_DESCRIPTION_H_
