// Copyright 2026 The clipforge Authors

#include "platform/linux/gst_pipeline_description.h"

#if defined(__linux__)

#include <algorithm>
#include <sstream>

namespace clipforge {
namespace internal {

namespace {

constexpr int kMaxTracks = 64;

const char* MuxerFor(const std::string& container) {
  if (container == "mkv") return "matroskamux";
  return "mp4mux";
}

}  // namespace

std::string QuoteLaunchValue(const std::string& text) {
  std::string out = "\"";
  for (char c : text) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

std::string DescribeVideoSource(const VideoInput& input, const Resolution& base,
                                int fps) {
  std::ostringstream s;
  switch (input.kind) {
    case VideoInput::Kind::kScreen:
      s << "ximagesrc display-name=" << QuoteLaunchValue(input.display_name)
        << " screen-num=" << input.screen << " use-damage=false show-pointer="
        << (input.show_pointer ? "true" : "false")
        << " ! video/x-raw,framerate=" << fps << "/1";
      break;
    case VideoInput::Kind::kWindow:
      s << "ximagesrc display-name=" << QuoteLaunchValue(input.display_name)
        << " xid=" << input.xid << " use-damage=false show-pointer="
        << (input.show_pointer ? "true" : "false")
        << " ! video/x-raw,framerate=" << fps << "/1";
      break;
    case VideoInput::Kind::kBlank:
      s << "videotestsrc pattern=black is-live=true ! video/x-raw,width="
        << base.width << ",height=" << base.height << ",framerate=" << fps
        << "/1";
      break;
  }
  s << " ! videoconvert";
  return s.str();
}

std::string DescribeEncoder(const EncoderParams& params, int fps) {
  long long kbps = params.bitrate_bps / 1000;
  if (params.max_kbps > 0) kbps = std::min(kbps, params.max_kbps);
  if (kbps <= 0) kbps = 1;
  long long max_kbps = params.max_kbps > 0 ? params.max_kbps : kbps;

  std::ostringstream s;
  s << params.factory;
  if (params.factory == "x264enc") {
    s << " bitrate=" << kbps << " speed-preset=veryfast tune=zerolatency"
      << " key-int-max=" << fps * 2;
    if (params.vbr) {
      s << " option-string=\"vbv-maxrate=" << max_kbps
        << ":vbv-bufsize=" << max_kbps << "\"";
    }
  } else if (params.factory == "openh264enc") {
    s << " bitrate=" << kbps * 1000 << " rate-control=bitrate";
    if (params.vbr) s << " max-bitrate=" << max_kbps * 1000;
  } else if (params.factory == "vaapih264enc") {
    s << " bitrate=" << kbps << " rate-control=" << (params.vbr ? "vbr" : "cbr")
      << " keyframe-period=" << fps * 2;
  } else if (params.factory == "nvh264enc") {
    s << " bitrate=" << kbps << " rc-mode=" << (params.vbr ? "vbr" : "cbr")
      << " gop-size=" << fps * 2;
    if (params.vbr) s << " max-bitrate=" << max_kbps;
  }
  return s.str();
}

std::string DescribeRecordingPipeline(const RecordingGraph& graph) {
  std::ostringstream s;

  // Video: capture -> canvas (item placed and scaled) -> output size -> H.264.
  s << "compositor name=" << kCanvasElement << " background=black"
    << " sink_0::xpos=0 sink_0::ypos=0"
    << " sink_0::width=" << graph.video.item.width
    << " sink_0::height=" << graph.video.item.height
    << " ! video/x-raw,width=" << graph.base.width
    << ",height=" << graph.base.height << ",framerate=" << graph.fps << "/1"
    << " ! videoconvert ! videoscale ! video/x-raw,format=I420,width="
    << graph.output.width << ",height=" << graph.output.height << " ! "
    << DescribeEncoder(graph.encoder, graph.fps)
    << " ! h264parse ! queue ! mux. ";
  s << DescribeVideoSource(graph.video, graph.base, graph.fps)
    << " ! queue ! " << kCanvasElement << ".sink_0 ";

  // Audio: one mixer per recorded track; each source tees into every track
  // its mixer mask selects.
  if (!graph.audio_encoder.empty()) {
    std::vector<bool> track_used(kMaxTracks, false);
    for (size_t i = 0; i < graph.audio.size(); ++i) {
      const AudioInput& in = graph.audio[i];
      uint64_t tracks = in.mixers & graph.recorded_tracks;
      if (tracks == 0) continue;

      s << "pulsesrc device=" << QuoteLaunchValue(in.device)
        << " do-timestamp=true ! audioconvert ! audioresample"
        << " ! audio/x-raw,rate=48000,channels=2 ! volume mute="
        << (in.muted ? "true" : "false") << " ! tee name=src" << i << " ";
      for (int t = 0; t < kMaxTracks; ++t) {
        if (!(tracks & (1ULL << t))) continue;
        track_used[t] = true;
        s << "src" << i << ". ! queue ! track" << (t + 1) << ". ";
      }
    }
    for (int t = 0; t < kMaxTracks; ++t) {
      if (!track_used[t]) continue;
      s << "audiomixer name=track" << (t + 1) << " ! audioconvert ! "
        << graph.audio_encoder << " ! aacparse ! queue ! mux. ";
    }
  }

  s << MuxerFor(graph.container) << " name=mux ! filesink location="
    << QuoteLaunchValue(graph.location);
  return s.str();
}

std::string DescribePreviewPipeline(const VideoInput& input,
                                    const Resolution& base, int fps) {
  std::ostringstream s;
  s << DescribeVideoSource(input, base, fps)
    << " ! videoscale ! ximagesink name=" << kPreviewSinkElement
    << " force-aspect-ratio=true sync=false";
  return s.str();
}

}  // namespace internal
}  // namespace clipforge

#endif  // __linux__
