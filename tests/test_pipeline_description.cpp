// Copyright 2026 The clipforge Authors
// Tests for: gst_parse_launch descriptions of recording and preview pipelines

#include <string>

#include "gtest/gtest.h"
#include "platform/linux/gst_pipeline_description.h"

using clipforge::internal::AudioInput;
using clipforge::internal::DescribeEncoder;
using clipforge::internal::DescribePreviewPipeline;
using clipforge::internal::DescribeRecordingPipeline;
using clipforge::internal::DescribeVideoSource;
using clipforge::internal::EncoderParams;
using clipforge::internal::QuoteLaunchValue;
using clipforge::internal::RecordingGraph;
using clipforge::internal::Resolution;
using clipforge::internal::VideoInput;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

size_t Count(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

RecordingGraph ScreenGraph() {
  RecordingGraph graph;
  graph.video.kind = VideoInput::Kind::kScreen;
  graph.video.display_name = ":0";
  graph.video.screen = 0;
  graph.video.item = Resolution{2560, 1440};
  graph.base = Resolution{2560, 1440};
  graph.output = Resolution{1920, 1080};
  graph.fps = 60;
  graph.encoder.factory = "x264enc";
  graph.encoder.bitrate_bps = 15360000;
  graph.encoder.max_kbps = 300000;
  graph.encoder.vbr = true;
  graph.audio_encoder = "avenc_aac";
  graph.location = "/clips/2026-10-19 12-00-00.mp4";
  return graph;
}

AudioInput Audio(const std::string& device, uint64_t mixers, bool muted) {
  AudioInput in;
  in.device = device;
  in.mixers = mixers;
  in.muted = muted;
  return in;
}

}  // namespace

TEST(PipelineDescriptionTest, QuotesEscapeSpecialCharacters) {
  EXPECT_EQ(QuoteLaunchValue("a b"), "\"a b\"");
  EXPECT_EQ(QuoteLaunchValue("say \"hi\"\\"), "\"say \\\"hi\\\"\\\\\"");
}

TEST(PipelineDescriptionTest, ScreenSource) {
  VideoInput input;
  input.kind = VideoInput::Kind::kScreen;
  input.display_name = ":1";
  input.screen = 2;
  std::string s = DescribeVideoSource(input, Resolution{1920, 1080}, 30);
  EXPECT_TRUE(Contains(s, "ximagesrc display-name=\":1\" screen-num=2"));
  EXPECT_TRUE(Contains(s, "framerate=30/1"));
  EXPECT_TRUE(Contains(s, "! videoconvert"));
}

TEST(PipelineDescriptionTest, WindowSourceUsesXid) {
  VideoInput input;
  input.kind = VideoInput::Kind::kWindow;
  input.display_name = ":0";
  input.xid = 0x3a00007;
  input.show_pointer = false;
  std::string s = DescribeVideoSource(input, Resolution{1920, 1080}, 60);
  EXPECT_TRUE(Contains(s, "xid=60817415"));
  EXPECT_TRUE(Contains(s, "show-pointer=false"));
}

TEST(PipelineDescriptionTest, BlankSourceFillsCanvas) {
  VideoInput input;
  std::string s = DescribeVideoSource(input, Resolution{1280, 720}, 24);
  EXPECT_TRUE(Contains(s, "videotestsrc pattern=black"));
  EXPECT_TRUE(Contains(s, "width=1280,height=720,framerate=24/1"));
}

TEST(PipelineDescriptionTest, EncoderBitrateIsClampedToMaximum) {
  EncoderParams params;
  params.factory = "nvh264enc";
  params.bitrate_bps = 50000000;
  params.max_kbps = 20000;
  params.vbr = true;
  std::string s = DescribeEncoder(params, 30);
  EXPECT_TRUE(Contains(s, "bitrate=20000 rc-mode=vbr gop-size=60"));
  EXPECT_TRUE(Contains(s, "max-bitrate=20000"));
}

TEST(PipelineDescriptionTest, X264UsesKbps) {
  EncoderParams params;
  params.factory = "x264enc";
  params.bitrate_bps = 6000000;
  std::string s = DescribeEncoder(params, 60);
  EXPECT_TRUE(Contains(s, "x264enc bitrate=6000 "));
  EXPECT_TRUE(Contains(s, "key-int-max=120"));
  EXPECT_FALSE(Contains(s, "vbv-maxrate"));
}

TEST(PipelineDescriptionTest, RecordingChainsCanvasEncoderAndMuxer) {
  std::string s = DescribeRecordingPipeline(ScreenGraph());
  EXPECT_TRUE(Contains(s, "compositor name=canvas"));
  EXPECT_TRUE(Contains(s, "sink_0::width=2560 sink_0::height=1440"));
  EXPECT_TRUE(Contains(s, "format=I420,width=1920,height=1080"));
  EXPECT_TRUE(Contains(s, "x264enc bitrate=15360"));
  EXPECT_TRUE(Contains(s, "! canvas.sink_0"));
  EXPECT_TRUE(Contains(
      s, "mp4mux name=mux ! filesink location=\"/clips/2026-10-19 12-00-00.mp4\""));
}

TEST(PipelineDescriptionTest, MkvContainerUsesMatroska) {
  RecordingGraph graph = ScreenGraph();
  graph.container = "mkv";
  EXPECT_TRUE(Contains(DescribeRecordingPipeline(graph), "matroskamux name=mux"));
}

TEST(PipelineDescriptionTest, AudioSourcesFeedTheirTracks) {
  RecordingGraph graph = ScreenGraph();
  graph.audio.push_back(Audio("mic-1", 0x3, false));
  graph.audio.push_back(Audio("speakers.monitor", 0x5, true));
  graph.recorded_tracks = 0x7;
  std::string s = DescribeRecordingPipeline(graph);

  EXPECT_EQ(Count(s, "pulsesrc device="), 2u);
  EXPECT_TRUE(Contains(s, "volume mute=true ! tee name=src1"));
  // Track 1 mixes both sources, tracks 2 and 3 carry one each.
  EXPECT_EQ(Count(s, "! track1."), 2u);
  EXPECT_EQ(Count(s, "! track2."), 1u);
  EXPECT_EQ(Count(s, "! track3."), 1u);
  EXPECT_EQ(Count(s, "audiomixer name=track"), 3u);
  EXPECT_EQ(Count(s, "avenc_aac ! aacparse"), 3u);
}

TEST(PipelineDescriptionTest, UnrecordedTracksAreLeftOut) {
  RecordingGraph graph = ScreenGraph();
  graph.audio.push_back(Audio("mic-1", 0x3, false));
  graph.recorded_tracks = 0x1;
  std::string s = DescribeRecordingPipeline(graph);
  EXPECT_TRUE(Contains(s, "audiomixer name=track1"));
  EXPECT_FALSE(Contains(s, "track2"));
}

TEST(PipelineDescriptionTest, NoAudioEncoderMeansVideoOnly) {
  RecordingGraph graph = ScreenGraph();
  graph.audio.push_back(Audio("mic-1", 0x3, false));
  graph.audio_encoder.clear();
  std::string s = DescribeRecordingPipeline(graph);
  EXPECT_FALSE(Contains(s, "pulsesrc"));
  EXPECT_FALSE(Contains(s, "audiomixer"));
}

TEST(PipelineDescriptionTest, PreviewEndsInNamedSink) {
  VideoInput input;
  input.kind = VideoInput::Kind::kScreen;
  input.display_name = ":0";
  std::string s = DescribePreviewPipeline(input, Resolution{1920, 1080}, 30);
  EXPECT_TRUE(Contains(s, "ximagesink name=preview"));
  EXPECT_FALSE(Contains(s, "filesink"));
}
