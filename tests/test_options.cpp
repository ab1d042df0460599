// Copyright 2026 The clipforge Authors
// Tests for: clipforge_recorder_options_init, ConvertOptions

#include <string>

#include "clipforge/clipforge.h"
#include "core/recorder_options.h"
#include "gtest/gtest.h"

using clipforge::internal::ConvertOptions;
using clipforge::internal::RecorderOptions;

TEST(OptionsTest, InitFillsDefaults) {
  ClipForgeRecorderOptions options;
  clipforge_recorder_options_init(&options);
  EXPECT_EQ(options.capture_mode, kClipForgeCaptureDisplay);
  EXPECT_EQ(options.display_index, 1);
  EXPECT_STREQ(options.output_resolution, "1920x1080");
  EXPECT_EQ(options.kbit_rate, 15000);
  EXPECT_EQ(options.fps, 60);
  EXPECT_STREQ(options.encoder, "auto");
  EXPECT_STREQ(options.audio_input_device_id, "all");
  EXPECT_STREQ(options.audio_output_device_id, "all");
  EXPECT_EQ(options.buffer_storage_dir, nullptr);
}

TEST(OptionsTest, InitNullIsSafe) {
  clipforge_recorder_options_init(nullptr);
}

TEST(OptionsTest, DefaultsConvertToDefaults) {
  ClipForgeRecorderOptions in;
  clipforge_recorder_options_init(&in);
  RecorderOptions out;
  std::string error;
  ASSERT_TRUE(ConvertOptions(in, &out, &error)) << error;
  EXPECT_EQ(out.output_resolution, "1920x1080");
  EXPECT_EQ(out.buffer_storage_dir, "");
  EXPECT_EQ(out.window.title, "World of Warcraft");
  EXPECT_EQ(out.window.window_class, "GxWindowClass");
  EXPECT_EQ(out.window.executable, "Wow.exe");
}

TEST(OptionsTest, ExplicitFieldsAreCopied) {
  ClipForgeRecorderOptions in;
  clipforge_recorder_options_init(&in);
  in.capture_mode = kClipForgeCaptureWindow;
  in.buffer_storage_dir = "/var/clips";
  in.audio_input_device_id = "none";
  in.window_title = "Editor";
  in.encoder = "";
  RecorderOptions out;
  std::string error;
  ASSERT_TRUE(ConvertOptions(in, &out, &error));
  EXPECT_EQ(out.capture_mode, kClipForgeCaptureWindow);
  EXPECT_EQ(out.buffer_storage_dir, "/var/clips");
  EXPECT_EQ(out.audio_input_device, "none");
  EXPECT_EQ(out.window.title, "Editor");
  EXPECT_EQ(out.window.executable, "Wow.exe");
  // An empty encoder means automatic selection.
  EXPECT_EQ(out.encoder, "auto");
}

TEST(OptionsTest, UnknownCaptureModeIsCarriedToSceneBuild) {
  ClipForgeRecorderOptions in;
  clipforge_recorder_options_init(&in);
  in.capture_mode = -1;
  RecorderOptions out;
  std::string error;
  ASSERT_TRUE(ConvertOptions(in, &out, &error));
  EXPECT_EQ(out.capture_mode, -1);
}

TEST(OptionsTest, InvalidNumbersAreRejected) {
  ClipForgeRecorderOptions in;
  clipforge_recorder_options_init(&in);
  RecorderOptions out;
  std::string error;

  in.kbit_rate = 0;
  EXPECT_FALSE(ConvertOptions(in, &out, &error));
  EXPECT_NE(error.find("Bitrate"), std::string::npos);

  in.kbit_rate = 6000;
  in.fps = -30;
  EXPECT_FALSE(ConvertOptions(in, &out, &error));
  EXPECT_NE(error.find("Frame rate"), std::string::npos);
}

TEST(OptionsTest, MalformedResolutionIsRejected) {
  ClipForgeRecorderOptions in;
  clipforge_recorder_options_init(&in);
  in.output_resolution = "full-hd";
  RecorderOptions out;
  out.fps = 12;
  std::string error;
  EXPECT_FALSE(ConvertOptions(in, &out, &error));
  EXPECT_NE(error.find("full-hd"), std::string::npos);
  // Output is untouched on failure.
  EXPECT_EQ(out.fps, 12);
}
