// Copyright 2026 The clipforge Authors
// Tests for: the C API surface before the engine is connected, and the
//            C++ wrapper in clipforge.hpp

#include <string>

#include "clipforge/clipforge.h"
#include "clipforge/clipforge.hpp"
#include "gtest/gtest.h"

// ---------------------------------------------------------------------------
// NULL handles
// ---------------------------------------------------------------------------

TEST(ApiTest, NullRecorderIsRejected) {
  ClipForgeRecorderOptions options;
  clipforge_recorder_options_init(&options);
  ClipForgeBounds bounds = {0, 0, 640, 360};
  ClipForgeResolution resolutions[4];
  ClipForgeEncoderInfo encoders[4];
  int height = 0;

  EXPECT_EQ(clipforge_recorder_get_last_error(nullptr),
            kClipForgeErrorInvalidParam);
  EXPECT_NE(clipforge_recorder_get_last_error_message(nullptr), nullptr);
  EXPECT_EQ(clipforge_recorder_get_state(nullptr),
            kClipForgeStateUninitialized);
  EXPECT_EQ(clipforge_recorder_initialize(nullptr, &options),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_reconfigure(nullptr, &options),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_start(nullptr), kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_stop(nullptr), kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_shutdown(nullptr), kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_get_available_resolutions(
                nullptr, kClipForgeResolutionBase, resolutions, 4),
            -1);
  EXPECT_EQ(clipforge_recorder_get_available_encoders(nullptr, encoders, 4),
            -1);
  EXPECT_EQ(clipforge_recorder_get_last_recording(nullptr), nullptr);
  EXPECT_EQ(clipforge_recorder_setup_preview(nullptr, 1, &bounds, &height),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_resize_preview(nullptr, &bounds, &height),
            kClipForgeErrorInvalidParam);
}

TEST(ApiTest, DestroyAndFreeNullAreSafe) {
  clipforge_recorder_destroy(nullptr);
  clipforge_free_string(nullptr);
}

// ---------------------------------------------------------------------------
// Recorder before initialization
// ---------------------------------------------------------------------------

class ApiRecorderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    recorder_ = clipforge_recorder_create();
    ASSERT_NE(recorder_, nullptr);
  }

  void TearDown() override { clipforge_recorder_destroy(recorder_); }

  ClipForgeRecorder* recorder_ = nullptr;
};

TEST_F(ApiRecorderTest, FreshRecorderHasNoError) {
  EXPECT_EQ(clipforge_recorder_get_last_error(recorder_), kClipForgeOk);
  EXPECT_STREQ(clipforge_recorder_get_last_error_message(recorder_),
               "No error");
  EXPECT_EQ(clipforge_recorder_get_state(recorder_),
            kClipForgeStateUninitialized);
}

TEST_F(ApiRecorderTest, NullOptionsAreRejected) {
  EXPECT_EQ(clipforge_recorder_initialize(recorder_, nullptr),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_get_last_error(recorder_),
            kClipForgeErrorInvalidParam);
}

TEST_F(ApiRecorderTest, InvalidOptionsNeverReachTheEngine) {
  ClipForgeRecorderOptions options;
  clipforge_recorder_options_init(&options);
  options.output_resolution = "1920by1080";
  EXPECT_EQ(clipforge_recorder_initialize(recorder_, &options),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_get_state(recorder_),
            kClipForgeStateUninitialized);
}

TEST_F(ApiRecorderTest, OperationsNeedInitialization) {
  EXPECT_EQ(clipforge_recorder_start(recorder_), kClipForgeErrorNotInitialized);
  EXPECT_EQ(clipforge_recorder_stop(recorder_), kClipForgeErrorNotInitialized);
  EXPECT_EQ(clipforge_recorder_reconfigure(recorder_, nullptr),
            kClipForgeErrorNotInitialized);
  EXPECT_EQ(clipforge_recorder_shutdown(recorder_), 0);

  ClipForgeResolution resolutions[4];
  EXPECT_EQ(clipforge_recorder_get_available_resolutions(
                recorder_, kClipForgeResolutionOutput, resolutions, 4),
            -1);
  EXPECT_EQ(clipforge_recorder_get_last_error(recorder_),
            kClipForgeErrorNotInitialized);
  EXPECT_EQ(clipforge_recorder_get_last_recording(recorder_), nullptr);

  ClipForgeAudioDeviceInfo devices[4];
  EXPECT_EQ(clipforge_recorder_enumerate_audio_devices(recorder_, 1, devices, 4),
            0);
}

TEST_F(ApiRecorderTest, BufferArgumentsAreValidated) {
  ClipForgeResolution resolutions[1];
  EXPECT_EQ(clipforge_recorder_get_available_resolutions(
                recorder_, kClipForgeResolutionBase, nullptr, 4),
            -1);
  EXPECT_EQ(clipforge_recorder_get_available_resolutions(
                recorder_, kClipForgeResolutionBase, resolutions, 0),
            -1);
  EXPECT_EQ(clipforge_recorder_get_available_resolutions(
                recorder_, static_cast<ClipForgeResolutionKind>(9),
                resolutions, 1),
            -1);
  EXPECT_EQ(clipforge_recorder_get_last_error(recorder_),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_enumerate_displays(recorder_, nullptr, 1), -1);
}

TEST_F(ApiRecorderTest, PreviewArgumentsAreValidated) {
  ClipForgeBounds bounds = {0, 0, 640, 360};
  int height = 0;
  EXPECT_EQ(clipforge_recorder_setup_preview(recorder_, 0, &bounds, &height),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_setup_preview(recorder_, 1, nullptr, &height),
            kClipForgeErrorInvalidParam);
  EXPECT_EQ(clipforge_recorder_setup_preview(recorder_, 1, &bounds, &height),
            kClipForgeErrorNotInitialized);
  EXPECT_EQ(clipforge_recorder_resize_preview(recorder_, nullptr, &height),
            kClipForgeErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// C++ wrapper
// ---------------------------------------------------------------------------

TEST(CppApiTest, OptionsMapToCStruct) {
  clipforge::Options options;
  options.capture_mode = kClipForgeCaptureWindow;
  options.fps = 30;
  options.buffer_storage_dir = "/clips";
  options.window_title = "Game";

  ClipForgeRecorderOptions c = options.to_c();
  EXPECT_EQ(c.capture_mode, kClipForgeCaptureWindow);
  EXPECT_EQ(c.fps, 30);
  EXPECT_STREQ(c.buffer_storage_dir, "/clips");
  EXPECT_STREQ(c.window_title, "Game");
  EXPECT_EQ(c.window_class, nullptr);
  EXPECT_STREQ(c.encoder, "auto");
}

TEST(CppApiTest, FailuresThrowWithCode) {
  clipforge::Recorder recorder;
  try {
    recorder.Start();
    FAIL() << "Start() on an uninitialized recorder must throw";
  } catch (const clipforge::Error& e) {
    EXPECT_EQ(e.code(), kClipForgeErrorNotInitialized);
    EXPECT_STRNE(e.what(), "");
  }
  EXPECT_THROW(recorder.AvailableEncoders(), clipforge::Error);
  EXPECT_THROW(recorder.LastRecording(), clipforge::Error);
}

TEST(CppApiTest, InvalidOptionsThrowInvalidParam) {
  clipforge::Recorder recorder;
  clipforge::Options options;
  options.kbit_rate = -1;
  try {
    recorder.Initialize(options);
    FAIL() << "Initialize() with a negative bitrate must throw";
  } catch (const clipforge::Error& e) {
    EXPECT_EQ(e.code(), kClipForgeErrorInvalidParam);
  }
}

TEST(CppApiTest, ShutdownWithoutInitializeReportsFalse) {
  clipforge::Recorder recorder;
  EXPECT_FALSE(recorder.Shutdown());
}

TEST(CppApiTest, RecorderIsMovable) {
  clipforge::Recorder a;
  ClipForgeRecorder* raw = a.get();
  clipforge::Recorder b(std::move(a));
  EXPECT_EQ(b.get(), raw);
  EXPECT_EQ(a.get(), nullptr);
}
