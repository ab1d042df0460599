// Copyright 2026 The clipforge Authors
// Tests for: CaptureSourceBuilder, SetEngineResolution

#include <string>

#include "core/capture_source.h"
#include "fake_engine.h"
#include "gtest/gtest.h"

using clipforge::internal::CaptureScene;
using clipforge::internal::CaptureSourceBuilder;
using clipforge::internal::RecorderOptions;
using clipforge::internal::Resolution;
using clipforge::internal::SetEngineResolution;
using clipforge::internal::SettingKey;
using clipforge::internal::SettingsBridge;
using clipforge::internal::kDisplayCaptureSourceType;
using clipforge::internal::kNoSource;
using clipforge::internal::kWindowCaptureSourceType;
using clipforge::testing::FakeEngine;

class CaptureSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(engine_.Connect("test"));
  }

  void Init() { ASSERT_EQ(engine_.InitApi("en-US", "/tmp", "0"), 0); }

  FakeEngine engine_;
  SettingsBridge bridge_{&engine_};
  CaptureSourceBuilder builder_{&engine_, &bridge_};
};

// ---------------------------------------------------------------------------
// Resolution negotiation
// ---------------------------------------------------------------------------

TEST_F(CaptureSourceTest, ResolutionSnapsToEngineValue) {
  Init();
  std::string error;
  EXPECT_EQ(SetEngineResolution(&bridge_, Resolution{1366, 768},
                                SettingKey::kOutputResolution, &error),
            kClipForgeOk);
  EXPECT_EQ(engine_.Value("Video", "Output"), "1280x720");
}

TEST_F(CaptureSourceTest, NoResolutionsIsAnError) {
  engine_.base_resolutions.clear();
  Init();
  std::string error;
  EXPECT_EQ(SetEngineResolution(&bridge_, Resolution{1920, 1080},
                                SettingKey::kBaseResolution, &error),
            kClipForgeErrorNoResolutionsAvailable);
  EXPECT_NE(error.find("Base"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Display capture
// ---------------------------------------------------------------------------

TEST_F(CaptureSourceTest, DisplayModeUsesDisplaySizeAsBase) {
  Init();
  RecorderOptions options;
  CaptureScene scene;
  std::string error;
  ASSERT_EQ(builder_.Build(options, &scene, &error), kClipForgeOk) << error;

  EXPECT_EQ(scene.base, (Resolution{2560, 1440}));
  EXPECT_EQ(engine_.Value("Video", "Base"), "2560x1440");
  EXPECT_EQ(engine_.Value("Video", "Output"), "1920x1080");

  auto video = engine_.source(scene.video_source);
  EXPECT_EQ(video.type, kDisplayCaptureSourceType);
  EXPECT_EQ(video.settings["monitor"], "0");
  // Held by the scene item only.
  EXPECT_EQ(video.refs, 1);

  auto scene_record = engine_.source(scene.scene);
  EXPECT_EQ(scene_record.name, "main");
  EXPECT_EQ(scene_record.refs, 1);
  EXPECT_FLOAT_EQ(engine_.item(scene.item).scale_x, 1.0f);
  EXPECT_FLOAT_EQ(engine_.item(scene.item).scale_y, 1.0f);
}

TEST_F(CaptureSourceTest, UnknownDisplayIndexFails) {
  Init();
  RecorderOptions options;
  options.display_index = 2;
  CaptureScene scene;
  std::string error;
  EXPECT_EQ(builder_.Build(options, &scene, &error),
            kClipForgeErrorDisplayNotFound);
  EXPECT_EQ(error, "No such display with index: 1");
  EXPECT_EQ(scene.scene, kNoSource);
  EXPECT_EQ(engine_.live_sources(), 0u);
}

TEST_F(CaptureSourceTest, SecondDisplayIsSelectedByOneBasedIndex) {
  clipforge::internal::DisplayInfo second;
  second.index = 1;
  second.width = 1280;
  second.height = 720;
  engine_.displays.push_back(second);
  Init();

  RecorderOptions options;
  options.display_index = 2;
  CaptureScene scene;
  std::string error;
  ASSERT_EQ(builder_.Build(options, &scene, &error), kClipForgeOk);
  EXPECT_EQ(engine_.source(scene.video_source).settings["monitor"], "1");
  EXPECT_EQ(engine_.Value("Video", "Base"), "1280x720");
}

// ---------------------------------------------------------------------------
// Window capture
// ---------------------------------------------------------------------------

TEST_F(CaptureSourceTest, WindowModeTargetsWindowAndUsesOutputAsBase) {
  Init();
  RecorderOptions options;
  options.capture_mode = kClipForgeCaptureWindow;
  options.output_resolution = "1280x720";
  CaptureScene scene;
  std::string error;
  ASSERT_EQ(builder_.Build(options, &scene, &error), kClipForgeOk);

  EXPECT_EQ(scene.base, (Resolution{1280, 720}));
  EXPECT_EQ(engine_.Value("Video", "Base"), "1280x720");

  auto video = engine_.source(scene.video_source);
  EXPECT_EQ(video.type, kWindowCaptureSourceType);
  EXPECT_EQ(video.settings["window"], "World of Warcraft:GxWindowClass:Wow.exe");
  EXPECT_EQ(video.settings["capture_cursor"], "true");
  EXPECT_EQ(video.settings["priority"], "1");
}

// ---------------------------------------------------------------------------
// Failures leave nothing behind
// ---------------------------------------------------------------------------

TEST_F(CaptureSourceTest, InvalidModeFails) {
  Init();
  RecorderOptions options;
  options.capture_mode = 7;
  CaptureScene scene;
  std::string error;
  EXPECT_EQ(builder_.Build(options, &scene, &error),
            kClipForgeErrorInvalidCaptureMode);
  EXPECT_EQ(engine_.live_sources(), 0u);
}

TEST_F(CaptureSourceTest, MissingBaseListReleasesVideoSource) {
  engine_.base_resolutions.clear();
  Init();
  RecorderOptions options;
  CaptureScene scene;
  std::string error;
  EXPECT_EQ(builder_.Build(options, &scene, &error),
            kClipForgeErrorNoResolutionsAvailable);
  EXPECT_EQ(engine_.live_sources(), 0u);
}

TEST_F(CaptureSourceTest, SourceCreationFailureIsEngineFailure) {
  engine_.fail_create_source = true;
  Init();
  RecorderOptions options;
  CaptureScene scene;
  std::string error;
  EXPECT_EQ(builder_.Build(options, &scene, &error),
            kClipForgeErrorEngineFailure);
}

TEST_F(CaptureSourceTest, ReleaseDestroysSceneAndItsSource) {
  Init();
  RecorderOptions options;
  CaptureScene scene;
  std::string error;
  ASSERT_EQ(builder_.Build(options, &scene, &error), kClipForgeOk);
  ASSERT_EQ(engine_.live_sources(), 2u);

  builder_.Release(&scene);
  EXPECT_EQ(scene.scene, kNoSource);
  EXPECT_EQ(engine_.live_sources(), 0u);
}
