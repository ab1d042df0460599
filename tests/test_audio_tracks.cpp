// Copyright 2026 The clipforge Authors
// Tests for: AudioTrackAllocator, OutputTrackTable, track mask helpers

#include <string>

#include "core/audio_track_allocator.h"
#include "fake_engine.h"
#include "gtest/gtest.h"

using clipforge::internal::AudioTrackAllocator;
using clipforge::internal::RecordedTracksMask;
using clipforge::internal::SettingsBridge;
using clipforge::internal::ShouldMuteDevice;
using clipforge::internal::SourceId;
using clipforge::internal::TrackMixerMask;
using clipforge::internal::kAudioInputSourceType;
using clipforge::internal::kAudioOutputSourceType;
using clipforge::internal::kNoSource;
using clipforge::testing::FakeEngine;

// ---------------------------------------------------------------------------
// Mask helpers
// ---------------------------------------------------------------------------

TEST(TrackMaskTest, MixerMaskIsMixTrackPlusOwnTrack) {
  EXPECT_EQ(TrackMixerMask(1), 1u);
  EXPECT_EQ(TrackMixerMask(2), 3u);
  EXPECT_EQ(TrackMixerMask(3), 5u);
  EXPECT_EQ(TrackMixerMask(5), 17u);
}

TEST(TrackMaskTest, RecordedTracksCoverUsedSlots) {
  EXPECT_EQ(RecordedTracksMask(1), 0u);
  EXPECT_EQ(RecordedTracksMask(2), 1u);
  EXPECT_EQ(RecordedTracksMask(5), 15u);
  EXPECT_EQ(RecordedTracksMask(64), (1ULL << 63) - 1);
  EXPECT_EQ(RecordedTracksMask(65), ~0ULL);
}

TEST(TrackMaskTest, MuteSelector) {
  EXPECT_FALSE(ShouldMuteDevice("all", "mic-1"));
  EXPECT_TRUE(ShouldMuteDevice("none", "mic-1"));
  EXPECT_FALSE(ShouldMuteDevice("mic-1", "mic-1"));
  EXPECT_TRUE(ShouldMuteDevice("mic-2", "mic-1"));
}

// ---------------------------------------------------------------------------
// Allocation
// ---------------------------------------------------------------------------

class AudioTrackTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(engine_.Connect("test"));
    ASSERT_EQ(engine_.InitApi("en-US", "/tmp", "0"), 0);
    scene_ = engine_.CreateScene("main");
  }

  FakeEngine engine_;
  SettingsBridge bridge_{&engine_};
  AudioTrackAllocator tracks_{&engine_, &bridge_};
  SourceId scene_ = kNoSource;
};

TEST_F(AudioTrackTest, SceneGoesToMixSlot) {
  tracks_.AllocateTracks(scene_, "all", "all");
  EXPECT_EQ(engine_.channel(1), scene_);
  EXPECT_EQ(engine_.Value("Output", "Track1Name"), "Mixed: all sources");
  EXPECT_EQ(tracks_.table().at(1).source, scene_);
}

TEST_F(AudioTrackTest, InputsComeBeforeOutputs) {
  uint64_t recorded = tracks_.AllocateTracks(scene_, "all", "all");

  EXPECT_EQ(recorded, 15u);
  EXPECT_EQ(engine_.Value("Output", "RecTracks"), "15");

  auto mic = engine_.source(engine_.channel(2));
  EXPECT_EQ(mic.type, kAudioInputSourceType);
  EXPECT_EQ(mic.name, "mic-audio-2");
  EXPECT_EQ(mic.settings["device_id"], "mic-1");
  EXPECT_EQ(mic.mixers, 3u);

  auto speakers = engine_.source(engine_.channel(3));
  EXPECT_EQ(speakers.type, kAudioOutputSourceType);
  EXPECT_EQ(speakers.name, "desktop-audio-3");
  EXPECT_EQ(speakers.mixers, 5u);

  auto hdmi = engine_.source(engine_.channel(4));
  EXPECT_EQ(hdmi.settings["device_id"], "hdmi.monitor");
  EXPECT_EQ(hdmi.mixers, 9u);

  EXPECT_EQ(engine_.channel(5), kNoSource);
  EXPECT_EQ(tracks_.table().AudioSourceCount(), 3);

  EXPECT_EQ(engine_.Value("Output", "Track2Name"), "Built-in Microphone");
  EXPECT_EQ(engine_.Value("Output", "Track3Name"), "Speakers");
  EXPECT_EQ(engine_.Value("Output", "Track4Name"), "HDMI Audio");
}

TEST_F(AudioTrackTest, TwoInputsAndOneOutputTakeSlotsTwoToFour) {
  engine_.inputs.clear();
  engine_.outputs.clear();
  engine_.inputs.push_back(FakeEngine::Device("mic-1", "Headset", true, true));
  engine_.inputs.push_back(FakeEngine::Device("mic-2", "Webcam", true, false));
  engine_.outputs.push_back(
      FakeEngine::Device("speakers.monitor", "Speakers", false, true));

  EXPECT_EQ(tracks_.AllocateTracks(scene_, "all", "all"), 15u);

  auto first = engine_.source(engine_.channel(2));
  EXPECT_EQ(first.type, kAudioInputSourceType);
  EXPECT_EQ(first.settings["device_id"], "mic-1");
  EXPECT_EQ(first.mixers, 3u);

  auto second = engine_.source(engine_.channel(3));
  EXPECT_EQ(second.type, kAudioInputSourceType);
  EXPECT_EQ(second.name, "mic-audio-3");
  EXPECT_EQ(second.settings["device_id"], "mic-2");
  EXPECT_EQ(second.mixers, 5u);

  auto desktop = engine_.source(engine_.channel(4));
  EXPECT_EQ(desktop.type, kAudioOutputSourceType);
  EXPECT_EQ(desktop.name, "desktop-audio-4");
  EXPECT_EQ(desktop.mixers, 9u);

  EXPECT_EQ(engine_.Value("Output", "Track3Name"), "Webcam");
  EXPECT_EQ(engine_.Value("Output", "RecTracks"), "15");
}

TEST_F(AudioTrackTest, OutputTableOwnsTheOnlyReference) {
  tracks_.AllocateTracks(scene_, "all", "all");
  for (int slot = 2; slot <= 4; ++slot) {
    EXPECT_EQ(engine_.source(engine_.channel(slot)).refs, 1) << slot;
  }
}

TEST_F(AudioTrackTest, SelectorsMuteEveryOtherDevice) {
  tracks_.AllocateTracks(scene_, "none", "hdmi.monitor");

  EXPECT_TRUE(engine_.source(engine_.channel(2)).muted);
  EXPECT_TRUE(engine_.source(engine_.channel(3)).muted);
  EXPECT_FALSE(engine_.source(engine_.channel(4)).muted);

  // Muted devices keep their slot.
  EXPECT_EQ(tracks_.table().AudioSourceCount(), 3);
  EXPECT_TRUE(tracks_.table().at(2).muted);
  EXPECT_FALSE(tracks_.table().at(4).muted);
}

TEST_F(AudioTrackTest, NoDevicesRecordsOnlyMixTrack) {
  engine_.inputs.clear();
  engine_.outputs.clear();
  EXPECT_EQ(tracks_.AllocateTracks(scene_, "all", "all"), 1u);
  EXPECT_EQ(engine_.Value("Output", "RecTracks"), "1");
}

TEST_F(AudioTrackTest, FailedSourceIsSkipped) {
  engine_.fail_create_source = true;
  EXPECT_EQ(tracks_.AllocateTracks(scene_, "all", "all"), 1u);
  EXPECT_EQ(engine_.channel(2), kNoSource);
  EXPECT_EQ(tracks_.table().AudioSourceCount(), 0);
}

TEST_F(AudioTrackTest, DevicesBeyondLastSlotAreDropped) {
  engine_.inputs.clear();
  engine_.outputs.clear();
  for (int i = 0; i < 70; ++i) {
    engine_.inputs.push_back(FakeEngine::Device(
        "mic-" + std::to_string(i), "Mic " + std::to_string(i), true, false));
  }
  tracks_.AllocateTracks(scene_, "all", "all");

  EXPECT_EQ(tracks_.table().AudioSourceCount(), 62);
  EXPECT_NE(engine_.channel(63), kNoSource);
  EXPECT_EQ(engine_.source(engine_.channel(63)).settings["device_id"], "mic-61");
}

// ---------------------------------------------------------------------------
// Clearing
// ---------------------------------------------------------------------------

TEST_F(AudioTrackTest, ClearReleasesEverySlot) {
  tracks_.AllocateTracks(scene_, "all", "all");
  SourceId mic = engine_.channel(2);

  tracks_.ClearSources();

  for (int slot = 0; slot < clipforge::internal::kMaxOutputSlots; ++slot) {
    EXPECT_EQ(engine_.channel(slot), kNoSource) << slot;
  }
  EXPECT_FALSE(engine_.HasSource(mic));
  EXPECT_EQ(engine_.Value("Output", "RecTracks"), "0");
  EXPECT_EQ(engine_.Value("Output", "Track1Name"), "");
  EXPECT_EQ(engine_.Value("Output", "Track2Name"), "");
  EXPECT_EQ(tracks_.table().AudioSourceCount(), 0);
  EXPECT_EQ(tracks_.table().at(1).source, kNoSource);
}

TEST_F(AudioTrackTest, ClearDoesNotDestroyCallerSceneReference) {
  tracks_.AllocateTracks(scene_, "all", "all");
  tracks_.ClearSources();
  ASSERT_TRUE(engine_.HasSource(scene_));
  EXPECT_EQ(engine_.source(scene_).refs, 1);
}

TEST_F(AudioTrackTest, ReallocationDoesNotLeakSources) {
  tracks_.AllocateTracks(scene_, "all", "all");
  size_t live = engine_.live_sources();

  for (int i = 0; i < 3; ++i) {
    tracks_.ClearSources();
    tracks_.AllocateTracks(scene_, "all", "all");
  }
  EXPECT_EQ(engine_.live_sources(), live);
  EXPECT_EQ(tracks_.table().AudioSourceCount(), 3);
}
