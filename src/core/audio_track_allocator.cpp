// Copyright 2026 The clipforge Authors

#include "core/audio_track_allocator.h"

#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

uint64_t TrackMixerMask(int slot) {
  return 1ULL | (1ULL << (slot - 1));
}

uint64_t RecordedTracksMask(int next_slot) {
  int used = next_slot - 1;
  if (used <= 0) return 0;
  if (used >= 64) return ~0ULL;
  return (1ULL << used) - 1;
}

bool ShouldMuteDevice(const std::string& selector,
                      const std::string& device_id) {
  if (selector == kSelectNoDevice) return true;
  if (selector == kSelectAllDevices) return false;
  return selector != device_id;
}

void OutputTrackTable::ResetAll() {
  for (auto& slot : slots_) slot = TrackSlot();
}

int OutputTrackTable::AudioSourceCount() const {
  int count = 0;
  for (int slot = kFirstAudioSlot; slot < kMaxOutputSlots; ++slot) {
    if (slots_[slot].source != kNoSource) ++count;
  }
  return count;
}

void AudioTrackAllocator::ClearSources() {
  CLIPFORGE_LOG_DEBUG("Removing all output sources");

  // Channel 0 is never bound by the recorder.
  for (int slot = kMixTrackSlot; slot < kMaxOutputSlots; ++slot) {
    SourceId source = engine_->GetOutputSource(slot);
    if (source == kNoSource) continue;

    settings_->SetTrackName(slot, "");
    engine_->SetOutputSource(slot, kNoSource);
    engine_->RemoveSource(source);
    // Drops the reference GetOutputSource handed us.
    engine_->ReleaseSource(source);
  }
  table_.ResetAll();

  settings_->SetValue(SettingKey::kRecTracks, 0LL);
}

uint64_t AudioTrackAllocator::AllocateTracks(
    SourceId scene, const std::string& input_selector,
    const std::string& output_selector) {
  engine_->SetOutputSource(kMixTrackSlot, scene);
  settings_->SetTrackName(kMixTrackSlot, "Mixed: all sources");

  TrackSlot mix;
  mix.source = scene;
  mix.device_name = "Mixed: all sources";
  mix.mixers = 1;
  table_.Assign(kMixTrackSlot, std::move(mix));

  int slot = kFirstAudioSlot;
  slot = AllocateDevices(engine_->EnumerateAudioDevices(true), true,
                         input_selector, slot);
  slot = AllocateDevices(engine_->EnumerateAudioDevices(false), false,
                         output_selector, slot);

  uint64_t recorded = RecordedTracksMask(slot);
  settings_->SetValue(SettingKey::kRecTracks,
                      static_cast<long long>(recorded));
  CLIPFORGE_LOG_INFO("Allocated {} audio track(s), recorded tracks mask {:#x}",
                     slot - kFirstAudioSlot, recorded);
  return recorded;
}

int AudioTrackAllocator::AllocateDevices(
    const std::vector<AudioDeviceInfo>& devices, bool is_input,
    const std::string& selector, int slot) {
  const char* type = is_input ? kAudioInputSourceType : kAudioOutputSourceType;
  const char* direction = is_input ? "input" : "output";

  for (const auto& device : devices) {
    if (slot >= kMaxOutputSlots) {
      CLIPFORGE_LOG_WARN("No free output slot for audio {} device '{}'",
                         direction, device.name);
      break;
    }

    SourceSettings settings;
    settings["device_id"] = device.id;
    SourceId source = engine_->CreateSource(
        type, (is_input ? "mic-audio-" : "desktop-audio-") + std::to_string(slot),
        settings);
    if (source == kNoSource) {
      CLIPFORGE_LOG_ERROR("Failed to create audio {} source for '{}'",
                          direction, device.name);
      continue;
    }

    settings_->SetTrackName(slot, device.name);

    TrackSlot entry;
    entry.source = source;
    entry.device_id = device.id;
    entry.device_name = device.name;
    entry.is_input = is_input;
    entry.mixers = TrackMixerMask(slot);
    entry.muted = ShouldMuteDevice(selector, device.id);

    engine_->SetSourceAudioMixers(source, entry.mixers);
    engine_->SetSourceMuted(source, entry.muted);
    CLIPFORGE_LOG_INFO("Selecting audio {} device: {}{}", direction,
                       device.name, entry.muted ? " [MUTED]" : "");

    engine_->SetOutputSource(slot, source);
    // The output table holds its own reference now.
    engine_->ReleaseSource(source);

    table_.Assign(slot, std::move(entry));
    ++slot;
  }
  return slot;
}

}  // namespace internal
}  // namespace clipforge
