// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_AUDIO_TRACK_ALLOCATOR_H_
#define CLIPFORGE_CORE_AUDIO_TRACK_ALLOCATOR_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/engine.h"
#include "core/settings_bridge.h"

namespace clipforge {
namespace internal {

/// Output slot carrying the mix of every source.
constexpr int kMixTrackSlot = 1;

/// First output slot handed to an audio device.
constexpr int kFirstAudioSlot = 2;

/// Device selector values with special meaning.
constexpr char kSelectAllDevices[] = "all";
constexpr char kSelectNoDevice[] = "none";

/// Mixer bitmask of the source in @p slot: the mix track plus its own track.
uint64_t TrackMixerMask(int slot);

/// "Recorded tracks" value once slots 1..next_slot-1 are in use, i.e.
/// 2^(next_slot-1) - 1.
uint64_t RecordedTracksMask(int next_slot);

/// Whether a device is muted under @p selector ("all", "none" or a device id).
bool ShouldMuteDevice(const std::string& selector,
                      const std::string& device_id);

/// Recorder-side record of one engine output slot.
struct TrackSlot {
  SourceId source = kNoSource;  // Engine handle; the engine's table owns it.
  std::string device_id;
  std::string device_name;
  bool is_input = false;
  bool muted = false;
  uint64_t mixers = 0;
};

/// Slot-indexed mirror of the engine's 64 output channels.
class OutputTrackTable {
 public:
  const TrackSlot& at(int slot) const { return slots_.at(slot); }

  void Assign(int slot, TrackSlot entry) { slots_.at(slot) = std::move(entry); }
  void Reset(int slot) { slots_.at(slot) = TrackSlot(); }
  void ResetAll();

  /// Number of audio device slots currently holding a source.
  int AudioSourceCount() const;

 private:
  std::array<TrackSlot, kMaxOutputSlots> slots_;
};

/// Builds the audio half of the output graph: one capture source per
/// enumerated device, each on its own output slot and on the mix track.
class AudioTrackAllocator {
 public:
  AudioTrackAllocator(Engine* engine, SettingsBridge* settings)
      : engine_(engine), settings_(settings) {}

  // Non-copyable.
  AudioTrackAllocator(const AudioTrackAllocator&) = delete;
  AudioTrackAllocator& operator=(const AudioTrackAllocator&) = delete;

  /// Detach and release every source bound to an output slot, clear the
  /// track names and zero the recorded-tracks setting.
  void ClearSources();

  /// Bind @p scene to the mix slot and allocate device slots, inputs first.
  /// Must follow ClearSources().
  /// @return The recorded-tracks bitmask written to the engine.
  uint64_t AllocateTracks(SourceId scene, const std::string& input_selector,
                          const std::string& output_selector);

  const OutputTrackTable& table() const { return table_; }

 private:
  /// Allocate one slot per device starting at @p slot. Returns the next
  /// free slot.
  int AllocateDevices(const std::vector<AudioDeviceInfo>& devices,
                      bool is_input, const std::string& selector, int slot);

  Engine* engine_;            // Non-owning.
  SettingsBridge* settings_;  // Non-owning.
  OutputTrackTable table_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_AUDIO_TRACK_ALLOCATOR_H_
