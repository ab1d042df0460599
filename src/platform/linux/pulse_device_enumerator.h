// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_PLATFORM_LINUX_PULSE_DEVICE_ENUMERATOR_H_
#define CLIPFORGE_PLATFORM_LINUX_PULSE_DEVICE_ENUMERATOR_H_

#include <vector>

#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Lists PulseAudio capture devices.
///
/// Inputs are the non-monitor sources (microphones). Outputs are the sinks,
/// reported by the name of their monitor source so pulsesrc can record them.
/// Each call opens and closes its own short-lived server connection.
class PulseDeviceEnumerator {
 public:
  PulseDeviceEnumerator() = default;

  // Non-copyable.
  PulseDeviceEnumerator(const PulseDeviceEnumerator&) = delete;
  PulseDeviceEnumerator& operator=(const PulseDeviceEnumerator&) = delete;

  /// Empty (with a warning) if the server is unreachable.
  std::vector<AudioDeviceInfo> Enumerate(bool is_input);
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_PLATFORM_LINUX_PULSE_DEVICE_ENUMERATOR_H_
