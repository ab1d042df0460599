// Copyright 2026 The clipforge Authors

#include "platform/linux/pulse_device_enumerator.h"

#if defined(__linux__)

#include <string>
#include <utility>

#include <pulse/pulseaudio.h>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

/// Shared state of one enumeration run on a private mainloop.
struct EnumerationState {
  bool is_input = false;
  std::string default_source;
  std::string default_sink;
  std::vector<AudioDeviceInfo> devices;
};

void OnServerInfo(pa_context*, const pa_server_info* info, void* userdata) {
  auto* state = static_cast<EnumerationState*>(userdata);
  if (!info) return;
  if (info->default_source_name) state->default_source = info->default_source_name;
  if (info->default_sink_name) state->default_sink = info->default_sink_name;
}

void OnSourceInfo(pa_context*, const pa_source_info* info, int eol,
                  void* userdata) {
  if (eol != 0 || !info) return;
  auto* state = static_cast<EnumerationState*>(userdata);
  // Monitors are reported through their sinks.
  if (info->monitor_of_sink != PA_INVALID_INDEX) return;

  AudioDeviceInfo device;
  device.id = info->name;
  device.name = info->description ? info->description : info->name;
  device.is_input = true;
  device.is_default = state->default_source == info->name;
  state->devices.push_back(std::move(device));
}

void OnSinkInfo(pa_context*, const pa_sink_info* info, int eol,
                void* userdata) {
  if (eol != 0 || !info) return;
  auto* state = static_cast<EnumerationState*>(userdata);
  if (!info->monitor_source_name) return;

  AudioDeviceInfo device;
  device.id = info->monitor_source_name;
  device.name = info->description ? info->description : info->name;
  device.is_input = false;
  device.is_default = state->default_sink == info->name;
  state->devices.push_back(std::move(device));
}

// Iterate @p loop until @p op finishes. Returns false if the loop failed.
bool RunOperation(pa_mainloop* loop, pa_operation* op) {
  if (!op) return false;
  bool ok = true;
  while (pa_operation_get_state(op) == PA_OPERATION_RUNNING) {
    if (pa_mainloop_iterate(loop, 1, nullptr) < 0) {
      ok = false;
      break;
    }
  }
  pa_operation_unref(op);
  return ok;
}

}  // namespace

std::vector<AudioDeviceInfo> PulseDeviceEnumerator::Enumerate(bool is_input) {
  EnumerationState state;
  state.is_input = is_input;

  pa_mainloop* loop = pa_mainloop_new();
  if (!loop) {
    CLIPFORGE_LOG_ERROR("pa_mainloop_new failed");
    return {};
  }
  pa_context* ctx =
      pa_context_new(pa_mainloop_get_api(loop), "clipforge-device-enum");
  if (!ctx) {
    CLIPFORGE_LOG_ERROR("pa_context_new failed");
    pa_mainloop_free(loop);
    return {};
  }

  bool ready = false;
  if (pa_context_connect(ctx, nullptr, PA_CONTEXT_NOFLAGS, nullptr) >= 0) {
    while (true) {
      pa_context_state_t cs = pa_context_get_state(ctx);
      if (cs == PA_CONTEXT_READY) {
        ready = true;
        break;
      }
      if (!PA_CONTEXT_IS_GOOD(cs)) break;
      if (pa_mainloop_iterate(loop, 1, nullptr) < 0) break;
    }
  }

  if (!ready) {
    CLIPFORGE_LOG_WARN("PulseAudio server unreachable: {}",
                       pa_strerror(pa_context_errno(ctx)));
  } else {
    RunOperation(loop, pa_context_get_server_info(ctx, OnServerInfo, &state));
    bool ok = is_input
                  ? RunOperation(loop, pa_context_get_source_info_list(
                                           ctx, OnSourceInfo, &state))
                  : RunOperation(loop, pa_context_get_sink_info_list(
                                           ctx, OnSinkInfo, &state));
    if (!ok) {
      CLIPFORGE_LOG_WARN("PulseAudio {} device listing failed",
                         is_input ? "input" : "output");
    }
    pa_context_disconnect(ctx);
  }

  pa_context_unref(ctx);
  pa_mainloop_free(loop);

  CLIPFORGE_LOG_DEBUG("Found {} audio {} device(s)", state.devices.size(),
                      is_input ? "input" : "output");
  return std::move(state.devices);
}

}  // namespace internal
}  // namespace clipforge

#endif  // __linux__
