// Copyright 2026 The clipforge Authors
//
// clipforge_demo -- records the screen (or a window) for a few seconds.
//
// Usage: clipforge_demo [seconds]
//
// Recorder options are read from ~/.config/clipforge/recorder.ini, e.g.
//
//   [Recorder]
//   capture_mode=display
//   display_index=1
//   output_resolution=1920x1080
//   kbit_rate=15000
//   fps=60
//   encoder=auto
//   buffer_storage_dir=/home/me/Videos/clips
//   audio_input_device=all
//   audio_output_device=all
//   window_title=World of Warcraft
//
// capture_mode is "display" or "window"; the audio device keys take "all",
// "none" or a device id.

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "clipforge/clipforge.hpp"
#include "core/platform_settings.h"

namespace {

clipforge::Options LoadOptions(IPlatformSettings* settings) {
  clipforge::Options options;
  std::string text;

  if (settings->GetString("capture_mode", &text) && text == "window") {
    options.capture_mode = kClipForgeCaptureWindow;
  }
  settings->GetInt("display_index", &options.display_index);
  settings->GetString("output_resolution", &options.output_resolution);
  settings->GetInt("kbit_rate", &options.kbit_rate);
  settings->GetInt("fps", &options.fps);
  settings->GetString("encoder", &options.encoder);
  settings->GetString("buffer_storage_dir", &options.buffer_storage_dir);
  settings->GetString("audio_input_device", &options.audio_input_device_id);
  settings->GetString("audio_output_device", &options.audio_output_device_id);
  settings->GetString("window_title", &options.window_title);
  settings->GetString("window_class", &options.window_class);
  settings->GetString("window_executable", &options.window_executable);
  return options;
}

void PrintEnvironment(clipforge::Recorder& recorder) {
  std::printf("Displays:\n");
  for (const auto& d : recorder.EnumerateDisplays()) {
    std::printf("  [%d] %s %dx%d%s\n", d.index + 1, d.name, d.width, d.height,
                d.is_primary ? " (primary)" : "");
  }

  std::printf("Audio inputs:\n");
  for (const auto& dev : recorder.EnumerateAudioDevices(true)) {
    std::printf("  %s  %s%s\n", dev.id, dev.name,
                dev.is_default ? " (default)" : "");
  }
  std::printf("Audio outputs:\n");
  for (const auto& dev : recorder.EnumerateAudioDevices(false)) {
    std::printf("  %s  %s%s\n", dev.id, dev.name,
                dev.is_default ? " (default)" : "");
  }

  std::printf("Encoders:");
  for (const auto& name : recorder.AvailableEncoders()) {
    std::printf(" %s", name.c_str());
  }
  std::printf("\nOutput resolutions:");
  for (const auto& res : recorder.AvailableResolutions(
           kClipForgeResolutionOutput)) {
    std::printf(" %s", res.text);
  }
  std::printf("\n");
}

}  // namespace

int main(int argc, char** argv) {
  int seconds = argc > 1 ? std::atoi(argv[1]) : 10;
  if (seconds <= 0) {
    std::fprintf(stderr, "Usage: %s [seconds]\n", argv[0]);
    return 2;
  }

  std::printf("clipforge %s\n", clipforge::version_string());
  clipforge_set_log_level(kClipForgeLogInfo);

  auto settings = CreatePlatformSettings();
  clipforge::Options options = LoadOptions(settings.get());
  std::printf("Options from %s\n", settings->Location().c_str());

  try {
    clipforge::Recorder recorder;
    recorder.Initialize(options);
    PrintEnvironment(recorder);

    std::printf("Recording for %d second(s)...\n", seconds);
    recorder.Start();
    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    recorder.Stop();

    std::string path = recorder.LastRecording();
    std::printf("Wrote %s\n", path.empty() ? "(nothing)" : path.c_str());
    recorder.Shutdown();
  } catch (const clipforge::Error& e) {
    std::fprintf(stderr, "clipforge error %d: %s\n", static_cast<int>(e.code()),
                 e.what());
    return 1;
  }
  return 0;
}
