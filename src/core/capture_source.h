// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_CAPTURE_SOURCE_H_
#define CLIPFORGE_CORE_CAPTURE_SOURCE_H_

#include <string>

#include "clipforge/clipforge.h"
#include "core/engine.h"
#include "core/recorder_options.h"
#include "core/resolution.h"
#include "core/settings_bridge.h"

namespace clipforge {
namespace internal {

/// Name of the single scene the recorder renders.
constexpr char kSceneName[] = "main";

/// The video half of the output graph.
struct CaptureScene {
  SourceId scene = kNoSource;         // Owned reference.
  SourceId video_source = kNoSource;  // Kept alive by the scene item.
  SceneItemId item = 0;
  Resolution base;  // Canvas resolution the item is scaled against.
};

/// Snap @p res to the closest engine-supported value and write it as the
/// Video base (@p key == kBaseResolution) or output resolution.
ClipForgeError SetEngineResolution(SettingsBridge* settings,
                                   const Resolution& res, SettingKey key,
                                   std::string* out_error);

/// Creates the video capture source and the scene that wraps it.
class CaptureSourceBuilder {
 public:
  CaptureSourceBuilder(Engine* engine, SettingsBridge* settings)
      : engine_(engine), settings_(settings) {}

  /// Negotiate output and base resolutions, create the capture source for
  /// the configured mode and put it into a new scene at scale 1.0.
  /// On failure nothing created by this call is left behind.
  ClipForgeError Build(const RecorderOptions& options, CaptureScene* out,
                       std::string* out_error);

  /// Drop the recorder's reference to @p scene and reset it.
  void Release(CaptureScene* scene);

 private:
  SourceId CreateDisplaySource(int display_index);
  SourceId CreateWindowSource(const WindowTarget& target);

  Engine* engine_;            // Non-owning.
  SettingsBridge* settings_;  // Non-owning.
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_CAPTURE_SOURCE_H_
