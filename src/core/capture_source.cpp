// Copyright 2026 The clipforge Authors

#include "core/capture_source.h"

#include <vector>

#include "core/logger.h"

namespace clipforge {
namespace internal {

ClipForgeError SetEngineResolution(SettingsBridge* settings,
                                   const Resolution& res, SettingKey key,
                                   std::string* out_error) {
  std::vector<std::string> available = settings->GetAvailableValues(key);

  std::string closest;
  if (!FindClosestResolution(available, res, &closest)) {
    *out_error = "No resolutions available for " +
                 std::string(PathOf(key).parameter) + " (wanted " +
                 FormatResolution(res) + ")";
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorNoResolutionsAvailable;
  }

  CLIPFORGE_LOG_DEBUG("Resolution {} {} -> {}", PathOf(key).parameter,
                      FormatResolution(res), closest);
  settings->SetValue(key, closest);
  return kClipForgeOk;
}

ClipForgeError CaptureSourceBuilder::Build(const RecorderOptions& options,
                                           CaptureScene* out,
                                           std::string* out_error) {
  Resolution output;
  if (!ParseResolution(options.output_resolution, &output)) {
    *out_error = "Malformed output resolution '" + options.output_resolution +
                 "'";
    return kClipForgeErrorInvalidParam;
  }

  ClipForgeError err = SetEngineResolution(
      settings_, output, SettingKey::kOutputResolution, out_error);
  if (err != kClipForgeOk) return err;

  Resolution base;
  SourceId video = kNoSource;

  switch (options.capture_mode) {
    case kClipForgeCaptureDisplay: {
      // Options count displays from 1.
      int index = options.display_index - 1;
      CLIPFORGE_LOG_INFO("Display capture, zero-based display index {}", index);

      bool found = false;
      for (const auto& display : engine_->EnumerateDisplays()) {
        if (display.index == index) {
          base.width = display.width;
          base.height = display.height;
          found = true;
          break;
        }
      }
      if (!found) {
        *out_error = "No such display with index: " + std::to_string(index);
        CLIPFORGE_LOG_ERROR("{}", *out_error);
        return kClipForgeErrorDisplayNotFound;
      }
      video = CreateDisplaySource(index);
      break;
    }
    case kClipForgeCaptureWindow:
      base = output;
      video = CreateWindowSource(options.window);
      break;
    default:
      *out_error = "Invalid capture mode: " +
                   std::to_string(options.capture_mode);
      CLIPFORGE_LOG_ERROR("{}", *out_error);
      return kClipForgeErrorInvalidCaptureMode;
  }

  if (video == kNoSource) {
    *out_error = "Engine failed to create the video capture source";
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorEngineFailure;
  }

  err = SetEngineResolution(settings_, base, SettingKey::kBaseResolution,
                            out_error);
  if (err != kClipForgeOk) {
    engine_->ReleaseSource(video);
    return err;
  }

  SourceId scene = engine_->CreateScene(kSceneName);
  if (scene == kNoSource) {
    engine_->ReleaseSource(video);
    *out_error = "Engine failed to create scene";
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorEngineFailure;
  }

  SceneItemId item = engine_->AddSceneItem(scene, video);
  // The scene item holds its own reference from here on.
  engine_->ReleaseSource(video);
  if (item == 0) {
    engine_->ReleaseSource(scene);
    *out_error = "Engine failed to add the capture source to the scene";
    CLIPFORGE_LOG_ERROR("{}", *out_error);
    return kClipForgeErrorEngineFailure;
  }
  engine_->SetSceneItemScale(item, 1.0f, 1.0f);

  CLIPFORGE_LOG_INFO("Configured video input source with mode {}, base {}",
                     options.capture_mode == kClipForgeCaptureDisplay
                         ? "display"
                         : "window",
                     FormatResolution(base));

  out->scene = scene;
  out->video_source = video;
  out->item = item;
  out->base = base;
  return kClipForgeOk;
}

void CaptureSourceBuilder::Release(CaptureScene* scene) {
  if (scene->scene != kNoSource) engine_->ReleaseSource(scene->scene);
  *scene = CaptureScene();
}

SourceId CaptureSourceBuilder::CreateDisplaySource(int display_index) {
  SourceId source = engine_->CreateSource(kDisplayCaptureSourceType,
                                          "Display Capture", SourceSettings());
  if (source == kNoSource) return kNoSource;

  SourceSettings settings = engine_->GetSourceSettings(source);
  settings["monitor"] = std::to_string(display_index);
  engine_->UpdateSource(source, settings);
  return source;
}

SourceId CaptureSourceBuilder::CreateWindowSource(const WindowTarget& target) {
  SourceId source = engine_->CreateSource(kWindowCaptureSourceType,
                                          "Window Capture", SourceSettings());
  if (source == kNoSource) return kNoSource;

  SourceSettings settings = engine_->GetSourceSettings(source);
  settings["capture_cursor"] = "true";
  settings["capture_mode"] = "window";
  settings["allow_transparency"] = "true";
  settings["priority"] = "1";  // Exact title match.
  settings["window"] =
      target.title + ":" + target.window_class + ":" + target.executable;
  engine_->UpdateSource(source, settings);
  return source;
}

}  // namespace internal
}  // namespace clipforge
