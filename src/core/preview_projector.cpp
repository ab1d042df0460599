// Copyright 2026 The clipforge Authors

#include "core/preview_projector.h"

#include <cmath>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

bool ValidBounds(const ClipForgeBounds& bounds) {
  return std::isfinite(bounds.x) && std::isfinite(bounds.y) &&
         bounds.width >= 1.0 && bounds.height > 0.0 &&
         std::isfinite(bounds.width) && std::isfinite(bounds.height);
}

}  // namespace

PreviewGeometry ComputePreviewGeometry(const ClipForgeBounds& bounds) {
  PreviewGeometry geo;
  double aspect = bounds.width / bounds.height;
  geo.width = static_cast<int>(std::floor(bounds.width));
  geo.height = static_cast<int>(std::lround(geo.width / aspect));
  geo.x = static_cast<int>(std::floor(bounds.x));
  geo.y = static_cast<int>(std::floor(bounds.y));
  return geo;
}

ClipForgeError PreviewProjector::Setup(ClipForgeWindowId host_window,
                                       const std::string& scene_name,
                                       const ClipForgeBounds& bounds,
                                       int* out_height,
                                       std::string* out_error) {
  if (!ValidBounds(bounds)) {
    *out_error = "Preview bounds must have a positive size";
    return kClipForgeErrorInvalidParam;
  }

  Destroy();

  if (!engine_->CreatePreviewDisplay(host_window, scene_name,
                                     kPreviewDisplayId)) {
    *out_error = "Engine failed to create the preview display";
    CLIPFORGE_LOG_ERROR("{} (window {:#x}, scene '{}')", *out_error,
                        host_window, scene_name);
    return kClipForgeErrorEngineFailure;
  }
  attached_ = true;

  engine_->SetPreviewShouldDrawUI(kPreviewDisplayId, false);
  engine_->SetPreviewPaddingSize(kPreviewDisplayId, 0);

  return Resize(bounds, out_height, out_error);
}

ClipForgeError PreviewProjector::Resize(const ClipForgeBounds& bounds,
                                        int* out_height,
                                        std::string* out_error) {
  if (!attached_) {
    *out_error = "Preview is not set up";
    return kClipForgeErrorNotInitialized;
  }
  if (!ValidBounds(bounds)) {
    *out_error = "Preview bounds must have a positive size";
    return kClipForgeErrorInvalidParam;
  }

  PreviewGeometry geo = ComputePreviewGeometry(bounds);
  engine_->ResizePreviewDisplay(kPreviewDisplayId, geo.width, geo.height);
  engine_->MovePreviewDisplay(kPreviewDisplayId, geo.x, geo.y);
  CLIPFORGE_LOG_DEBUG("Preview at {},{} size {}x{}", geo.x, geo.y, geo.width,
                      geo.height);

  if (out_height) *out_height = geo.height;
  return kClipForgeOk;
}

void PreviewProjector::Destroy() {
  if (!attached_) return;
  engine_->DestroyPreviewDisplay(kPreviewDisplayId);
  attached_ = false;
}

}  // namespace internal
}  // namespace clipforge
