// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_PREVIEW_PROJECTOR_H_
#define CLIPFORGE_CORE_PREVIEW_PROJECTOR_H_

#include <string>

#include "clipforge/clipforge.h"
#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Engine id of the one preview display a recorder owns.
constexpr char kPreviewDisplayId[] = "display1";

/// Integer placement of the preview inside the host window.
struct PreviewGeometry {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

/// Width is floored, height derived from the bounds' aspect ratio and
/// rounded, origin floored.
PreviewGeometry ComputePreviewGeometry(const ClipForgeBounds& bounds);

/// Projects the scene onto a region of a host window.
class PreviewProjector {
 public:
  explicit PreviewProjector(Engine* engine) : engine_(engine) {}

  // Non-copyable.
  PreviewProjector(const PreviewProjector&) = delete;
  PreviewProjector& operator=(const PreviewProjector&) = delete;

  /// Create the preview display for @p scene_name on @p host_window and
  /// size it. An existing preview is replaced.
  ClipForgeError Setup(ClipForgeWindowId host_window,
                       const std::string& scene_name,
                       const ClipForgeBounds& bounds, int* out_height,
                       std::string* out_error);

  /// Resize then move the preview. Returns the applied height through
  /// @p out_height.
  ClipForgeError Resize(const ClipForgeBounds& bounds, int* out_height,
                        std::string* out_error);

  /// Destroy the preview display if one exists.
  void Destroy();

  bool attached() const { return attached_; }

 private:
  Engine* engine_;  // Non-owning.
  bool attached_ = false;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_PREVIEW_PROJECTOR_H_
