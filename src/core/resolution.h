// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_RESOLUTION_H_
#define CLIPFORGE_CORE_RESOLUTION_H_

#include <string>
#include <vector>

namespace clipforge {
namespace internal {

/// Width/height pair in pixels.
struct Resolution {
  int width = 0;
  int height = 0;

  bool operator==(const Resolution& o) const {
    return width == o.width && height == o.height;
  }
  bool operator!=(const Resolution& o) const { return !(*this == o); }
};

/// Parse "WxH" (e.g. "1920x1080"). Returns false on malformed input or
/// non-positive dimensions.
bool ParseResolution(const std::string& text, Resolution* out);

/// Format as "WxH".
std::string FormatResolution(const Resolution& res);

/// Distance used to rank candidates: |2*(dw) + 4*(dh)|. Width and height are
/// weighted differently so a resolution and its transpose never tie.
long long ResolutionDistance(const Resolution& target,
                             const Resolution& candidate);

/// Pick the candidate closest to @p target. Ties go to the earliest
/// candidate; unparseable candidates are skipped.
/// @return false if no usable candidate exists.
bool FindClosestResolution(const std::vector<std::string>& candidates,
                           const Resolution& target, std::string* out);

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_RESOLUTION_H_
