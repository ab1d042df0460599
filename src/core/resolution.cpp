// Copyright 2026 The clipforge Authors

#include "core/resolution.h"

#include <cstdlib>
#include <limits>

namespace clipforge {
namespace internal {

namespace {

bool ParsePositiveInt(const std::string& text, int* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') return false;
  if (value <= 0 || value > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(value);
  return true;
}

}  // namespace

bool ParseResolution(const std::string& text, Resolution* out) {
  if (!out) return false;
  auto sep = text.find('x');
  if (sep == std::string::npos) return false;

  Resolution res;
  if (!ParsePositiveInt(text.substr(0, sep), &res.width) ||
      !ParsePositiveInt(text.substr(sep + 1), &res.height)) {
    return false;
  }
  *out = res;
  return true;
}

std::string FormatResolution(const Resolution& res) {
  return std::to_string(res.width) + "x" + std::to_string(res.height);
}

long long ResolutionDistance(const Resolution& target,
                             const Resolution& candidate) {
  long long d = 2LL * (static_cast<long long>(target.width) - candidate.width) +
                4LL * (static_cast<long long>(target.height) - candidate.height);
  return d < 0 ? -d : d;
}

bool FindClosestResolution(const std::vector<std::string>& candidates,
                           const Resolution& target, std::string* out) {
  const std::string* best = nullptr;
  long long best_distance = 0;

  for (const auto& candidate : candidates) {
    Resolution res;
    if (!ParseResolution(candidate, &res)) continue;

    long long d = ResolutionDistance(target, res);
    // Strict comparison keeps the first of equally distant candidates.
    if (!best || d < best_distance) {
      best = &candidate;
      best_distance = d;
    }
  }

  if (!best) return false;
  if (out) *out = *best;
  return true;
}

}  // namespace internal
}  // namespace clipforge
