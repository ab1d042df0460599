// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_PLATFORM_LINUX_GST_SETTINGS_STORE_H_
#define CLIPFORGE_PLATFORM_LINUX_GST_SETTINGS_STORE_H_

#include <map>
#include <string>
#include <vector>

#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Number of audio tracks the recording output can carry.
constexpr int kEngineAudioTracks = 6;

/// Lists the engine offers for constrained parameters.
struct SettingsChoices {
  std::vector<std::string> encoders;            // Usable H.264 encoders
  std::vector<std::string> base_resolutions;    // Canvas sizes
  std::vector<std::string> output_resolutions;  // Encoded sizes
};

/// Default canvas / output resolution list, largest first.
std::vector<std::string> CommonResolutions();

/// Category/subcategory/parameter tree of the GStreamer engine, persisted
/// as an INI file (one [Category/Subcategory] section per subcategory).
///
/// Not thread-safe; GstEngine serializes access.
class GstSettingsStore {
 public:
  GstSettingsStore() = default;

  /// Rebuild the tree with default values for @p choices. Forgets the
  /// persistence path.
  void Reset(const SettingsChoices& choices);

  /// Overlay persisted values from @p path and persist there from now on.
  /// A missing file is not an error.
  bool Load(const std::string& path);

  bool Get(const std::string& category, SettingsCategory* out) const;

  /// Accept new current values for @p category. Unknown parameters are
  /// ignored; a value outside a parameter's permitted list rejects the
  /// whole save.
  bool Save(const std::string& category, const SettingsCategory& settings);

  /// Current value of the first parameter named @p parameter ("" if none).
  std::string Value(const std::string& category,
                    const std::string& parameter) const;
  long long IntValue(const std::string& category, const std::string& parameter,
                     long long fallback) const;

  const std::string& path() const { return path_; }

 private:
  SettingsParameter* Find(const std::string& category,
                          const std::string& subcategory,
                          const std::string& parameter);
  bool Persist() const;

  std::map<std::string, SettingsCategory> categories_;
  std::string path_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_PLATFORM_LINUX_GST_SETTINGS_STORE_H_
