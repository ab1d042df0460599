// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_SETTINGS_BRIDGE_H_
#define CLIPFORGE_CORE_SETTINGS_BRIDGE_H_

#include <string>
#include <vector>

#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Engine parameters the recorder writes or queries.
enum class SettingKey {
  kOutputMode,        // Output / Untitled / Mode
  kRecEncoder,        // Output / Recording / RecEncoder
  kRecFilePath,       // Output / Recording / RecFilePath
  kRecFormat,         // Output / Recording / RecFormat
  kRecRateControl,    // Output / Recording / Recrate_control
  kRecBitrate,        // Output / Recording / Recbitrate
  kRecMaxBitrate,     // Output / Recording / Recmax_bitrate
  kRecTracks,         // Output / Recording / RecTracks
  kVideoFps,          // Video / Untitled / FPSCommon
  kBaseResolution,    // Video / Untitled / Base
  kOutputResolution,  // Video / Untitled / Output
};

/// Location of a parameter in the engine settings tree.
struct SettingPath {
  const char* category;
  const char* subcategory;
  const char* parameter;
};

SettingPath PathOf(SettingKey key);

/// Outcome of a settings write.
enum class SettingWriteResult {
  kUnchanged,   // Parameter already held the value; nothing persisted.
  kWritten,     // Value changed and the category was saved.
  kNotFound,    // Soft miss: the engine has no such parameter.
  kSaveFailed,  // The engine rejected the save.
};

/// Read/write access to the engine's category/subcategory/parameter tree.
///
/// Writes are idempotent: a category is only saved when a value actually
/// changes. Missing categories or parameters never fail the caller; they are
/// logged and reported as soft misses.
class SettingsBridge {
 public:
  explicit SettingsBridge(Engine* engine) : engine_(engine) {}

  /// Set every parameter named @p parameter in @p category, searching all
  /// subcategories.
  SettingWriteResult SetValue(const std::string& category,
                              const std::string& parameter,
                              const std::string& value);

  SettingWriteResult SetValue(SettingKey key, const std::string& value);
  SettingWriteResult SetValue(SettingKey key, long long value);

  /// Name the audio track in output @p slot (Output / Track<slot>Name).
  SettingWriteResult SetTrackName(int slot, const std::string& name);

  /// Permitted values of a parameter, in engine order. Empty (with a
  /// warning) if the category, subcategory or parameter does not exist.
  std::vector<std::string> GetAvailableValues(const std::string& category,
                                              const std::string& subcategory,
                                              const std::string& parameter);

  std::vector<std::string> GetAvailableValues(SettingKey key);

 private:
  Engine* engine_;  // Non-owning.
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_CORE_SETTINGS_BRIDGE_H_
