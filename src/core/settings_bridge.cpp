// Copyright 2026 The clipforge Authors

#include "core/settings_bridge.h"

#include <algorithm>

#include "core/logger.h"

namespace clipforge {
namespace internal {

SettingPath PathOf(SettingKey key) {
  switch (key) {
    case SettingKey::kOutputMode:
      return {"Output", "Untitled", "Mode"};
    case SettingKey::kRecEncoder:
      return {"Output", "Recording", "RecEncoder"};
    case SettingKey::kRecFilePath:
      return {"Output", "Recording", "RecFilePath"};
    case SettingKey::kRecFormat:
      return {"Output", "Recording", "RecFormat"};
    case SettingKey::kRecRateControl:
      return {"Output", "Recording", "Recrate_control"};
    case SettingKey::kRecBitrate:
      return {"Output", "Recording", "Recbitrate"};
    case SettingKey::kRecMaxBitrate:
      return {"Output", "Recording", "Recmax_bitrate"};
    case SettingKey::kRecTracks:
      return {"Output", "Recording", "RecTracks"};
    case SettingKey::kVideoFps:
      return {"Video", "Untitled", "FPSCommon"};
    case SettingKey::kBaseResolution:
      return {"Video", "Untitled", "Base"};
    case SettingKey::kOutputResolution:
      return {"Video", "Untitled", "Output"};
  }
  return {"", "", ""};
}

SettingWriteResult SettingsBridge::SetValue(const std::string& category,
                                            const std::string& parameter,
                                            const std::string& value) {
  CLIPFORGE_LOG_DEBUG("setValue {}.{} = '{}'", category, parameter, value);

  SettingsCategory settings;
  if (!engine_->GetSettings(category, &settings)) {
    CLIPFORGE_LOG_WARN("There is no category {} in engine settings", category);
    return SettingWriteResult::kNotFound;
  }

  bool found = false;
  bool changed = false;
  for (auto& sub : settings) {
    for (auto& param : sub.parameters) {
      if (param.name != parameter) continue;
      found = true;
      if (param.current_value != value) {
        param.current_value = value;
        changed = true;
      }
    }
  }

  if (!found) {
    CLIPFORGE_LOG_WARN("Engine has no parameter {} in category {}; ignored",
                       parameter, category);
    return SettingWriteResult::kNotFound;
  }
  if (!changed) return SettingWriteResult::kUnchanged;

  if (!engine_->SaveSettings(category, settings)) {
    CLIPFORGE_LOG_ERROR("Engine rejected settings for category {} ({} = '{}')",
                        category, parameter, value);
    return SettingWriteResult::kSaveFailed;
  }
  return SettingWriteResult::kWritten;
}

SettingWriteResult SettingsBridge::SetValue(SettingKey key,
                                            const std::string& value) {
  SettingPath path = PathOf(key);
  return SetValue(path.category, path.parameter, value);
}

SettingWriteResult SettingsBridge::SetValue(SettingKey key, long long value) {
  return SetValue(key, std::to_string(value));
}

SettingWriteResult SettingsBridge::SetTrackName(int slot,
                                                const std::string& name) {
  return SetValue("Output", "Track" + std::to_string(slot) + "Name", name);
}

std::vector<std::string> SettingsBridge::GetAvailableValues(
    const std::string& category, const std::string& subcategory,
    const std::string& parameter) {
  SettingsCategory settings;
  if (!engine_->GetSettings(category, &settings)) {
    CLIPFORGE_LOG_WARN("There is no category {} in engine settings", category);
    return {};
  }

  auto sub = std::find_if(settings.begin(), settings.end(),
                          [&](const SettingsSubcategory& s) {
                            return s.name == subcategory;
                          });
  if (sub == settings.end()) {
    CLIPFORGE_LOG_WARN("There is no subcategory {} in engine category {}",
                       subcategory, category);
    return {};
  }

  auto param = std::find_if(sub->parameters.begin(), sub->parameters.end(),
                            [&](const SettingsParameter& p) {
                              return p.name == parameter;
                            });
  if (param == sub->parameters.end()) {
    CLIPFORGE_LOG_WARN("There is no parameter {} in engine settings {}.{}",
                       parameter, category, subcategory);
    return {};
  }

  return param->values;
}

std::vector<std::string> SettingsBridge::GetAvailableValues(SettingKey key) {
  SettingPath path = PathOf(key);
  return GetAvailableValues(path.category, path.subcategory, path.parameter);
}

}  // namespace internal
}  // namespace clipforge
