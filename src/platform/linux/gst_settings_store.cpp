// Copyright 2026 The clipforge Authors

#include "platform/linux/gst_settings_store.h"

#if defined(__linux__)

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <utility>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

SettingsParameter Param(const std::string& name, const std::string& value,
                        std::vector<std::string> values = {}) {
  SettingsParameter p;
  p.name = name;
  p.current_value = value;
  p.values = std::move(values);
  return p;
}

bool Permitted(const SettingsParameter& param, const std::string& value) {
  if (param.values.empty()) return true;
  return std::find(param.values.begin(), param.values.end(), value) !=
         param.values.end();
}

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return std::string();
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::vector<std::string> CommonResolutions() {
  return {"3840x2160", "2560x1440", "1920x1200", "1920x1080", "1680x1050",
          "1600x900",  "1440x900",  "1366x768",  "1280x1024", "1280x720",
          "1024x768",  "854x480",   "640x360"};
}

void GstSettingsStore::Reset(const SettingsChoices& choices) {
  categories_.clear();
  path_.clear();

  SettingsSubcategory output_general{"Untitled", {}};
  output_general.parameters.push_back(
      Param("Mode", "Simple", {"Simple", "Advanced"}));

  SettingsSubcategory recording{"Recording", {}};
  recording.parameters.push_back(
      Param("RecEncoder",
            choices.encoders.empty() ? std::string() : choices.encoders.front(),
            choices.encoders));
  recording.parameters.push_back(Param("RecFilePath", ""));
  recording.parameters.push_back(Param("RecFormat", "mp4", {"mp4", "mkv"}));
  recording.parameters.push_back(
      Param("Recrate_control", "CBR", {"CBR", "VBR"}));
  recording.parameters.push_back(Param("Recbitrate", "2500"));
  recording.parameters.push_back(Param("Recmax_bitrate", "5000"));
  recording.parameters.push_back(Param("RecTracks", "1"));

  SettingsCategory output{output_general, recording};
  for (int track = 1; track <= kEngineAudioTracks; ++track) {
    SettingsSubcategory sub{"Audio - Track " + std::to_string(track), {}};
    sub.parameters.push_back(
        Param("Track" + std::to_string(track) + "Name", ""));
    output.push_back(std::move(sub));
  }
  categories_["Output"] = std::move(output);

  SettingsSubcategory video_general{"Untitled", {}};
  video_general.parameters.push_back(
      Param("Base",
            choices.base_resolutions.empty() ? std::string()
                                             : choices.base_resolutions.front(),
            choices.base_resolutions));
  video_general.parameters.push_back(
      Param("Output",
            choices.output_resolutions.empty()
                ? std::string()
                : choices.output_resolutions.front(),
            choices.output_resolutions));
  video_general.parameters.push_back(Param("FPSCommon", "30"));
  categories_["Video"] = SettingsCategory{video_general};
}

bool GstSettingsStore::Load(const std::string& path) {
  path_ = path;

  std::ifstream f(path);
  if (!f) {
    CLIPFORGE_LOG_DEBUG("No engine settings at {}; using defaults", path);
    return true;
  }

  std::string category;
  std::string subcategory;
  std::string line;
  int applied = 0;
  while (std::getline(f, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.front() == '[' && line.back() == ']') {
      std::string section = line.substr(1, line.size() - 2);
      size_t slash = section.find('/');
      category = section.substr(0, slash);
      subcategory = slash == std::string::npos ? std::string()
                                               : section.substr(slash + 1);
      continue;
    }
    size_t eq = line.find('=');
    if (eq == std::string::npos) continue;

    SettingsParameter* param =
        Find(category, subcategory, Trim(line.substr(0, eq)));
    std::string value = Trim(line.substr(eq + 1));
    if (!param || !Permitted(*param, value)) continue;
    param->current_value = value;
    ++applied;
  }
  CLIPFORGE_LOG_DEBUG("Loaded {} engine setting(s) from {}", applied, path);
  return true;
}

bool GstSettingsStore::Get(const std::string& category,
                           SettingsCategory* out) const {
  auto it = categories_.find(category);
  if (it == categories_.end()) return false;
  *out = it->second;
  return true;
}

bool GstSettingsStore::Save(const std::string& category,
                            const SettingsCategory& settings) {
  auto it = categories_.find(category);
  if (it == categories_.end()) return false;

  SettingsCategory updated = it->second;
  for (const auto& sub : settings) {
    for (const auto& incoming : sub.parameters) {
      for (auto& own_sub : updated) {
        if (own_sub.name != sub.name) continue;
        for (auto& param : own_sub.parameters) {
          if (param.name != incoming.name) continue;
          if (!Permitted(param, incoming.current_value)) {
            CLIPFORGE_LOG_WARN("Value '{}' not permitted for {}.{}",
                               incoming.current_value, category, param.name);
            return false;
          }
          param.current_value = incoming.current_value;
        }
      }
    }
  }

  it->second = std::move(updated);
  return Persist();
}

std::string GstSettingsStore::Value(const std::string& category,
                                    const std::string& parameter) const {
  auto it = categories_.find(category);
  if (it == categories_.end()) return std::string();
  for (const auto& sub : it->second) {
    for (const auto& param : sub.parameters) {
      if (param.name == parameter) return param.current_value;
    }
  }
  return std::string();
}

long long GstSettingsStore::IntValue(const std::string& category,
                                     const std::string& parameter,
                                     long long fallback) const {
  std::string value = Value(category, parameter);
  if (value.empty()) return fallback;
  char* end = nullptr;
  long long result = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str()) return fallback;
  return result;
}

SettingsParameter* GstSettingsStore::Find(const std::string& category,
                                          const std::string& subcategory,
                                          const std::string& parameter) {
  auto it = categories_.find(category);
  if (it == categories_.end()) return nullptr;
  for (auto& sub : it->second) {
    if (sub.name != subcategory) continue;
    for (auto& param : sub.parameters) {
      if (param.name == parameter) return &param;
    }
  }
  return nullptr;
}

bool GstSettingsStore::Persist() const {
  if (path_.empty()) return true;

  std::ofstream f(path_);
  if (!f) {
    CLIPFORGE_LOG_ERROR("Cannot write engine settings to {}", path_);
    return false;
  }
  for (const auto& category : categories_) {
    for (const auto& sub : category.second) {
      f << "[" << category.first << "/" << sub.name << "]\n";
      for (const auto& param : sub.parameters) {
        f << param.name << "=" << param.current_value << "\n";
      }
      f << "\n";
    }
  }
  return f.good();
}

}  // namespace internal
}  // namespace clipforge

#endif  // __linux__
