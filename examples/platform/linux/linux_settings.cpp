// Copyright 2026 The clipforge Authors
// Linux implementation of IPlatformSettings using
// ~/.config/clipforge/recorder.ini.

#include "core/platform_settings.h"

#if defined(__linux__)

#include <sys/stat.h>

#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

class LinuxPlatformSettings : public IPlatformSettings {
 public:
  LinuxPlatformSettings() { Load(); }

  bool GetInt(const char* key, int* out_value) override {
    auto it = data_.find(key);
    if (it == data_.end()) return false;
    char* end = nullptr;
    long value = std::strtol(it->second.c_str(), &end, 10);
    if (end == it->second.c_str()) return false;
    *out_value = static_cast<int>(value);
    return true;
  }

  bool SetInt(const char* key, int value) override {
    data_[key] = std::to_string(value);
    return Save();
  }

  bool GetString(const char* key, std::string* out_value) override {
    auto it = data_.find(key);
    if (it == data_.end()) return false;
    *out_value = it->second;
    return true;
  }

  bool SetString(const char* key, const char* value) override {
    data_[key] = value ? value : "";
    return Save();
  }

  std::string Location() const override { return GetConfigPath(); }

 private:
  static std::string GetXDGConfigHome() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0]) return xdg;
    const char* home = std::getenv("HOME");
    if (home) return std::string(home) + "/.config";
    return "/tmp";
  }

  static std::string GetConfigDir() {
    return GetXDGConfigHome() + "/clipforge";
  }

  static std::string GetConfigPath() {
    return GetConfigDir() + "/recorder.ini";
  }

  static std::string Trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r')) s.pop_back();
    while (!s.empty() && s.front() == ' ') s.erase(s.begin());
    return s;
  }

  void Load() {
    data_.clear();
    std::ifstream f(GetConfigPath());
    if (!f) return;
    std::string line;
    while (std::getline(f, line)) {
      if (line.empty() || line[0] == '#' || line[0] == '[') continue;
      auto eq = line.find('=');
      if (eq == std::string::npos) continue;
      data_[Trim(line.substr(0, eq))] = Trim(line.substr(eq + 1));
    }
  }

  bool Save() {
    mkdir(GetConfigDir().c_str(), 0755);
    std::ofstream f(GetConfigPath());
    if (!f) return false;
    f << "[Recorder]\n";
    for (const auto& kv : data_) {
      f << kv.first << "=" << kv.second << "\n";
    }
    return f.good();
  }

  std::map<std::string, std::string> data_;
};

std::unique_ptr<IPlatformSettings> CreatePlatformSettings() {
  return std::make_unique<LinuxPlatformSettings>();
}

#endif  // __linux__
