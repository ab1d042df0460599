// Copyright 2026 The clipforge Authors
//
// IPlatformSettings: persistent settings of the demo recorder.
//
// Linux:    ~/.config/clipforge/recorder.ini

#ifndef CLIPFORGE_EXAMPLES_CORE_PLATFORM_SETTINGS_H_
#define CLIPFORGE_EXAMPLES_CORE_PLATFORM_SETTINGS_H_

#include <memory>
#include <string>

class IPlatformSettings {
 public:
  virtual ~IPlatformSettings() = default;

  /// Read a 32-bit integer setting.  Returns true on success.
  virtual bool GetInt(const char* key, int* out_value) = 0;

  /// Write a 32-bit integer setting.  Returns true on success.
  virtual bool SetInt(const char* key, int value) = 0;

  /// Read a UTF-8 string setting.  Returns true if the key exists.
  virtual bool GetString(const char* key, std::string* out_value) = 0;

  /// Write a UTF-8 string setting.  Returns true on success.
  virtual bool SetString(const char* key, const char* value) = 0;

  /// Path of the backing file, for messages.
  virtual std::string Location() const = 0;

 protected:
  IPlatformSettings() = default;

 private:
  IPlatformSettings(const IPlatformSettings&) = delete;
  IPlatformSettings& operator=(const IPlatformSettings&) = delete;
};

/// Factory: returns the platform-specific implementation.
std::unique_ptr<IPlatformSettings> CreatePlatformSettings();

#endif  // CLIPFORGE_EXAMPLES_CORE_PLATFORM_SETTINGS_H_
