// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_PLATFORM_LINUX_X11_DISPLAY_BACKEND_H_
#define CLIPFORGE_PLATFORM_LINUX_X11_DISPLAY_BACKEND_H_

#include <cstdint>
#include <string>
#include <vector>

#include "core/engine.h"

namespace clipforge {
namespace internal {

/// Top-level X11 window as seen by window lookup.
struct X11WindowInfo {
  uint64_t id = 0;
  int width = 0;
  int height = 0;
  std::string title;
  std::string window_class;
  std::string process_name;
};

/// X11 display connection: screen enumeration and window lookup for the
/// capture sources.
class X11DisplayBackend {
 public:
  X11DisplayBackend() = default;
  ~X11DisplayBackend();

  // Non-copyable.
  X11DisplayBackend(const X11DisplayBackend&) = delete;
  X11DisplayBackend& operator=(const X11DisplayBackend&) = delete;

  /// Open the display named by $DISPLAY.
  bool Open();
  void Close();
  bool is_open() const { return display_ != nullptr; }

  /// Name of the opened display (e.g. ":0"), for ximagesrc.
  const std::string& display_name() const { return display_name_; }

  /// One entry per X screen, in screen order.
  std::vector<DisplayInfo> GetDisplays();

  /// Viewable top-level windows, topmost last when the window manager
  /// supports EWMH.
  std::vector<X11WindowInfo> EnumerateWindows();

  /// Find the window whose title is exactly @p title. Among several, one
  /// whose class or process also matches wins. Returns 0 if none.
  uint64_t FindWindow(const std::string& title,
                      const std::string& window_class,
                      const std::string& executable);

  /// Current size of @p window. Returns false if it no longer exists.
  bool GetWindowSize(uint64_t window, int* width, int* height);

 private:
  void* display_ = nullptr;  // Display* from X11
  std::string display_name_;
};

}  // namespace internal
}  // namespace clipforge

#endif  // CLIPFORGE_PLATFORM_LINUX_X11_DISPLAY_BACKEND_H_
