// Copyright 2026 The clipforge Authors

#include "platform/linux/x11_display_backend.h"

#if defined(__linux__)

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/logger.h"

namespace clipforge {
namespace internal {

namespace {

// Swallows BadWindow from windows that vanish between listing and querying.
int IgnoreXError(Display*, XErrorEvent*) { return 0; }

std::string ReadWindowTitle(Display* dpy, Window w) {
  Atom net_wm_name = XInternAtom(dpy, "_NET_WM_NAME", True);
  Atom utf8_str = XInternAtom(dpy, "UTF8_STRING", True);

  // _NET_WM_NAME (UTF-8) > WM_NAME
  if (net_wm_name != None && utf8_str != None) {
    Atom type;
    int fmt;
    unsigned long items, after;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(dpy, w, net_wm_name, 0, 256, False, utf8_str,
                           &type, &fmt, &items, &after, &data) == Success &&
        data) {
      std::string title(reinterpret_cast<char*>(data), items);
      XFree(data);
      return title;
    }
  }

  XTextProperty tp;
  if (XGetWMName(dpy, w, &tp) && tp.value) {
    std::string title(reinterpret_cast<char*>(tp.value), tp.nitems);
    XFree(tp.value);
    return title;
  }
  return std::string();
}

std::string ReadWindowClass(Display* dpy, Window w) {
  XClassHint hint;
  if (!XGetClassHint(dpy, w, &hint)) return std::string();
  std::string result = hint.res_class ? hint.res_class : "";
  if (hint.res_name) XFree(hint.res_name);
  if (hint.res_class) XFree(hint.res_class);
  return result;
}

// Process name via _NET_WM_PID + /proc/PID/comm.
std::string ReadProcessName(Display* dpy, Window w) {
  Atom net_wm_pid = XInternAtom(dpy, "_NET_WM_PID", True);
  if (net_wm_pid == None) return std::string();

  Atom type;
  int fmt;
  unsigned long items, after;
  unsigned char* data = nullptr;
  if (XGetWindowProperty(dpy, w, net_wm_pid, 0, 1, False, XA_CARDINAL, &type,
                         &fmt, &items, &after, &data) != Success ||
      !data) {
    return std::string();
  }
  auto pid = static_cast<unsigned>(*reinterpret_cast<unsigned long*>(data));
  XFree(data);

  char path[64];
  std::snprintf(path, sizeof(path), "/proc/%u/comm", pid);
  FILE* f = std::fopen(path, "r");
  if (!f) return std::string();
  char buf[256] = {};
  std::string name;
  if (std::fgets(buf, sizeof(buf), f)) {
    name = buf;
    if (!name.empty() && name.back() == '\n') name.pop_back();
  }
  std::fclose(f);
  return name;
}

bool SameNameIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

// "Wow.exe" matches a process named "Wow.exe" or "Wow".
bool ExecutableMatches(const std::string& process, const std::string& exe) {
  if (process.empty() || exe.empty()) return false;
  if (SameNameIgnoreCase(process, exe)) return true;
  size_t dot = exe.rfind('.');
  return dot != std::string::npos &&
         SameNameIgnoreCase(process, exe.substr(0, dot));
}

}  // namespace

X11DisplayBackend::~X11DisplayBackend() { Close(); }

bool X11DisplayBackend::Open() {
  if (display_) return true;
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    CLIPFORGE_LOG_ERROR("Failed to open X11 display");
    return false;
  }
  display_ = dpy;
  display_name_ = DisplayString(dpy);
  XSetErrorHandler(IgnoreXError);
  return true;
}

void X11DisplayBackend::Close() {
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
  display_name_.clear();
}

std::vector<DisplayInfo> X11DisplayBackend::GetDisplays() {
  std::vector<DisplayInfo> displays;
  if (!display_) return displays;

  auto* dpy = static_cast<Display*>(display_);
  int count = ScreenCount(dpy);
  int primary = DefaultScreen(dpy);
  for (int scr = 0; scr < count; ++scr) {
    DisplayInfo info;
    info.index = scr;
    info.width = DisplayWidth(dpy, scr);
    info.height = DisplayHeight(dpy, scr);
    info.is_primary = scr == primary;
    char name[32];
    std::snprintf(name, sizeof(name), "Screen %d", scr);
    info.name = name;
    displays.push_back(std::move(info));
  }
  return displays;
}

std::vector<X11WindowInfo> X11DisplayBackend::EnumerateWindows() {
  std::vector<X11WindowInfo> result;
  if (!display_) return result;

  auto* dpy = static_cast<Display*>(display_);
  Window root = DefaultRootWindow(dpy);

  // Prefer EWMH _NET_CLIENT_LIST_STACKING (topmost last).
  Atom net_cl = XInternAtom(dpy, "_NET_CLIENT_LIST_STACKING", True);
  if (net_cl == None) net_cl = XInternAtom(dpy, "_NET_CLIENT_LIST", True);

  Window* wins = nullptr;
  unsigned long n_wins = 0;
  bool ewmh = false;

  if (net_cl != None) {
    Atom type;
    int fmt;
    unsigned long items, after;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(dpy, root, net_cl, 0, ~0L, False, XA_WINDOW,
                           &type, &fmt, &items, &after, &data) == Success &&
        data) {
      wins = reinterpret_cast<Window*>(data);
      n_wins = items;
      ewmh = true;
    }
  }

  Window root_ret, parent_ret;
  Window* children = nullptr;
  unsigned int n_children = 0;
  if (!ewmh) {
    XQueryTree(dpy, root, &root_ret, &parent_ret, &children, &n_children);
    wins = children;
    n_wins = n_children;
  }

  for (unsigned long i = 0; i < n_wins; ++i) {
    Window w = wins[i];
    XWindowAttributes a;
    if (!XGetWindowAttributes(dpy, w, &a)) continue;
    if (a.map_state != IsViewable || a.width <= 1 || a.height <= 1) continue;

    X11WindowInfo info;
    info.id = static_cast<uint64_t>(w);
    info.width = a.width;
    info.height = a.height;
    info.title = ReadWindowTitle(dpy, w);
    info.window_class = ReadWindowClass(dpy, w);
    info.process_name = ReadProcessName(dpy, w);
    result.push_back(std::move(info));
  }

  if (ewmh)
    XFree(wins);
  else if (children)
    XFree(children);

  return result;
}

uint64_t X11DisplayBackend::FindWindow(const std::string& title,
                                       const std::string& window_class,
                                       const std::string& executable) {
  uint64_t best = 0;
  int best_score = -1;
  for (const auto& win : EnumerateWindows()) {
    if (win.title != title) continue;
    int score = 0;
    if (!window_class.empty() && win.window_class == window_class) ++score;
    if (ExecutableMatches(win.process_name, executable)) ++score;
    if (score > best_score) {
      best = win.id;
      best_score = score;
    }
  }
  return best;
}

bool X11DisplayBackend::GetWindowSize(uint64_t window, int* width,
                                      int* height) {
  if (!display_ || window == 0) return false;
  auto* dpy = static_cast<Display*>(display_);
  XWindowAttributes a;
  if (!XGetWindowAttributes(dpy, static_cast<Window>(window), &a)) {
    return false;
  }
  *width = a.width;
  *height = a.height;
  return true;
}

}  // namespace internal
}  // namespace clipforge

#endif  // __linux__
