// Copyright 2026 The clipforge Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef CLIPFORGE_CLIPFORGE_H_
#define CLIPFORGE_CLIPFORGE_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(CLIPFORGE_BUILDING)
#define CLIPFORGE_API __declspec(dllexport)
#else
#define CLIPFORGE_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define CLIPFORGE_API __attribute__((visibility("default")))
#else
#define CLIPFORGE_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "clipforge/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - Only one recorder may hold the native engine connection at a time.
//     A second recorder calling clipforge_recorder_initialize() while another
//     one is initialized fails with kClipForgeErrorEngineInitFailure.
//   - All operations on the SAME recorder handle are serialized internally.
//     start/stop block the calling thread for up to 5 seconds per expected
//     engine signal.
//   - clipforge_set_log_level() and clipforge_set_log_callback() are
//     process-global and internally synchronized.  The log callback may be
//     invoked from engine threads.
//   - clipforge_version_*() functions are stateless and safe to call from any
//     thread at any time.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct ClipForgeRecorder ClipForgeRecorder;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Native window identifier of a host window (X11 Window on Linux).
typedef uint64_t ClipForgeWindowId;

/// Error codes returned by clipforge functions.
typedef enum ClipForgeError {
  kClipForgeOk = 0,
  kClipForgeErrorNotInitialized = -1,          ///< No live engine connection
  kClipForgeErrorInvalidParam = -2,
  kClipForgeErrorEngineInitFailure = -3,       ///< Native init returned non-zero
  kClipForgeErrorEngineFailure = -4,           ///< Native factory/command failed
  kClipForgeErrorDisplayNotFound = -5,         ///< Display index not enumerable
  kClipForgeErrorInvalidCaptureMode = -6,
  kClipForgeErrorNoResolutionsAvailable = -7,  ///< Engine offered no resolutions
  kClipForgeErrorSignalTimeout = -8,           ///< Engine did not signal in time
  kClipForgeErrorUnexpectedSignalType = -9,
  kClipForgeErrorUnexpectedSignalValue = -10,
  kClipForgeErrorShutdownFailure = -11,        ///< Native disconnect failed
  kClipForgeErrorUnknown = -99,
} ClipForgeError;

/// Log severity levels for the internal logging system.
typedef enum ClipForgeLogLevel {
  kClipForgeLogTrace = 0,   ///< Very detailed diagnostic info
  kClipForgeLogDebug = 1,   ///< Debug-level messages
  kClipForgeLogInfo = 2,    ///< Informational messages (default)
  kClipForgeLogWarn = 3,    ///< Warnings
  kClipForgeLogError = 4,   ///< Errors
  kClipForgeLogFatal = 5,   ///< Fatal / critical errors
} ClipForgeLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to clipforge_set_log_callback.
typedef void (*clipforge_log_callback_t)(ClipForgeLogLevel level,
                                         const char* message,
                                         void* userdata);

/// What the video capture source records.
typedef enum ClipForgeCaptureMode {
  kClipForgeCaptureDisplay = 0,  ///< A whole physical display
  kClipForgeCaptureWindow = 1,   ///< A single target window
} ClipForgeCaptureMode;

/// Recorder lifecycle state.
typedef enum ClipForgeRecorderState {
  kClipForgeStateUninitialized = 0,
  kClipForgeStateInitialized = 1,  ///< Connected, configuration not applied
  kClipForgeStateConfigured = 2,   ///< Scene and tracks built, not recording
  kClipForgeStateRecording = 3,
  kClipForgeStateShutDown = 4,
} ClipForgeRecorderState;

/// Which engine resolution list to query.
typedef enum ClipForgeResolutionKind {
  kClipForgeResolutionBase = 0,    ///< Canvas (captured surface) resolution
  kClipForgeResolutionOutput = 1,  ///< Encoded file resolution
} ClipForgeResolutionKind;

/// Recorder configuration. Initialize with clipforge_recorder_options_init()
/// and override fields as needed. String fields may be NULL to keep the
/// default.
typedef struct ClipForgeRecorderOptions {
  int capture_mode;                    ///< A ClipForgeCaptureMode value
  int display_index;                   ///< 1-based display (display capture)
  const char* output_resolution;       ///< "WxH", e.g. "1920x1080"
  int kbit_rate;                       ///< Target bitrate in kbit/s
  int fps;                             ///< Output frame rate
  const char* encoder;                 ///< Encoder name, or "auto"
  const char* buffer_storage_dir;      ///< Directory for recorded files
  const char* audio_input_device_id;   ///< "all", "none" or a device id
  const char* audio_output_device_id;  ///< "all", "none" or a device id
  const char* window_title;            ///< Window capture: exact title
  const char* window_class;            ///< Window capture: window class
  const char* window_executable;       ///< Window capture: process image name
} ClipForgeRecorderOptions;

/// A resolution supported by the engine.
typedef struct ClipForgeResolution {
  int width;
  int height;
  char text[32];  ///< Engine value, e.g. "1920x1080"
} ClipForgeResolution;

/// A recording encoder offered by the engine.
typedef struct ClipForgeEncoderInfo {
  char name[128];  ///< Engine encoder identifier
} ClipForgeEncoderInfo;

/// Information about a physical display.
typedef struct ClipForgeDisplayInfo {
  int index;       ///< Display index (0-based)
  int x;           ///< Left edge X in virtual screen coordinates
  int y;           ///< Top edge Y in virtual screen coordinates
  int width;       ///< Physical width in pixels
  int height;      ///< Physical height in pixels
  int is_primary;  ///< Non-zero if this is the primary display
  char name[128];  ///< Display name (UTF-8, null-terminated)
} ClipForgeDisplayInfo;

/// Audio device information.
typedef struct ClipForgeAudioDeviceInfo {
  char id[256];    ///< Engine device ID (UTF-8)
  char name[256];  ///< Human-readable device name (UTF-8)
  int is_default;  ///< Non-zero if this is the default device
  int is_input;    ///< 1 = microphone, 0 = system audio (loopback)
} ClipForgeAudioDeviceInfo;

/// Host window region for the preview, in host window pixels.
typedef struct ClipForgeBounds {
  double x;
  double y;
  double width;
  double height;
} ClipForgeBounds;

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

/// Fill @p options with defaults: display capture of display 1, 1920x1080,
/// 15000 kbit/s, 60 fps, "auto" encoder, all audio devices recorded.
CLIPFORGE_API void clipforge_recorder_options_init(
    ClipForgeRecorderOptions* options);

// ---------------------------------------------------------------------------
// Recorder lifecycle
// ---------------------------------------------------------------------------

/// Create a recorder bound to the platform capture engine. The engine
/// connection is not opened until clipforge_recorder_initialize().
/// @return A new recorder, or NULL if no engine is available on this platform.
CLIPFORGE_API ClipForgeRecorder* clipforge_recorder_create(void);

/// Destroy a recorder. Shuts the engine connection down if still open.
/// Passing NULL is a no-op.
CLIPFORGE_API void clipforge_recorder_destroy(ClipForgeRecorder* recorder);

/// Get the error code of the last failed operation on @p recorder.
CLIPFORGE_API ClipForgeError clipforge_recorder_get_last_error(
    const ClipForgeRecorder* recorder);

/// Get a human-readable message for the last failed operation.
/// The returned pointer stays valid until the next call on @p recorder.
CLIPFORGE_API const char* clipforge_recorder_get_last_error_message(
    const ClipForgeRecorder* recorder);

/// Get the lifecycle state of @p recorder.
CLIPFORGE_API ClipForgeRecorderState clipforge_recorder_get_state(
    const ClipForgeRecorder* recorder);

/// Open the engine connection and apply @p options.
/// Calling this again on an initialized recorder logs a warning and returns
/// kClipForgeOk without touching the engine.
CLIPFORGE_API ClipForgeError clipforge_recorder_initialize(
    ClipForgeRecorder* recorder, const ClipForgeRecorderOptions* options);

/// Rebuild engine settings, scene and audio tracks.
/// @param options  New options, or NULL to re-apply the stored ones.
CLIPFORGE_API ClipForgeError clipforge_recorder_reconfigure(
    ClipForgeRecorder* recorder, const ClipForgeRecorderOptions* options);

/// Start recording. Blocks until the engine confirms, or up to 5 seconds.
CLIPFORGE_API ClipForgeError clipforge_recorder_start(
    ClipForgeRecorder* recorder);

/// Stop recording. Blocks until the engine has written the file; each of the
/// three stop phases has its own 5 second window.
CLIPFORGE_API ClipForgeError clipforge_recorder_stop(
    ClipForgeRecorder* recorder);

/// Disconnect from the engine.
/// @return 1 if the connection was shut down, 0 if it was not open, or a
///         negative ClipForgeError (kClipForgeErrorShutdownFailure).
CLIPFORGE_API int clipforge_recorder_shutdown(ClipForgeRecorder* recorder);

// ---------------------------------------------------------------------------
// Engine queries
// ---------------------------------------------------------------------------

/// Get the resolutions the engine accepts for @p kind.
/// @return Number of entries written (<= max_count), or -1 on error.
CLIPFORGE_API int clipforge_recorder_get_available_resolutions(
    ClipForgeRecorder* recorder, ClipForgeResolutionKind kind,
    ClipForgeResolution* out_resolutions, int max_count);

/// Get the recording encoders the engine offers, in engine order.
/// @return Number of entries written (<= max_count), or -1 on error.
CLIPFORGE_API int clipforge_recorder_get_available_encoders(
    ClipForgeRecorder* recorder, ClipForgeEncoderInfo* out_encoders,
    int max_count);

/// Get the absolute path of the file the engine recorded last.
/// @return Heap string to release with clipforge_free_string(), or NULL.
CLIPFORGE_API char* clipforge_recorder_get_last_recording(
    ClipForgeRecorder* recorder);

/// Free a string returned by clipforge. NULL is a no-op.
CLIPFORGE_API void clipforge_free_string(char* str);

/// Enumerate physical displays.
/// @return Number of entries written (<= max_count), or -1 on error.
CLIPFORGE_API int clipforge_recorder_enumerate_displays(
    ClipForgeRecorder* recorder, ClipForgeDisplayInfo* out_displays,
    int max_count);

/// Enumerate audio devices of one direction.
/// @param is_input  Non-zero for microphones, zero for system audio outputs.
/// @return Number of entries written (<= max_count), or -1 on error.
CLIPFORGE_API int clipforge_recorder_enumerate_audio_devices(
    ClipForgeRecorder* recorder, int is_input,
    ClipForgeAudioDeviceInfo* out_devices, int max_count);

// ---------------------------------------------------------------------------
// Preview
// ---------------------------------------------------------------------------

/// Attach a live preview of the scene to @p host_window, sized to @p bounds.
/// @param out_height  Optional; receives the preview height in pixels.
CLIPFORGE_API ClipForgeError clipforge_recorder_setup_preview(
    ClipForgeRecorder* recorder, ClipForgeWindowId host_window,
    const ClipForgeBounds* bounds, int* out_height);

/// Move and resize an attached preview to @p bounds.
/// @param out_height  Optional; receives the preview height in pixels.
CLIPFORGE_API ClipForgeError clipforge_recorder_resize_preview(
    ClipForgeRecorder* recorder, const ClipForgeBounds* bounds,
    int* out_height);

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

CLIPFORGE_API const char* clipforge_version_string(void);

CLIPFORGE_API int clipforge_version_major(void);

CLIPFORGE_API int clipforge_version_minor(void);

CLIPFORGE_API int clipforge_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kClipForgeLogInfo.
CLIPFORGE_API void clipforge_set_log_level(ClipForgeLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
///
/// @param callback  The callback function, or NULL to unregister.
/// @param userdata  Opaque pointer passed through to the callback.
CLIPFORGE_API void clipforge_set_log_callback(
    clipforge_log_callback_t callback, void* userdata);

/// Emit a log message at the given level through the clipforge logging system.
///
/// @param level    Severity level.
/// @param message  Null-terminated UTF-8 string.
CLIPFORGE_API void clipforge_log(ClipForgeLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // CLIPFORGE_CLIPFORGE_H_
