// Copyright 2026 The clipforge Authors

#ifndef CLIPFORGE_CORE_LOGGER_H_
#define CLIPFORGE_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "clipforge/clipforge.h"

namespace clipforge {
namespace internal {

class CallbackSink;

/// Initialize the global clipforge logger (stderr + optional callback sink).
/// Safe to call multiple times; subsequent calls are no-ops.
void InitLogger();

/// Get the global clipforge spdlog logger instance.
std::shared_ptr<spdlog::logger> GetLogger();

/// Get the global callback sink (used to register/unregister user callback).
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Set the global log level.
void SetLogLevel(ClipForgeLogLevel level);

/// Map ClipForgeLogLevel to spdlog::level::level_enum.
spdlog::level::level_enum ToSpdlogLevel(ClipForgeLogLevel level);

}  // namespace internal
}  // namespace clipforge

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define CLIPFORGE_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::clipforge::internal::GetLogger(), __VA_ARGS__)
#define CLIPFORGE_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::clipforge::internal::GetLogger(), __VA_ARGS__)
#define CLIPFORGE_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::clipforge::internal::GetLogger(), __VA_ARGS__)
#define CLIPFORGE_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::clipforge::internal::GetLogger(), __VA_ARGS__)
#define CLIPFORGE_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::clipforge::internal::GetLogger(), __VA_ARGS__)
#define CLIPFORGE_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::clipforge::internal::GetLogger(), __VA_ARGS__)

#endif  // CLIPFORGE_CORE_LOGGER_H_
