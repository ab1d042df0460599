// Copyright 2026 The clipforge Authors

#include "core/logger.h"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace clipforge {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("clipforge", sinks);

    // Engine threads log too; keep the thread id in the default pattern.
    g_logger->set_pattern("[clipforge][%l][%t] %v");
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(ClipForgeLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(ClipForgeLogLevel level) {
  switch (level) {
    case kClipForgeLogTrace: return spdlog::level::trace;
    case kClipForgeLogDebug: return spdlog::level::debug;
    case kClipForgeLogInfo:  return spdlog::level::info;
    case kClipForgeLogWarn:  return spdlog::level::warn;
    case kClipForgeLogError: return spdlog::level::err;
    case kClipForgeLogFatal: return spdlog::level::critical;
    default:                 return spdlog::level::info;
  }
}

}  // namespace internal
}  // namespace clipforge
