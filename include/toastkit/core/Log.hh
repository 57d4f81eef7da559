#pragma once

// Toastkit Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "toastkit/core/Log.hh"
//   TOASTKIT_LOG_INFO("Toast queued: {}", message);
//   TOASTKIT_RENDER_LOG_WARN("Dropped {} vertices", count);

// Neutralize X11 macro pollution.  <X11/X.h> (pulled in by SDL and bgfx
// platform headers on Linux) defines bare-word macros that collide with
// Quill's enum member names (e.g. Always, None, Never).
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif
#ifdef True
#undef True
#endif
#ifdef False
#undef False
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace toastkit::log {

/// Initialize the logging subsystem (console output plus logs/toastkit.log).
/// Call once at startup before any logging.
void init();

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Falls back to console-only loggers when init() was not called.
quill::Logger* logger();

/// Toast lifecycle (creation, expiry, queueing).
quill::Logger* uiLogger();

/// bgfx canvas (GPU resources, dropped geometry).
quill::Logger* renderLogger();

/// Set runtime log level of the root logger (within compile-time ceiling).
void setLevel(quill::LogLevel level);

void setUILevel(quill::LogLevel level);
void setRenderLevel(quill::LogLevel level);

} // namespace toastkit::log

// Root logger macros.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define TOASTKIT_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(toastkit::log::logger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(toastkit::log::logger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_LOG_INFO(fmt, ...) QUILL_LOG_INFO(toastkit::log::logger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(toastkit::log::logger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(toastkit::log::logger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(toastkit::log::logger(), fmt, ##__VA_ARGS__)

// Subsystem macros
#define TOASTKIT_UI_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(toastkit::log::uiLogger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_UI_LOG_INFO(fmt, ...) QUILL_LOG_INFO(toastkit::log::uiLogger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_RENDER_LOG_INFO(fmt, ...) QUILL_LOG_INFO(toastkit::log::renderLogger(), fmt, ##__VA_ARGS__)
#define TOASTKIT_RENDER_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(toastkit::log::renderLogger(), fmt, ##__VA_ARGS__)
