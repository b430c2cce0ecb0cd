#pragma once

#include <cstdarg>
#include <string_view>

namespace vectorlink::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

#if defined(VL_DEBUG)

// Real functions exist only in debug builds.
void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// In non-debug builds, provide inline no-op stubs so
// direct calls still compile but vanish.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // VL_DEBUG

} // namespace vectorlink::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(VL_DEBUG)

#define VL_LOGE(tag, fmt, ...) \
    ::vectorlink::log::logf(::vectorlink::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define VL_LOGW(tag, fmt, ...) \
    ::vectorlink::log::logf(::vectorlink::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define VL_LOGI(tag, fmt, ...) \
    ::vectorlink::log::logf(::vectorlink::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define VL_LOGD(tag, fmt, ...) \
    ::vectorlink::log::logf(::vectorlink::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define VL_LOGV(tag, fmt, ...) \
    ::vectorlink::log::logf(::vectorlink::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// In non-debug builds the whole macro invocation (including the
// format string and arguments) disappears at preprocessing time.

#define VL_LOGE(tag, fmt, ...) ((void)0)
#define VL_LOGW(tag, fmt, ...) ((void)0)
#define VL_LOGI(tag, fmt, ...) ((void)0)
#define VL_LOGD(tag, fmt, ...) ((void)0)
#define VL_LOGV(tag, fmt, ...) ((void)0)

#endif // VL_DEBUG
