#pragma once

#include <cstdarg>
#include <string_view>

namespace sustainbot::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

// Parses "error", "warn", "info", "debug", "verbose" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_level(std::string_view s, Level& out);

#if defined(SB_DEBUG)

// Messages above the threshold are dropped. Default: Info.
void set_level(Level level);
Level level();

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls still compile but vanish.
inline void set_level(Level) {}
inline Level level() { return Level::Error; }

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // SB_DEBUG

} // namespace sustainbot::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define SB_ELOG(fmt, ...) ::sustainbot::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(SB_DEBUG)

#define SB_LOGE(tag, fmt, ...) \
    ::sustainbot::log::logf(::sustainbot::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define SB_LOGW(tag, fmt, ...) \
    ::sustainbot::log::logf(::sustainbot::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define SB_LOGI(tag, fmt, ...) \
    ::sustainbot::log::logf(::sustainbot::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define SB_LOGD(tag, fmt, ...) \
    ::sustainbot::log::logf(::sustainbot::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define SB_LOGV(tag, fmt, ...) \
    ::sustainbot::log::logf(::sustainbot::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// In non-debug builds they compile to a single no-op expression.
#define SB_LOGE(tag, fmt, ...) ((void)0)
#define SB_LOGW(tag, fmt, ...) ((void)0)
#define SB_LOGI(tag, fmt, ...) ((void)0)
#define SB_LOGD(tag, fmt, ...) ((void)0)
#define SB_LOGV(tag, fmt, ...) ((void)0)

#endif // SB_DEBUG
