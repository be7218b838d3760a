#include "sustainbot/core/logging.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace sustainbot::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

bool parse_level(std::string_view s, Level& out)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error")                       { out = Level::Error;   return true; }
    if (lower == "warn" || lower == "warning")  { out = Level::Warn;    return true; }
    if (lower == "info")                        { out = Level::Info;    return true; }
    if (lower == "debug")                       { out = Level::Debug;   return true; }
    if (lower == "verbose")                     { out = Level::Verbose; return true; }
    return false;
}

#if !defined(SB_DEBUG)

// Non-debug build: nothing else here. Inline stubs in the header handle log calls.

#else

static std::atomic<int> g_threshold{static_cast<int>(Level::Info)};

void set_level(Level lvl)
{
    g_threshold.store(static_cast<int>(lvl));
}

Level level()
{
    return static_cast<Level>(g_threshold.load());
}

static bool enabled(Level lvl)
{
    return static_cast<int>(lvl) <= g_threshold.load();
}

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(level)) {
        return;
    }

    FILE* out = (level == Level::Error || level == Level::Warn)
        ? stderr
        : stdout;

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }

    FILE* out = (level == Level::Error || level == Level::Warn)
        ? stderr
        : stdout;

    std::fprintf(out, "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(SB_DEBUG)

} // namespace sustainbot::log
