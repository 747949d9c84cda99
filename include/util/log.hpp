#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace qrstego
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

inline Level level_from_name(const char *name)
{
    std::string level = name ? std::string(name) : std::string();
    for (auto &c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (level == "debug")
        return Level::Debug;
    if (level == "info")
        return Level::Info;
    if (level == "warn" || level == "warning")
        return Level::Warning;
    if (level == "error" || level == "err")
        return Level::Error;
    return Level::Info;  // default
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

// Each session gets its own Logger; there is no process-wide threshold.
struct Logger
{
    Level      level = Level::Warning;
    std::FILE *sink  = stderr;

    bool enabled(Level lv) const { return (int)lv >= (int)level; }

    void logf(Level lv, const char *func, const char *fmt, ...) const
    {
        if (!enabled(lv) || !sink)
            return;

        char ts[16];
        timestamp(ts, sizeof(ts));

        std::fprintf(sink, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

        va_list ap;
        va_start(ap, fmt);
        std::vfprintf(sink, fmt, ap);
        va_end(ap);

        size_t m = std::strlen(fmt);
        if (m == 0 || fmt[m - 1] != '\n')
            std::fputc('\n', sink);
    }
};

#define LOG_DEBUG(lg, ...) (lg).logf(::qrstego::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(lg, ...) (lg).logf(::qrstego::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(lg, ...) (lg).logf(::qrstego::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(lg, ...) (lg).logf(::qrstego::Level::Error, __func__, __VA_ARGS__)

}  // namespace qrstego
