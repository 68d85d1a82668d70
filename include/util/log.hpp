#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace qrstream
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    Off     = 4
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline bool parse_level(const std::string &name, Level &out)
{
    std::string s;
    for (char c : name)
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s == "debug")
        out = Level::Debug;
    else if (s == "info")
        out = Level::Info;
    else if (s == "warn" || s == "warning")
        out = Level::Warning;
    else if (s == "error" || s == "err")
        out = Level::Error;
    else if (s == "off" || s == "none" || s == "quiet")
        out = Level::Off;
    else
        return false;
    return true;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    if (name)
        parse_level(name, lv);
    set_log_level(lv);
}

// Reads QRSTREAM_LOG_LEVEL; leaves the current level alone when unset.
inline void init_log_from_env()
{
    const char *v = std::getenv("QRSTREAM_LOG_LEVEL");
    if (v && *v)
        set_log_level_by_name(v);
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
        case Level::Off:
            return "";
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (lv == Level::Off || (int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::qrstream::logf(::qrstream::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::qrstream::logf(::qrstream::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::qrstream::logf(::qrstream::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::qrstream::logf(::qrstream::Level::Error, __func__, __VA_ARGS__)

}  // namespace qrstream
