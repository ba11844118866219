#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace wirechat
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always shown unless the threshold is raised above it
};

inline Level &global_level()
{
    static Level lv = Level::Warning;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline bool log_enabled(Level lv)
{
    return (int)lv >= (int)global_level();
}

// Unknown names fall back to Warning so a typo never silences errors.
inline void set_log_level_by_name(const char *name)
{
    std::string level = std::string(name ? name : "");
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Warning);
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
        case Level::System:
            return "[SYSTEM]";
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

// receive, driver and signal threads all log; keep their lines whole
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv))
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::wirechat::logf(::wirechat::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::wirechat::logf(::wirechat::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::wirechat::logf(::wirechat::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::wirechat::logf(::wirechat::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::wirechat::logf(::wirechat::Level::System, __func__, __VA_ARGS__)

}  // namespace wirechat
