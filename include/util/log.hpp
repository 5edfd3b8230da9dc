#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string_view>
#include <strings.h>

namespace chunkrelay
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // user-facing transfer events, always shown above the threshold
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

inline std::optional<Level> parse_level(std::string_view name)
{
    struct Alias
    {
        const char *name;
        Level       lv;
    };
    static constexpr Alias aliases[] = {
        {"debug", Level::Debug}, {"info", Level::Info},   {"warn", Level::Warning},
        {"warning", Level::Warning}, {"error", Level::Error}, {"err", Level::Error},
    };
    for (const auto &a : aliases)
    {
        if (name.size() == std::strlen(a.name) &&
            ::strncasecmp(name.data(), a.name, name.size()) == 0)
            return a.lv;
    }
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(std::string_view name)
{
    set_log_level(parse_level(name).value_or(Level::Info));
}

inline void init_log_from_env(const char *var = "CHUNKRELAY_LOG_LEVEL")
{
    if (const char *v = std::getenv(var); v && *v)
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

// The sweeper thread and the delivery path log concurrently; keep lines whole.
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
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

#define LOG_DEBUG(...) ::chunkrelay::logf(::chunkrelay::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::chunkrelay::logf(::chunkrelay::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::chunkrelay::logf(::chunkrelay::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::chunkrelay::logf(::chunkrelay::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::chunkrelay::logf(::chunkrelay::Level::System, __func__, __VA_ARGS__)

}  // namespace chunkrelay
