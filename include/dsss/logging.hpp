#pragma once

#include <cstdarg>
#include <cstdio>

namespace dsss {

// Severity, most to least urgent. A message is printed when its level is
// at or below g_log_level.
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Release builds start at INFO (one line per simulation), others at DEBUG.
// The CLI overrides this with -v / -q.
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Per-subsystem switches, checked before the level
struct LogCategories {
    bool engine = true;     // ENGINE: one summary per simulate()
    bool fec = false;       // FEC: per-encode/decode counts, noisy in loops
    bool channel = true;    // CHAN: noise synthesis parameters
    bool cache = true;      // CACHE: evictions and missing stages
    bool service = true;    // SERVICE: rejected requests, session end
};

inline LogCategories g_log_categories;

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "";
    }
}

// "[LEVEL][CATEGORY] message" on stderr; stdout carries CLI and service output
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    fprintf(stderr, "[%s][%s] ", logLevelTag(level), category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fputc('\n', stderr);
}

#ifdef DSSS_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    dsss::log(dsss::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    dsss::log(dsss::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    dsss::log(dsss::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

// Level tested first so the arguments are not evaluated when filtered out
#define LOG_DEBUG(cat, fmt, ...) \
    do { if (dsss::g_log_level >= dsss::LogLevel::DEBUG) \
        dsss::log(dsss::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (dsss::g_log_level >= dsss::LogLevel::TRACE) \
        dsss::log(dsss::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Subsystem loggers: LOG_ENGINE(INFO, "...") etc.
#define LOG_ENGINE(level, fmt, ...) \
    do { if (dsss::g_log_categories.engine) LOG_##level("ENGINE", fmt, ##__VA_ARGS__); } while(0)

#define LOG_FEC(level, fmt, ...) \
    do { if (dsss::g_log_categories.fec) LOG_##level("FEC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CHAN(level, fmt, ...) \
    do { if (dsss::g_log_categories.channel) LOG_##level("CHAN", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CACHE(level, fmt, ...) \
    do { if (dsss::g_log_categories.cache) LOG_##level("CACHE", fmt, ##__VA_ARGS__); } while(0)

#define LOG_SERVICE(level, fmt, ...) \
    do { if (dsss::g_log_categories.service) LOG_##level("SERVICE", fmt, ##__VA_ARGS__); } while(0)

} // namespace dsss
