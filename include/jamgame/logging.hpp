#pragma once

#include <cstdio>
#include <cstdarg>

namespace jamgame {

enum class LogLevel {
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Messages above this level are dropped; release builds start at INFO
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

struct LogCategories {
    bool solver = true;     // Best-response iteration loop
    bool sweep = true;      // Parameter sweep orchestration
    bool scenario = true;   // Scenario file loading/saving
    bool jammer = false;    // Per-attacker target selection (very verbose)
};

inline LogCategories g_log_categories;

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

inline bool logEnabled(LogLevel level) {
    return level <= g_log_level;
}

// Fixed-width tag for the level column
inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

// Writes "[LEVEL][CATEGORY] message" to stderr
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (!logEnabled(level)) return;

    fprintf(stderr, "[%s][%s] ", logLevelName(level), category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

} // namespace jamgame

// Category macros take a bare level name: LOG_SOLVER(DEBUG, "...", ...).
// Arguments are not evaluated when the level or category is off, and
// JAMGAME_LOG_DISABLE compiles every call away.
#ifdef JAMGAME_LOG_DISABLE
#define JAMGAME_LOG(flag, level, tag, fmt, ...) do { } while(0)
#else
#define JAMGAME_LOG(flag, level, tag, fmt, ...) \
    do { if (jamgame::g_log_categories.flag && jamgame::logEnabled(jamgame::LogLevel::level)) \
        jamgame::log(jamgame::LogLevel::level, tag, fmt, ##__VA_ARGS__); } while(0)
#endif

#define LOG_SOLVER(level, fmt, ...)   JAMGAME_LOG(solver, level, "SOLVER", fmt, ##__VA_ARGS__)
#define LOG_SWEEP(level, fmt, ...)    JAMGAME_LOG(sweep, level, "SWEEP", fmt, ##__VA_ARGS__)
#define LOG_SCENARIO(level, fmt, ...) JAMGAME_LOG(scenario, level, "SCENARIO", fmt, ##__VA_ARGS__)
#define LOG_JAMMER(level, fmt, ...)   JAMGAME_LOG(jammer, level, "JAMMER", fmt, ##__VA_ARGS__)
