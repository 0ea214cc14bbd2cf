#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>

namespace tmdsprobe {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Default to INFO for release, DEBUG for debug builds
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Destination of every log line (stderr unless redirected)
inline FILE* g_log_stream = stderr;

// Per-stage enable flags, one for each step of the decode pipeline
struct LogCategories {
    bool capture = true;    // CSV loading
    bool bus = true;        // Bus reconstruction
    bool island = true;     // Burst detection / segmentation
    bool packet = true;     // Packet decode
    bool ecc = false;       // BCH engine (one line per candidate)
    bool timing = true;     // Counter / sync analysis

    // Flag for a category name ("island", "ecc", ...), nullptr if unknown
    bool* find(const char* name) {
        if (strcmp(name, "capture") == 0) return &capture;
        if (strcmp(name, "bus") == 0) return &bus;
        if (strcmp(name, "island") == 0) return &island;
        if (strcmp(name, "packet") == 0) return &packet;
        if (strcmp(name, "ecc") == 0) return &ecc;
        if (strcmp(name, "timing") == 0) return &timing;
        return nullptr;
    }
};

inline LogCategories g_log_categories;

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

inline void setLogStream(FILE* stream) {
    g_log_stream = stream ? stream : stderr;
}

inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "";
    }
}

/**
 * Apply a comma separated category list such as "ecc,island" or "-bus".
 * A plain name enables the category, a leading '-' disables it. Returns
 * false at the first unknown name; earlier entries stay applied.
 */
inline bool applyLogCategories(const std::string& list) {
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string::npos) comma = list.size();
        std::string item = list.substr(pos, comma - pos);
        pos = comma + 1;
        if (item.empty()) continue;

        bool enable = true;
        if (item[0] == '-') {
            enable = false;
            item.erase(0, 1);
        }
        bool* flag = g_log_categories.find(item.c_str());
        if (!flag) return false;
        *flag = enable;
    }
    return true;
}

// Core logging function: "[LEVEL][CATEGORY] message"
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    fprintf(g_log_stream, "[%s][%s] ", logLevelName(level), category);

    va_list args;
    va_start(args, format);
    vfprintf(g_log_stream, format, args);
    va_end(args);

    fprintf(g_log_stream, "\n");
}

// Convenience macros - these compile to nothing when TMDSPROBE_LOG_DISABLE is defined
#ifdef TMDSPROBE_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    tmdsprobe::log(tmdsprobe::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    tmdsprobe::log(tmdsprobe::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    tmdsprobe::log(tmdsprobe::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (tmdsprobe::g_log_level >= tmdsprobe::LogLevel::DEBUG) \
        tmdsprobe::log(tmdsprobe::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (tmdsprobe::g_log_level >= tmdsprobe::LogLevel::TRACE) \
        tmdsprobe::log(tmdsprobe::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Pipeline stage macros: LOG_ISLAND(WARN, "...") logs under "ISLAND" if enabled
#define TMDSPROBE_LOG_STAGE(flag, logger, tag, fmt, ...) \
    do { if (tmdsprobe::g_log_categories.flag) logger(tag, fmt, ##__VA_ARGS__); } while(0)

#define LOG_CAPTURE(level, fmt, ...) TMDSPROBE_LOG_STAGE(capture, LOG_##level, "CAPTURE", fmt, ##__VA_ARGS__)
#define LOG_BUS(level, fmt, ...)     TMDSPROBE_LOG_STAGE(bus, LOG_##level, "BUS", fmt, ##__VA_ARGS__)
#define LOG_ISLAND(level, fmt, ...)  TMDSPROBE_LOG_STAGE(island, LOG_##level, "ISLAND", fmt, ##__VA_ARGS__)
#define LOG_PACKET(level, fmt, ...)  TMDSPROBE_LOG_STAGE(packet, LOG_##level, "PACKET", fmt, ##__VA_ARGS__)
#define LOG_ECC(level, fmt, ...)     TMDSPROBE_LOG_STAGE(ecc, LOG_##level, "ECC", fmt, ##__VA_ARGS__)
#define LOG_TIMING(level, fmt, ...)  TMDSPROBE_LOG_STAGE(timing, LOG_##level, "TIMING", fmt, ##__VA_ARGS__)

} // namespace tmdsprobe
