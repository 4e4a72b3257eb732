#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cstring>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline LogLevel& logThreshold() {
    static LogLevel threshold = LogLevel::Info;
    return threshold;
}

inline void setLogLevel(LogLevel level) {
    logThreshold() = level;
}

// Reads ENVGRID_LOG_LEVEL (debug|info|warn|error). Unknown values are ignored.
inline void setLogLevelFromEnv() {
    const char* value = std::getenv("ENVGRID_LOG_LEVEL");
    if (!value) return;
    if (std::strcmp(value, "debug") == 0) setLogLevel(LogLevel::Debug);
    else if (std::strcmp(value, "info") == 0) setLogLevel(LogLevel::Info);
    else if (std::strcmp(value, "warn") == 0) setLogLevel(LogLevel::Warn);
    else if (std::strcmp(value, "error") == 0) setLogLevel(LogLevel::Error);
}

inline void logMessage(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < static_cast<int>(logThreshold())) return;

    const char* prefix = "";
    switch (level) {
    case LogLevel::Debug: prefix = "[DEBUG]"; break;
    case LogLevel::Info:  prefix = "[INFO] "; break;
    case LogLevel::Warn:  prefix = "[WARN] "; break;
    case LogLevel::Error: prefix = "[ERROR]"; break;
    }

    std::fprintf(stderr, "%s ", prefix);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}
