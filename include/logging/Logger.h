//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Level-filtered diagnostic logging to stderr (never stdout) through a redacting sink.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "logging/RedactingWriter.h"

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Process-wide logger. Lines render as "[LEVEL] file:line: message". Console lines go to the
//          installed RedactingWriter (plain stderr when none); the optional log file receives the same
//          line after redaction and without colour.
//==========================================================================================================
class Logger {
public:
    //==========================================================================================================
    // levelFromString
    // Purpose: Converts DEBUG, INFO, WARN/WARNING, ERROR, FATAL (any case) to LogLevel.
    // Returns:
    //   true and sets out when recognized; false leaves out untouched.
    //==========================================================================================================
    static bool levelFromString(const std::string& lvl, LogLevel& out);

    static bool enabled(LogLevel level) { return sLogLevel <= level; }

    template <typename... Args>
    static void logf(const char* level, const char* format, const char* file, unsigned int line, Args&&... args) {
        std::string msg;
        try {
            msg = fmt::vformat(format, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            msg = fmt::format("Format error: {}", e.what());
        }
        log(level, msg, file, line);
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static bool setLogLevel(const std::string& level);

    static void setColorEnabled(bool enabled);

    // Installs the console sink. nullptr restores unredacted stderr.
    static void setWriter(std::shared_ptr<RedactingWriter> writer);

    // Appends to filePath; an empty path closes the current file.
    static void setLogFile(const std::string& filePath);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static std::shared_ptr<RedactingWriter> sWriter;
    static bool sColorEnabled;
};

#define PMTRELAY_LOG_AT(lvl, name, fmt, ...) \
    do { if (Logger::enabled(lvl)) Logger::logf(name, fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)

#define LOG_DEBUG(fmt, ...) PMTRELAY_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  PMTRELAY_LOG_AT(LogLevel::LOG_INFO_LEVEL, "INFO", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  PMTRELAY_LOG_AT(LogLevel::LOG_WARN_LEVEL, "WARN", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) PMTRELAY_LOG_AT(LogLevel::LOG_ERROR_LEVEL, "ERROR", fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while (0)

// Debug builds trace handler entry and exit
#ifdef _DEBUG
struct LogScopeTrace {
    const char* func;
    explicit LogScopeTrace(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~LogScopeTrace() { LOG_DEBUG("EXIT:  {}", func); }
};
#define FUNC_SCOPE() [[maybe_unused]] LogScopeTrace funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
