//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state, line rendering, and the redacted console and file outputs.
//==========================================================================================================

#include <unistd.h>
#include <errno.h>

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace {
bool colorFromEnvironment() {
    // Explicit setting wins; otherwise color only when stderr is a terminal.
    if (GetEnvIfSet("PMTRELAY_LOG_COLOR")) {
        return GetEnvBool("PMTRELAY_LOG_COLOR", false);
    }
    return ::isatty(STDERR_FILENO) == 1;
}

const char* baseName(const char* file) {
    const char* slash = ::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

bool isSevere(const char* level) {
    return ::strcmp(level, "ERROR") == 0 || ::strcmp(level, "FATAL") == 0;
}
} // namespace

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::shared_ptr<RedactingWriter> Logger::sWriter;
bool Logger::sColorEnabled = colorFromEnvironment();

bool Logger::levelFromString(const std::string& lvl, LogLevel& out) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") out = LogLevel::LOG_DEBUG_LEVEL;
    else if (s == "INFO") out = LogLevel::LOG_INFO_LEVEL;
    else if (s == "WARN" || s == "WARNING") out = LogLevel::LOG_WARN_LEVEL;
    else if (s == "ERROR") out = LogLevel::LOG_ERROR_LEVEL;
    else if (s == "FATAL") out = LogLevel::LOG_FATAL_LEVEL;
    else return false;
    return true;
}

bool Logger::setLogLevel(const std::string& level) {
    LogLevel parsed = sLogLevel;
    if (!levelFromString(level, parsed)) {
        return false;
    }
    sLogLevel = parsed;
    return true;
}

void Logger::setColorEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sColorEnabled = enabled;
}

void Logger::setWriter(std::shared_ptr<RedactingWriter> writer) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sWriter = std::move(writer);
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    if (filePath.empty()) {
        return;
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << fmt::format("[ERROR] Failed to open log file: {} (errno={} msg={})\n", filePath, errno,
                                 ::strerror(errno));
        return;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    sLogFile << "\n=== pmtrelay log opened at " << stamp << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    const std::string plain = fmt::format("[{}] {}:{}: {}\n", level, baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sColorEnabled) {
        // burgundy for ERROR/FATAL, purple otherwise
        const char* color = isSevere(level) ? "\033[38;5;88m" : "\033[35m";
        const std::string colored =
            fmt::format("[{}{}\033[0m] {}:{}: {}\n", color, level, baseName(file), line, msg);
        if (sWriter) sWriter->Write(colored);
        else std::cerr << colored << std::flush;
    } else {
        if (sWriter) sWriter->Write(plain);
        else std::cerr << plain << std::flush;
    }

    if (sLogFile.is_open()) {
        sLogFile << (sWriter ? sWriter->Redact(plain) : plain);
        sLogFile.flush();
    }
}
