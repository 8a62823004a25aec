//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks and static state.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
bool Logger::sConsoleEnabled = true;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sConsoleEnabled = enabled;
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
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
}

bool Logger::hasLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    return sLogFile.is_open();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvFlag("SCAFFOLD_LOG_COLOR", false);

    std::lock_guard<std::mutex> lock(sLogMutex);
    const std::string stamp = timestamp();
    const std::string logMessage = fmt::format("[{}] [{}] {}:{}: {}\n", stamp, level, file, line, msg);

    if (sConsoleEnabled) {
        if (colorEnabled) {
            const char* labelColor = (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0)
                                         ? "\033[38;5;88m" /* burgundy */
                                         : "\033[35m" /* purple */;
            std::cerr << fmt::format("[{}] [{}{}\033[0m] {}:{}: {}\n", stamp, labelColor, level, file, line, msg);
        } else {
            std::cerr << logMessage;
        }
    }

    if (sLogFile.is_open()) {
        sLogFile << logMessage;
        sLogFile.flush();
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
