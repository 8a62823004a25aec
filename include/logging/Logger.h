//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging with a console sink (stderr) and an append-only file sink.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static logger shared by the dispatch loop, the worker pool and handlers.
// Notes:
//   - stdout carries protocol frames only, so the console sink writes to stderr.
//   - Both sinks are written under one mutex; lines from different threads never interleave.
//   - SCAFFOLD_LOG_COLOR=1 colors the level label on the console sink.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl);

    // Variadic logging with {}-style runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* format, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(format, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (in \"{}\")", e.what(), format);
        }
        log(level, buffer, file, line);
    }

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static void setLogLevelFromString(const std::string& level) { sLogLevel = levelFromString(level); }

    static void setConsoleEnabled(bool enabled);

    //==========================================================================================================
    // setLogFile
    // Purpose: Replaces the file sink. The file is opened in append mode and a banner line is written.
    // Args:
    //   filePath: Destination path; empty closes the current sink without opening a new one.
    //==========================================================================================================
    static void setLogFile(const std::string& filePath);
    static void closeLogFile();
    static bool hasLogFile();

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::string timestamp();

    static bool sConsoleEnabled;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit tracing, compiled in for _DEBUG builds only
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
