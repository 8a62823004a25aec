//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Layered server configuration: defaults, environment, config string, command line
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace scaffold {

//==========================================================================================================
// ServerConfig
// Purpose: Runtime settings of a stdio server process.
// Fields:
//   logFile: Append-only request/response log. Empty disables the file sink.
//   logLevel: DEBUG | INFO | WARN | ERROR.
//   logToConsole: Mirror log lines to stderr.
//   workerThreads: Size of the pool that runs synchronous handlers (at least 1).
//   inputFile: When set, the whole file is processed as a single request.
//==========================================================================================================
struct ServerConfig {
    std::string logFile{"mcpserver.log"};
    std::string logLevel{"INFO"};
    bool logToConsole{true};
    std::size_t workerThreads{4};
    std::optional<std::string> inputFile;

    //==========================================================================================================
    // Load
    // Purpose: Builds a configuration from all layers, later layers overriding earlier ones:
    //   1. defaults
    //   2. SCAFFOLD_LOG_FILE, SCAFFOLD_LOG_LEVEL, SCAFFOLD_LOG_CONSOLE, SCAFFOLD_WORKERS
    //   3. SCAFFOLD_CONFIG config string
    //   4. command line (--config=, --log-file=, --log-level=, --workers=, first positional = input file)
    //==========================================================================================================
    static ServerConfig Load(int argc, char** argv);

    void ApplyEnvironment();

    // key=value pairs separated by ';' or whitespace. Keys: log_file, log_level, log_console, workers.
    // Unknown keys and malformed values are ignored.
    void ApplyConfigString(const std::string& config);

    void ApplyCommandLine(int argc, char** argv);

    // Pushes the logging settings into the process-wide Logger.
    void ApplyLogging() const;
};

//==========================================================================================================
// GetArgValue
// Purpose: Returns the value of a "--key=value" argument.
// Args:
//   argc/argv: Process arguments.
//   key: Option name including the leading dashes (e.g. "--workers").
// Returns:
//   Value of the last matching argument, or std::nullopt when absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

} // namespace scaffold
