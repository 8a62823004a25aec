//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration layering and Logger setup
//==========================================================================================================

#include "scaffold/ServerConfig.h"

#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace scaffold {

namespace {

bool parseWorkers(const std::string& s, std::size_t& out) {
    try {
        long long v = std::stoll(s);
        out = v < 1 ? 1 : static_cast<std::size_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseFlag(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "FALSE" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    std::optional<std::string> found;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (a.compare(0, eq, key) == 0 && eq == key.size()) {
            found = a.substr(eq + 1);
        }
    }
    return found;
}

ServerConfig ServerConfig::Load(int argc, char** argv) {
    ServerConfig cfg;
    cfg.ApplyEnvironment();
    cfg.ApplyCommandLine(argc, argv);
    return cfg;
}

void ServerConfig::ApplyEnvironment() {
    const std::string unset = "\x01";
    if (auto v = GetEnvOrDefault("SCAFFOLD_LOG_FILE", unset); v != unset) {
        logFile = v;
    }
    if (auto v = GetEnvOrDefault("SCAFFOLD_LOG_LEVEL", unset); v != unset && !v.empty()) {
        logLevel = v;
    }
    logToConsole = GetEnvFlag("SCAFFOLD_LOG_CONSOLE", logToConsole);
    if (auto v = GetEnvOrDefault("SCAFFOLD_WORKERS", unset); v != unset) {
        std::size_t n = 0;
        if (parseWorkers(v, n)) workerThreads = n;
    }
    if (auto v = GetEnvOrDefault("SCAFFOLD_CONFIG", ""); !v.empty()) {
        ApplyConfigString(v);
    }
}

void ServerConfig::ApplyConfigString(const std::string& config) {
    // Parse key=value pairs separated by ';' or whitespace
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        if (key == "log_file") {
            logFile = val;
        } else if (key == "log_level") {
            if (!val.empty()) logLevel = val;
        } else if (key == "log_console") {
            bool b = logToConsole; if (parseFlag(val, b)) logToConsole = b;
        } else if (key == "workers") {
            std::size_t n = 0; if (parseWorkers(val, n)) workerThreads = n;
        }
    }
}

void ServerConfig::ApplyCommandLine(int argc, char** argv) {
    if (auto v = GetArgValue(argc, argv, "--config"); v.has_value()) {
        ApplyConfigString(v.value());
    }
    if (auto v = GetArgValue(argc, argv, "--log-file"); v.has_value()) {
        logFile = v.value();
    }
    if (auto v = GetArgValue(argc, argv, "--log-level"); v.has_value() && !v->empty()) {
        logLevel = v.value();
    }
    if (auto v = GetArgValue(argc, argv, "--workers"); v.has_value()) {
        std::size_t n = 0;
        if (parseWorkers(v.value(), n)) workerThreads = n;
    }
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) continue;
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0 || a.empty()) continue;
        inputFile = a;
        break;
    }
}

void ServerConfig::ApplyLogging() const {
    Logger::setLogLevelFromString(logLevel);
    Logger::setConsoleEnabled(logToConsole);
    Logger::setLogFile(logFile);
}

} // namespace scaffold
