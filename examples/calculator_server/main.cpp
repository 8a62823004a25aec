//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Calculator MCP server over stdio
//==========================================================================================================

#include <exception>
#include <stdexcept>

#include "CalculatorServer.hpp"
#include "logging/Logger.h"
#include "scaffold/ServerConfig.h"
#include "scaffold/StdioServer.hpp"
#include "scaffold/version.h"

using namespace scaffold;

int main(int argc, char** argv) {
    ServerConfig config = ServerConfig::Load(argc, argv);
    config.ApplyLogging();
    LOG_INFO("Calculator server starting (scaffold {}, workers={}, input={})", getVersionString(), config.workerThreads,
             config.inputFile.value_or("stdin"));

    CalculatorServer instance;
    try {
        StdioServer server(instance, config);
        StdioServer::InstallInterruptHandler();
        const int rc = server.Run();
        Logger::closeLogFile();
        return rc;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid handler registration: {}", e.what());
        return 1;
    }
}
