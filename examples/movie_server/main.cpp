//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Movie MCP server over stdio
//==========================================================================================================

#include <stdexcept>

#include "MovieServer.hpp"
#include "logging/Logger.h"
#include "scaffold/ServerConfig.h"
#include "scaffold/StdioServer.hpp"
#include "scaffold/version.h"

using namespace scaffold;

int main(int argc, char** argv) {
    ServerConfig config = ServerConfig::Load(argc, argv);
    config.ApplyLogging();
    LOG_INFO("Movie server starting (scaffold {}, workers={})", getVersionString(), config.workerThreads);

    MovieServer instance;
    try {
        StdioServer server(instance, config);
        StdioServer::InstallInterruptHandler();
        const int rc = server.Run();
        LOG_INFO("Movie server exiting with {} bookings recorded", instance.BookingCount());
        Logger::closeLogFile();
        return rc;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid handler registration: {}", e.what());
        return 1;
    }
}
