//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.hpp
// Purpose: Newline-delimited JSON-RPC server loop over stdin/stdout (or a single request file)
//==========================================================================================================
#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "scaffold/CapabilityRegistry.h"
#include "scaffold/Handler.h"
#include "scaffold/ServerConfig.h"

namespace scaffold {

//==========================================================================================================
// StdioServer
// Purpose: Owns the dispatch loop (a single-threaded io_context), the capability registry, the worker
//          pool for synchronous handlers, and the dispatcher. One request is fully processed before the
//          next one is read, so responses come out in input order.
//==========================================================================================================
class StdioServer {
public:
    //==========================================================================================================
    // Scans the instance's handlers and starts the worker pool.
    // Args:
    //   instance: Server instance; must outlive the StdioServer.
    //   config: Worker count and input source. Logging is configured by the caller (ApplyLogging).
    // Throws:
    //   std::invalid_argument when the instance's handler table is invalid.
    //==========================================================================================================
    StdioServer(IServerInstance& instance, ServerConfig config);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    //==========================================================================================================
    // ProcessLine
    // Purpose: Runs one dispatch cycle to completion.
    // Returns:
    //   Serialized response, or std::nullopt for notifications.
    //==========================================================================================================
    std::optional<std::string> ProcessLine(const std::string& line);

    //==========================================================================================================
    // RunStream
    // Purpose: Reads one request per line; blank lines are skipped. Each response is written as one line
    //          and flushed.
    // Returns:
    //   Process exit code (0 on end of input or interrupt).
    //==========================================================================================================
    int RunStream(std::istream& in, std::ostream& out);

    //==========================================================================================================
    // RunFile
    // Purpose: Treats the whole file as a single request.
    // Returns:
    //   0 on success; 1 when the file cannot be read.
    //==========================================================================================================
    int RunFile(const std::string& path, std::ostream& out);

    // RunFile when an input file is configured, else RunStream over stdin/stdout.
    int Run();

    const CapabilityRegistry& Registry() const;
    const ServerConfig& Config() const;

    //==========================================================================================================
    // Interrupt handling
    // InstallInterruptHandler: SIGINT/SIGTERM request a stop; a blocked read is interrupted (no SA_RESTART).
    // RequestStop/StopRequested/ResetStop: process-wide stop flag consulted by RunStream.
    //==========================================================================================================
    static void InstallInterruptHandler();
    static void RequestStop();
    static bool StopRequested();
    static void ResetStop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scaffold
