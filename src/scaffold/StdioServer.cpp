//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.cpp
// Purpose: Stdio server loop driving the dispatcher on a single-threaded io_context
//==========================================================================================================

#include "scaffold/StdioServer.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "scaffold/Dispatcher.h"
#include "scaffold/async/ExecutionBridge.h"
#include "scaffold/errors/Errors.h"

namespace scaffold {

namespace net = boost::asio;

namespace {

std::atomic<bool> gStopRequested{false};

void onInterrupt(int /*signo*/) {
    gStopRequested.store(true);
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

class StdioServer::Impl {
public:
    Impl(IServerInstance& instance, ServerConfig cfg)
        : config(std::move(cfg)),
          registry(instance),
          bridge(config.workerThreads),
          dispatcher(registry, bridge) {}

    ServerConfig config;
    net::io_context ioc;
    CapabilityRegistry registry;
    async::ExecutionBridge bridge;
    Dispatcher dispatcher;

    void writeResponse(std::ostream& out, const std::string& response) {
        LOG_INFO("RESPONSE: {}", response);
        out << response << '\n';
        out.flush();
    }
};

StdioServer::StdioServer(IServerInstance& instance, ServerConfig config)
    : pImpl(std::make_unique<Impl>(instance, std::move(config))) {
    FUNC_SCOPE();
}

StdioServer::~StdioServer() = default;

std::optional<std::string> StdioServer::ProcessLine(const std::string& line) {
    FUNC_SCOPE();
    auto fut = net::co_spawn(pImpl->ioc, pImpl->dispatcher.HandleMessage(line), net::use_future);
    pImpl->ioc.restart();
    pImpl->ioc.run();
    try {
        return fut.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch cycle failed: {}", e.what());
        return errors::makeErrorResponse(nullptr, errors::makeError(JSONRPCErrorCodes::InternalError,
                                                                     std::string("Internal error: ") + e.what()))
            ->Serialize();
    } catch (...) {
        LOG_ERROR("Dispatch cycle failed with a non-standard exception");
        return errors::makeErrorResponse(nullptr, errors::makeError(JSONRPCErrorCodes::InternalError,
                                                                     "Internal error: unknown error"))
            ->Serialize();
    }
}

int StdioServer::RunStream(std::istream& in, std::ostream& out) {
    FUNC_SCOPE();
    LOG_INFO("MCP server '{}' started. Waiting for JSON-RPC 2.0 messages...", pImpl->registry.ServerInfo().name);
    std::string line;
    while (!StopRequested() && std::getline(in, line)) {
        std::string request = trim(line);
        if (request.empty()) {
            continue;
        }
        LOG_INFO("REQUEST: {}", request);
        auto response = ProcessLine(request);
        if (response.has_value()) {
            pImpl->writeResponse(out, response.value());
        }
    }
    if (StopRequested()) {
        LOG_INFO("MCP server stopped by interrupt.");
    } else {
        LOG_INFO("End of input; MCP server stopped.");
    }
    return 0;
}

int StdioServer::RunFile(const std::string& path, std::ostream& out) {
    FUNC_SCOPE();
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Error reading file {}: {}", path, std::strerror(errno));
        return 1;
    }
    std::string request((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        LOG_ERROR("Error reading file {}: read failed", path);
        return 1;
    }
    LOG_INFO("REQUEST: {}", request);
    auto response = ProcessLine(request);
    if (response.has_value()) {
        pImpl->writeResponse(out, response.value());
    }
    return 0;
}

int StdioServer::Run() {
    if (pImpl->config.inputFile.has_value()) {
        return RunFile(pImpl->config.inputFile.value(), std::cout);
    }
    return RunStream(std::cin, std::cout);
}

const CapabilityRegistry& StdioServer::Registry() const {
    return pImpl->registry;
}

const ServerConfig& StdioServer::Config() const {
    return pImpl->config;
}

void StdioServer::InstallInterruptHandler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onInterrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a blocking read returns EINTR
    if (::sigaction(SIGINT, &sa, nullptr) != 0) {
        LOG_WARN("Failed to install SIGINT handler: {}", std::strerror(errno));
    }
    if (::sigaction(SIGTERM, &sa, nullptr) != 0) {
        LOG_WARN("Failed to install SIGTERM handler: {}", std::strerror(errno));
    }
}

void StdioServer::RequestStop() {
    gStopRequested.store(true);
}

bool StdioServer::StopRequested() {
    return gStopRequested.load();
}

void StdioServer::ResetStop() {
    gStopRequested.store(false);
}

} // namespace scaffold
