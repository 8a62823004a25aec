//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC 2.0 request state machine: parse, validate, route, invoke, respond
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "scaffold/CapabilityRegistry.h"
#include "scaffold/JSONRPCTypes.h"
#include "scaffold/async/ExecutionBridge.h"

namespace scaffold {

//==========================================================================================================
// Dispatcher
// Purpose: Turns one raw request text into at most one serialized response envelope.
// Routes:
//   initialize, tools/list, tools/call, prompts/list, prompts/get, notifications/initialized.
// Notes:
//   - Holds the registry by reference and never mutates it.
//   - Handler failures never escape a dispatch cycle; they become JSON-RPC error envelopes.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(const CapabilityRegistry& registry, async::ExecutionBridge& bridge);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    //==========================================================================================================
    // HandleMessage
    // Purpose: Runs one full dispatch cycle.
    // Args:
    //   raw: One complete JSON-RPC message.
    // Returns:
    //   Single-line response JSON, or std::nullopt for notifications.
    //==========================================================================================================
    boost::asio::awaitable<std::optional<std::string>> HandleMessage(std::string raw);

    //==========================================================================================================
    // HandleRequest
    // Purpose: Routes an already-parsed envelope (object form).
    // Returns:
    //   Response, or std::nullopt for notifications.
    //==========================================================================================================
    boost::asio::awaitable<std::optional<JSONRPCResponse>> HandleRequest(const JSONValue::Object& envelope);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scaffold
