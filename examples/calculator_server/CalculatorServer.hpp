//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CalculatorServer.hpp
// Purpose: Calculator server instance mixing synchronous and asynchronous tools
//==========================================================================================================
#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "scaffold/Handler.h"

//==========================================================================================================
// CalculatorServer
// Purpose: Arithmetic tools (add/subtract run on the worker pool; *_async variants yield on the loop)
//          and two math prompts.
//==========================================================================================================
class CalculatorServer : public scaffold::IServerInstance {
public:
    std::string Name() const override { return "CalculatorServer"; }
    std::string Instructions() const override;
    std::vector<scaffold::HandlerDefinition> Handlers() override;

private:
    static scaffold::HandlerResult Add(const scaffold::Arguments& args);
    static scaffold::HandlerResult Subtract(const scaffold::Arguments& args);
    static boost::asio::awaitable<scaffold::HandlerResult> MultiplyAsync(scaffold::Arguments args);
    static boost::asio::awaitable<scaffold::HandlerResult> DivideAsync(scaffold::Arguments args);
    static boost::asio::awaitable<scaffold::HandlerResult> PowerAsync(scaffold::Arguments args);
    static boost::asio::awaitable<scaffold::HandlerResult> FactorialAsync(scaffold::Arguments args);
    static scaffold::HandlerResult CalculateProduct(const scaffold::Arguments& args);
    static boost::asio::awaitable<scaffold::HandlerResult> CalculateQuotient(scaffold::Arguments args);
};
