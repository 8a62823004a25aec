//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionBridge.h
// Purpose: Uniform invocation of sync and async handlers from the dispatch coroutine
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "scaffold/Handler.h"
#include "scaffold/JSONRPCTypes.h"

namespace scaffold {
namespace async {

//==========================================================================================================
// ExecutionBridge
// Purpose: Binds keyword arguments to a handler's declared parameters and runs it.
//   - SyncHandler: submitted to a bounded worker pool; the calling coroutine suspends until it finishes.
//   - AsyncHandler: awaited in place on the caller's executor.
// Notes:
//   Destruction waits for in-flight synchronous handlers to finish.
//==========================================================================================================
class ExecutionBridge {
public:
    explicit ExecutionBridge(std::size_t workerThreads);
    ~ExecutionBridge();

    ExecutionBridge(const ExecutionBridge&) = delete;
    ExecutionBridge& operator=(const ExecutionBridge&) = delete;

    //==========================================================================================================
    // BindArguments
    // Purpose: For each declared parameter take the supplied value, else its default.
    // Args:
    //   def: Handler whose parameters drive the binding. Undeclared supplied keys are dropped.
    //   supplied: "arguments" object of the request.
    // Returns:
    //   Arguments in declaration order.
    // Throws:
    //   errors::ArgumentError naming the first parameter that is neither supplied nor defaulted.
    //==========================================================================================================
    static Arguments BindArguments(const HandlerDefinition& def, const JSONValue::Object& supplied);

    //==========================================================================================================
    // Invoke
    // Purpose: Binds arguments (before any invocation) and runs the handler.
    // Returns:
    //   The handler's value.
    // Throws:
    //   errors::ArgumentError from binding, errors::NoResultError when the handler returns std::nullopt,
    //   or whatever the handler itself throws.
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> Invoke(const HandlerDefinition& def, const JSONValue::Object& supplied);

    // Runs a handler with arguments that were already bound by BindArguments.
    boost::asio::awaitable<JSONValue> Run(const HandlerDefinition& def, Arguments args);

    std::size_t WorkerThreads() const { return workerThreads_; }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    std::size_t workerThreads_;
};

} // namespace async
} // namespace scaffold
