//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionBridge.cpp
// Purpose: Argument binding and worker-pool offload of synchronous handlers
//==========================================================================================================

#include "scaffold/async/ExecutionBridge.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "scaffold/errors/Errors.h"

namespace scaffold {
namespace async {

namespace net = boost::asio;

class ExecutionBridge::Impl {
public:
    explicit Impl(std::size_t threads) : pool(threads) {}
    net::thread_pool pool;
};

ExecutionBridge::ExecutionBridge(std::size_t workerThreads)
    : pImpl(std::make_unique<Impl>(workerThreads == 0 ? 1 : workerThreads)),
      workerThreads_(workerThreads == 0 ? 1 : workerThreads) {
    LOG_DEBUG("ExecutionBridge started with {} worker threads", workerThreads_);
}

ExecutionBridge::~ExecutionBridge() {
    // Let submitted handlers run to completion
    pImpl->pool.join();
}

Arguments ExecutionBridge::BindArguments(const HandlerDefinition& def, const JSONValue::Object& supplied) {
    JSONValue::Object bound;
    for (const auto& p : def.parameters) {
        auto it = supplied.find(p.name);
        if (it != supplied.end() && it->second) {
            bound[p.name] = it->second;
        } else if (p.hasDefault) {
            bound[p.name] = std::make_shared<JSONValue>(p.defaultValue.value_or(JSONValue(nullptr)));
        } else {
            throw errors::ArgumentError(p.name, "Required parameter '" + p.name + "' is missing");
        }
    }
    return Arguments(std::move(bound));
}

net::awaitable<JSONValue> ExecutionBridge::Invoke(const HandlerDefinition& def, const JSONValue::Object& supplied) {
    Arguments args = BindArguments(def, supplied);
    co_return co_await Run(def, std::move(args));
}

net::awaitable<JSONValue> ExecutionBridge::Run(const HandlerDefinition& def, Arguments args) {
    HandlerResult result;
    if (const auto* fn = std::get_if<SyncHandler>(&def.handler)) {
        SyncHandler work = *fn;
        // The closure must outlive the spawned frame, so it is a named local of this coroutine.
        auto task = [work = std::move(work), args = std::move(args)]() -> net::awaitable<HandlerResult> {
            co_return work(args);
        };
        // Hop to the pool; completion resumes this coroutine back on its own executor
        result = co_await net::co_spawn(pImpl->pool.get_executor(), std::move(task), net::use_awaitable);
    } else {
        const auto& asyncFn = std::get<AsyncHandler>(def.handler);
        result = co_await asyncFn(std::move(args));
    }

    if (!result.has_value()) {
        throw errors::NoResultError("Handler " + def.methodName + " returned no result");
    }
    co_return std::move(result.value());
}

} // namespace async
} // namespace scaffold
