//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Awaitables.h
// Purpose: Cooperative helpers for async handlers running on the dispatch loop (Boost.Asio coroutines)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace scaffold {
namespace async {

namespace net = boost::asio;

//==========================================================================================================
// Sleep
// Purpose: Suspends the calling coroutine for the given duration without blocking the loop thread.
//==========================================================================================================
template <typename Rep, typename Period>
net::awaitable<void> Sleep(std::chrono::duration<Rep, Period> duration) {
    auto ex = co_await net::this_coro::executor;
    net::steady_timer timer(ex, std::chrono::duration_cast<net::steady_timer::duration>(duration));
    co_await timer.async_wait(net::use_awaitable);
}

// Yields once to let other ready work on the executor run.
inline net::awaitable<void> Yield() {
    co_await Sleep(std::chrono::milliseconds(0));
}

//==========================================================================================================
// GatherAll
// Purpose: Runs every branch concurrently on the current executor and returns their results in input
//          order, regardless of completion order.
// Args:
//   branches: Awaitables to run; each is started exactly once.
// Returns:
//   std::vector<T> with results[i] produced by branches[i].
// Notes:
//   - When any branch throws, the first captured exception is rethrown after all branches finish.
//   - The executor must be single-threaded (the dispatch io_context); completion bookkeeping is not
//     synchronized.
//==========================================================================================================
template <typename T>
net::awaitable<std::vector<T>> GatherAll(std::vector<net::awaitable<T>> branches) {
    auto ex = co_await net::this_coro::executor;
    const std::size_t count = branches.size();
    std::vector<std::optional<T>> slots(count);
    std::exception_ptr firstError;
    std::size_t remaining = count;

    // Timer used as a completion signal: cancelled by the last branch to finish
    net::steady_timer allDone(ex, net::steady_timer::time_point::max());

    for (std::size_t i = 0; i < count; ++i) {
        net::co_spawn(ex, std::move(branches[i]),
            [&slots, &firstError, &remaining, &allDone, i](std::exception_ptr e, T value) {
                if (e) {
                    if (!firstError) firstError = e;
                } else {
                    slots[i] = std::move(value);
                }
                if (--remaining == 0) {
                    allDone.cancel();
                }
            });
    }

    if (remaining > 0) {
        boost::system::error_code ec;
        co_await allDone.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    std::vector<T> results;
    results.reserve(count);
    for (auto& slot : slots) {
        results.push_back(std::move(slot.value()));
    }
    co_return results;
}

} // namespace async
} // namespace scaffold
