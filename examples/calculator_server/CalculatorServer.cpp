//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CalculatorServer.cpp
// Purpose: Calculator tools and prompts
//==========================================================================================================

#include "CalculatorServer.hpp"

#include <chrono>
#include <cmath>

#include "logging/Logger.h"
#include "scaffold/async/Awaitables.h"

using namespace scaffold;
using namespace std::chrono_literals;

namespace {

// Integer inputs keep integer results for + - *; anything else is computed in double precision.
template <typename IntOp, typename DoubleOp>
JSONValue arith(const JSONValue& a, const JSONValue& b, IntOp intOp, DoubleOp doubleOp, const Arguments& args) {
    const auto* ia = std::get_if<int64_t>(&a.value);
    const auto* ib = std::get_if<int64_t>(&b.value);
    if (ia && ib) {
        return JSONValue(intOp(*ia, *ib));
    }
    return JSONValue(doubleOp(args.GetNumber("a"), args.GetNumber("b")));
}

JSONValue operationResult(const char* operation, const Arguments& args, JSONValue result, bool isAsync) {
    JSONValue::Object obj;
    obj["operation"] = std::make_shared<JSONValue>(std::string(operation));
    obj["a"] = std::make_shared<JSONValue>(args.Get("a"));
    obj["b"] = std::make_shared<JSONValue>(args.Get("b"));
    obj["result"] = std::make_shared<JSONValue>(std::move(result));
    obj["async"] = std::make_shared<JSONValue>(isAsync);
    return JSONValue{std::move(obj)};
}

JSONValue domainError(const std::string& message) {
    JSONValue::Object obj;
    obj["error"] = std::make_shared<JSONValue>(message);
    return JSONValue{std::move(obj)};
}

} // namespace

std::string CalculatorServer::Instructions() const {
    return "This server provides basic calculator functionality with async support for demonstration.";
}

std::vector<HandlerDefinition> CalculatorServer::Handlers() {
    return {
        HandlerBuilder("tool_add")
            .Doc("Add two numbers together (synchronous).")
            .Param<double>("a")
            .Param<double>("b")
            .Sync(&CalculatorServer::Add),
        HandlerBuilder("tool_subtract")
            .Doc("Subtract second number from first number (synchronous).")
            .Param<double>("a")
            .Param<double>("b")
            .Sync(&CalculatorServer::Subtract),
        HandlerBuilder("tool_multiply_async")
            .Doc("Multiply two numbers (asynchronous with simulated delay).")
            .Param<double>("a")
            .Param<double>("b")
            .Async(&CalculatorServer::MultiplyAsync),
        HandlerBuilder("tool_divide_async")
            .Doc("Divide first number by second number (asynchronous).")
            .Param<double>("a")
            .Param<double>("b")
            .Async(&CalculatorServer::DivideAsync),
        HandlerBuilder("tool_power_async")
            .Doc("Calculate base raised to the power of exponent (asynchronous).")
            .Param<double>("base")
            .Param<double>("exponent")
            .Async(&CalculatorServer::PowerAsync),
        HandlerBuilder("tool_factorial_async")
            .Doc("Calculate factorial of a number (asynchronous with yielding).")
            .Param<int64_t>("n")
            .Async(&CalculatorServer::FactorialAsync),
        HandlerBuilder("prompt_calculate_product")
            .Doc("Generate a prompt for calculating the product of two numbers.\nCategories: math, calculation")
            .Param<double>("a")
            .Param<double>("b")
            .Sync(&CalculatorServer::CalculateProduct),
        HandlerBuilder("prompt_calculate_quotient")
            .Doc("Generate a prompt for calculating the quotient of two numbers.\nCategories: math, calculation")
            .Param<double>("a")
            .Param<double>("b")
            .Async(&CalculatorServer::CalculateQuotient),
    };
}

HandlerResult CalculatorServer::Add(const Arguments& args) {
    JSONValue sum = arith(args.Get("a"), args.Get("b"),
        [](int64_t x, int64_t y) { return x + y; }, [](double x, double y) { return x + y; }, args);
    return operationResult("addition", args, std::move(sum), false);
}

HandlerResult CalculatorServer::Subtract(const Arguments& args) {
    JSONValue diff = arith(args.Get("a"), args.Get("b"),
        [](int64_t x, int64_t y) { return x - y; }, [](double x, double y) { return x - y; }, args);
    return operationResult("subtraction", args, std::move(diff), false);
}

boost::asio::awaitable<HandlerResult> CalculatorServer::MultiplyAsync(Arguments args) {
    // Simulated I/O latency
    co_await async::Sleep(100ms);
    JSONValue product = arith(args.Get("a"), args.Get("b"),
        [](int64_t x, int64_t y) { return x * y; }, [](double x, double y) { return x * y; }, args);
    co_return operationResult("multiplication", args, std::move(product), true);
}

boost::asio::awaitable<HandlerResult> CalculatorServer::DivideAsync(Arguments args) {
    const double b = args.GetNumber("b");
    if (b == 0.0) {
        co_return domainError("Division by zero is not allowed");
    }
    co_await async::Sleep(50ms);
    co_return operationResult("division", args, JSONValue(args.GetNumber("a") / b), true);
}

boost::asio::awaitable<HandlerResult> CalculatorServer::PowerAsync(Arguments args) {
    co_await async::Sleep(200ms);
    const double result = std::pow(args.GetNumber("base"), args.GetNumber("exponent"));
    if (!std::isfinite(result)) {
        LOG_ERROR("Power operation overflowed");
        co_return domainError("Invalid input for power operation");
    }
    JSONValue::Object obj;
    obj["operation"] = std::make_shared<JSONValue>(std::string("power"));
    obj["base"] = std::make_shared<JSONValue>(args.Get("base"));
    obj["exponent"] = std::make_shared<JSONValue>(args.Get("exponent"));
    obj["result"] = std::make_shared<JSONValue>(result);
    obj["async"] = std::make_shared<JSONValue>(true);
    co_return JSONValue{std::move(obj)};
}

boost::asio::awaitable<HandlerResult> CalculatorServer::FactorialAsync(Arguments args) {
    const int64_t n = args.GetInt("n");
    if (n < 0) {
        co_return domainError("Factorial is not defined for negative numbers");
    }
    if (n > 20) {
        co_return domainError("Number too large for factorial calculation");
    }
    int64_t result = 1;
    for (int64_t i = 1; i <= n; ++i) {
        result *= i;
        if (i % 5 == 0) {
            co_await async::Sleep(10ms);
        }
    }
    JSONValue::Object obj;
    obj["operation"] = std::make_shared<JSONValue>(std::string("factorial"));
    obj["n"] = std::make_shared<JSONValue>(n);
    obj["result"] = std::make_shared<JSONValue>(result);
    obj["async"] = std::make_shared<JSONValue>(true);
    co_return JSONValue{std::move(obj)};
}

HandlerResult CalculatorServer::CalculateProduct(const Arguments& args) {
    return JSONValue("What is the product of " + SerializeJSON(args.Get("a")) + " and " +
                     SerializeJSON(args.Get("b")) + "?");
}

boost::asio::awaitable<HandlerResult> CalculatorServer::CalculateQuotient(Arguments args) {
    if (args.GetNumber("b") == 0.0) {
        co_return JSONValue("Division by zero is not allowed.");
    }
    co_return JSONValue("What is the result of dividing " + SerializeJSON(args.Get("a")) + " by " +
                        SerializeJSON(args.Get("b")) + "?");
}
