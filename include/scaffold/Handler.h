//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handler.h
// Purpose: Handler registration model: bound arguments, sync/async handler signatures, the fluent
//          HandlerBuilder, and the IServerInstance capability surface scanned at startup.
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "scaffold/JSONRPCTypes.h"
#include "scaffold/schema/SignatureIntrospector.h"
#include "scaffold/schema/TypeTag.h"

namespace scaffold {

//==========================================================================================================
// Arguments
// Purpose: Keyword-bound arguments handed to a handler. Every declared parameter is present (supplied
//          or defaulted) by the time a handler runs.
// Notes:
//   Typed getters throw errors::ArgumentError naming the parameter when the key is absent or the
//   value has the wrong type. GetNumber accepts integer values.
//==========================================================================================================
class Arguments {
public:
    Arguments() = default;
    explicit Arguments(JSONValue::Object values) : values_(std::move(values)) {}

    bool Has(const std::string& name) const;
    const JSONValue& Get(const std::string& name) const;

    std::string GetString(const std::string& name) const;
    int64_t GetInt(const std::string& name) const;
    double GetNumber(const std::string& name) const;
    bool GetBool(const std::string& name) const;
    const JSONValue::Array& GetArray(const std::string& name) const;
    const JSONValue::Object& GetObject(const std::string& name) const;

    // Absent or null -> std::nullopt; wrong type still throws.
    std::optional<std::string> GetOptionalString(const std::string& name) const;
    std::optional<int64_t> GetOptionalInt(const std::string& name) const;
    std::optional<double> GetOptionalNumber(const std::string& name) const;
    std::optional<bool> GetOptionalBool(const std::string& name) const;

    const JSONValue::Object& Values() const { return values_; }

private:
    JSONValue::Object values_;
};

// std::nullopt is the "no result" sentinel; the execution bridge reports it as a failure.
using HandlerResult = std::optional<JSONValue>;

using SyncHandler = std::function<HandlerResult(const Arguments&)>;
using AsyncHandler = std::function<boost::asio::awaitable<HandlerResult>(Arguments)>;

//==========================================================================================================
// HandlerDefinition
// Purpose: One row of a server's registration table.
// Fields:
//   methodName: "tool_<name>" or "prompt_<name>"; other names are not exposed.
//   doc: Documentation text. First line is the description; prompts also carry category labels.
//   parameters: Declared parameters in declaration order.
//   handler: SyncHandler (offloaded to the worker pool) or AsyncHandler (awaited on the dispatch loop).
//==========================================================================================================
struct HandlerDefinition {
    std::string methodName;
    std::string doc;
    std::vector<schema::ParameterDescriptor> parameters;
    std::variant<SyncHandler, AsyncHandler> handler;

    bool IsAsync() const { return std::holds_alternative<AsyncHandler>(handler); }
};

//==========================================================================================================
// HandlerBuilder
// Purpose: Fluent construction of a HandlerDefinition.
// Example:
//   HandlerBuilder("tool_add")
//       .Doc("Add two numbers together.")
//       .Param<double>("a")
//       .Param<double>("b")
//       .Sync([](const Arguments& args) -> HandlerResult { ... })
//==========================================================================================================
class HandlerBuilder {
public:
    explicit HandlerBuilder(std::string methodName) {
        def_.methodName = std::move(methodName);
    }

    HandlerBuilder& Doc(std::string doc) {
        def_.doc = std::move(doc);
        return *this;
    }

    HandlerBuilder& Param(std::string name, schema::TypeTag type) {
        def_.parameters.push_back(schema::ParameterDescriptor{std::move(name), std::move(type), false, std::nullopt});
        return *this;
    }

    HandlerBuilder& Param(std::string name, schema::TypeTag type, JSONValue defaultValue) {
        def_.parameters.push_back(
            schema::ParameterDescriptor{std::move(name), std::move(type), true, std::move(defaultValue)});
        return *this;
    }

    template <typename T>
    HandlerBuilder& Param(std::string name) {
        return Param(std::move(name), schema::TypeTagOf<T>());
    }

    template <typename T>
    HandlerBuilder& Param(std::string name, JSONValue defaultValue) {
        return Param(std::move(name), schema::TypeTagOf<T>(), std::move(defaultValue));
    }

    HandlerDefinition Sync(SyncHandler fn) {
        def_.handler = std::move(fn);
        return def_;
    }

    HandlerDefinition Async(AsyncHandler fn) {
        def_.handler = std::move(fn);
        return def_;
    }

private:
    HandlerDefinition def_;
};

//==========================================================================================================
// IServerInstance
// Purpose: Capability surface of a concrete server. The registry scans Handlers() once at startup.
//          Implementations that keep mutable state across calls guard it themselves.
//==========================================================================================================
class IServerInstance {
public:
    virtual ~IServerInstance() = default;

    virtual std::string Name() const = 0;
    virtual std::string Version() const;
    virtual std::string Instructions() const;
    virtual std::vector<HandlerDefinition> Handlers() = 0;
};

} // namespace scaffold
