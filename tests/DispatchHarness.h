//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DispatchHarness.h
// Purpose: Shared test fixtures: a table-driven server instance and JSON inspection helpers
//==========================================================================================================
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "scaffold/Handler.h"
#include "scaffold/JSONRPCTypes.h"
#include "scaffold/ServerConfig.h"
#include "scaffold/StdioServer.hpp"

namespace scaffold {
namespace testing {

// Server instance whose handler table is supplied by the test.
class TableServer : public IServerInstance {
public:
    TableServer(std::string name, std::vector<HandlerDefinition> defs)
        : name_(std::move(name)), defs_(std::move(defs)) {}

    std::string Name() const override { return name_; }
    std::vector<HandlerDefinition> Handlers() override { return defs_; }

private:
    std::string name_;
    std::vector<HandlerDefinition> defs_;
};

inline ServerConfig QuietConfig(std::size_t workers = 2) {
    ServerConfig cfg;
    cfg.logFile.clear();
    cfg.logToConsole = false;
    cfg.workerThreads = workers;
    return cfg;
}

// Member access that throws (failing the test) when the shape is wrong.
inline const JSONValue& Field(const JSONValue& v, const std::string& key) {
    const auto& obj = std::get<JSONValue::Object>(v.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        throw std::out_of_range("missing field: " + key);
    }
    return *it->second;
}

inline bool HasField(const JSONValue& v, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&v.value);
    return obj != nullptr && obj->contains(key);
}

inline const std::string& Str(const JSONValue& v) { return std::get<std::string>(v.value); }
inline int64_t Int(const JSONValue& v) { return std::get<int64_t>(v.value); }
inline const JSONValue::Array& Arr(const JSONValue& v) { return std::get<JSONValue::Array>(v.value); }

// error.code of a parsed response envelope
inline int64_t ErrorCode(const JSONValue& response) { return Int(Field(Field(response, "error"), "code")); }
inline const std::string& ErrorMessage(const JSONValue& response) { return Str(Field(Field(response, "error"), "message")); }

// Runs one line through a server and parses the response; the line must produce a response.
inline JSONValue Roundtrip(StdioServer& server, const std::string& line) {
    auto out = server.ProcessLine(line);
    if (!out.has_value()) {
        throw std::logic_error("expected a response for: " + line);
    }
    return ParseJSON(out.value());
}

} // namespace testing
} // namespace scaffold
