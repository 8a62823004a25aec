//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy for dispatch (argument, execution, protocol) and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "scaffold/JSONRPCTypes.h"

namespace scaffold {
namespace errors {

// Categorization of the JSON-RPC error codes the dispatcher emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation used across the dispatch path.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//==========================================================================================================
// ArgumentError
// Purpose: A declared handler parameter was not supplied (and has no default), or an argument has the
//          wrong type for its typed accessor. Carries the parameter name.
//==========================================================================================================
class ArgumentError : public std::runtime_error {
public:
    ArgumentError(std::string parameter, const std::string& message)
        : std::runtime_error(message), parameter_(std::move(parameter)) {}

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

//==========================================================================================================
// ExecutionError
// Purpose: A handler produced no result or signalled a domain failure.
//==========================================================================================================
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by the execution bridge when a handler returns the no-result sentinel.
class NoResultError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

//==========================================================================================================
// ProtocolError
// Purpose: Envelope-level failure carrying the JSON-RPC code to report.
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Build a typed error with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace scaffold
