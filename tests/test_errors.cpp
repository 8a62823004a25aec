//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "scaffold/JSONRPCTypes.h"
#include "scaffold/errors/Errors.h"

using namespace scaffold;

TEST(Errors, CategoryMapping) {
    using scaffold::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorResponseCarriesData) {
    JSONValue::Object data;
    data["parameter"] = std::make_shared<JSONValue>(std::string("a"));
    auto err = errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad input", JSONValue(data));
    EXPECT_EQ(err.category, errors::ErrorCategory::JsonRpcInvalidParams);

    auto resp = errors::makeErrorResponse(JSONRPCId{int64_t{7}}, err);
    EXPECT_EQ(resp->Serialize(),
              R"({"jsonrpc":"2.0","id":7,"error":{"code":-32602,"message":"bad input","data":{"parameter":"a"}}})");
}

TEST(Errors, ErrorResponseEchoesId) {
    auto resp = errors::makeErrorResponse(JSONRPCId{std::string("abc")},
                                          errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Tool not found: x"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->Serialize(),
              R"({"jsonrpc":"2.0","id":"abc","error":{"code":-32601,"message":"Tool not found: x"}})");
    EXPECT_FALSE(resp->result.has_value());
}

TEST(Errors, ExceptionHierarchy) {
    errors::ArgumentError arg("count", "Required parameter 'count' is missing");
    EXPECT_EQ(arg.parameter(), "count");
    EXPECT_STREQ(arg.what(), "Required parameter 'count' is missing");

    errors::NoResultError none("Handler tool_x returned no result");
    const errors::ExecutionError& asExecution = none;
    EXPECT_STREQ(asExecution.what(), "Handler tool_x returned no result");

    errors::ProtocolError proto(JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    EXPECT_EQ(proto.code(), JSONRPCErrorCodes::InvalidRequest);
}
