//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_prompts.cpp
// Purpose: GoogleTests for prompts/get: metadata-only form, rendering and message normalization
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>

#include "DispatchHarness.h"
#include "scaffold/typed/Content.h"

using namespace scaffold;
using namespace scaffold::testing;

namespace {

std::vector<HandlerDefinition> promptTable() {
    return {
        HandlerBuilder("prompt_summarize")
            .Doc("Summarize a topic.\nCategories: Writing, NLP")
            .Param<std::string>("topic")
            .Sync([](const Arguments& args) -> HandlerResult {
                return JSONValue("Summarize " + args.GetString("topic"));
            }),
        HandlerBuilder("prompt_dialog")
            .Doc("Two-turn dialog.")
            .Param<std::string>("topic")
            .Async([](Arguments args) -> boost::asio::awaitable<HandlerResult> {
                JSONValue::Array msgs;
                msgs.push_back(std::make_shared<JSONValue>(typed::makeMessage("assistant", "Ready.")));
                msgs.push_back(std::make_shared<JSONValue>(typed::makeUserMessage("Discuss " + args.GetString("topic"))));
                co_return JSONValue(std::move(msgs));
            }),
        HandlerBuilder("prompt_wrapped")
            .Param<std::string>("topic")
            .Sync([](const Arguments& args) -> HandlerResult {
                JSONValue::Array msgs;
                msgs.push_back(std::make_shared<JSONValue>(typed::makeUserMessage(args.GetString("topic"))));
                JSONValue::Object obj;
                obj["messages"] = std::make_shared<JSONValue>(std::move(msgs));
                return JSONValue(std::move(obj));
            }),
        HandlerBuilder("prompt_number")
            .Param<int64_t>("n")
            .Sync([](const Arguments& args) -> HandlerResult { return JSONValue(args.GetInt("n") * 3); }),
        HandlerBuilder("prompt_empty")
            .Param<std::string>("topic")
            .Sync([](const Arguments&) -> HandlerResult { return std::nullopt; }),
        HandlerBuilder("prompt_broken")
            .Param<std::string>("topic")
            .Sync([](const Arguments&) -> HandlerResult { throw std::runtime_error("template missing"); }),
        HandlerBuilder("prompt_odd")
            .Param<std::string>("topic")
            .Sync([](const Arguments&) -> HandlerResult { throw std::string("not an exception"); }),
    };
}

const JSONValue& messageAt(const JSONValue& resp, std::size_t index) {
    const auto& msgs = Arr(Field(Field(resp, "result"), "messages"));
    if (index >= msgs.size()) {
        throw std::out_of_range("no message at index");
    }
    return *msgs[index];
}

std::string messageText(const JSONValue& msg) {
    return Str(Field(Field(msg, "content"), "text"));
}

} // namespace

TEST(PromptsGet, WithoutArgumentsReturnsMetadataOnly) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto raw = server.ProcessLine(R"({"jsonrpc":"2.0","id":1,"method":"prompts/get","params":{"name":"summarize"}})");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw.value(),
              R"({"jsonrpc":"2.0","id":1,"result":{"description":"Summarize a topic.","categories":["writing","nlp"]}})");

    // Empty arguments object behaves the same
    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":2,"method":"prompts/get","params":{"name":"dialog","arguments":{}}})");
    const auto& result = Field(resp, "result");
    EXPECT_EQ(Str(Field(result, "description")), "Two-turn dialog.");
    EXPECT_FALSE(HasField(result, "categories"));
    EXPECT_FALSE(HasField(result, "messages"));
}

TEST(PromptsGet, StringResultBecomesSingleUserMessage) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":3,"method":"prompts/get","params":{"name":"summarize","arguments":{"topic":"rust"}}})");
    const auto& msgs = Arr(Field(Field(resp, "result"), "messages"));
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(Str(Field(*msgs[0], "role")), "user");
    EXPECT_EQ(Str(Field(Field(*msgs[0], "content"), "type")), "text");
    EXPECT_EQ(messageText(*msgs[0]), "Summarize rust");
    EXPECT_EQ(SerializeJSON(Field(Field(resp, "result"), "categories")), R"(["writing","nlp"])");
}

TEST(PromptsGet, MessageListPassesThrough) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":4,"method":"prompts/get","params":{"name":"dialog","arguments":{"topic":"jazz"}}})");
    EXPECT_EQ(Str(Field(messageAt(resp, 0), "role")), "assistant");
    EXPECT_EQ(messageText(messageAt(resp, 0)), "Ready.");
    EXPECT_EQ(Str(Field(messageAt(resp, 1), "role")), "user");
    EXPECT_EQ(messageText(messageAt(resp, 1)), "Discuss jazz");
}

TEST(PromptsGet, MessagesObjectIsUnwrapped) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":5,"method":"prompts/get","params":{"name":"wrapped","arguments":{"topic":"x"}}})");
    EXPECT_EQ(Arr(Field(Field(resp, "result"), "messages")).size(), 1u);
    EXPECT_EQ(messageText(messageAt(resp, 0)), "x");
}

TEST(PromptsGet, OtherValuesAreStringified) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":6,"method":"prompts/get","params":{"name":"number","arguments":{"n":7}}})");
    EXPECT_EQ(Str(Field(messageAt(resp, 0), "role")), "user");
    EXPECT_EQ(messageText(messageAt(resp, 0)), "21");
}

TEST(PromptsGet, MissingArgumentNamesParameterAndPrompt) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":7,"method":"prompts/get","params":{"name":"summarize","arguments":{"other":1}}})");
    EXPECT_EQ(ErrorCode(resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(ErrorMessage(resp), "Prompt execution error: Missing required argument 'topic' for prompt summarize");
}

TEST(PromptsGet, HandlerFailuresAreInternalErrors) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto empty = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":8,"method":"prompts/get","params":{"name":"empty","arguments":{"topic":"t"}}})");
    EXPECT_EQ(ErrorCode(empty), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(ErrorMessage(empty), "Prompt execution error: Prompt empty returned no result");

    auto broken = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":9,"method":"prompts/get","params":{"name":"broken","arguments":{"topic":"t"}}})");
    EXPECT_EQ(ErrorCode(broken), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(ErrorMessage(broken), "Prompt execution error: template missing");

    auto odd = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":12,"method":"prompts/get","params":{"name":"odd","arguments":{"topic":"t"}}})");
    EXPECT_EQ(ErrorCode(odd), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(ErrorMessage(odd), "Prompt execution error: Prompt odd failed: unknown error");
}

TEST(PromptsGet, LookupFailures) {
    TableServer instance("Prompts", promptTable());
    StdioServer server(instance, QuietConfig());

    auto noName = Roundtrip(server, R"({"jsonrpc":"2.0","id":10,"method":"prompts/get","params":{}})");
    EXPECT_EQ(ErrorCode(noName), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(ErrorMessage(noName), "Missing required parameter 'name'");

    auto unknown = Roundtrip(server, R"({"jsonrpc":"2.0","id":11,"method":"prompts/get","params":{"name":"ghost"}})");
    EXPECT_EQ(ErrorCode(unknown), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(ErrorMessage(unknown), "Prompt not found: ghost");
}
