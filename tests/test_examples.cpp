//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_examples.cpp
// Purpose: End-to-end GoogleTests driving the calculator and movie example servers through StdioServer
//==========================================================================================================

#include <gtest/gtest.h>

#include "DispatchHarness.h"
#include "calculator_server/CalculatorServer.hpp"
#include "movie_server/MovieServer.hpp"
#include "scaffold/typed/Content.h"

using namespace scaffold;
using namespace scaffold::testing;

namespace {

std::string toolCall(const std::string& name, const std::string& argumentsJson, int id = 1) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" + name +
           R"(","arguments":)" + argumentsJson + "}}";
}

// Parsed JSON carried in the first text block of a tools/call result
JSONValue toolPayload(StdioServer& server, const std::string& request) {
    auto resp = Roundtrip(server, request);
    auto text = typed::firstText(Field(resp, "result"));
    if (!text.has_value()) {
        throw std::logic_error("no text content in: " + SerializeJSON(resp));
    }
    return ParseJSON(text.value());
}

} // namespace

TEST(CalculatorExample, ListsToolsWithAsyncFlags) {
    CalculatorServer instance;
    StdioServer server(instance, QuietConfig());

    auto resp = Roundtrip(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    const auto& tools = Arr(Field(Field(resp, "result"), "tools"));
    ASSERT_EQ(tools.size(), 6u);
    EXPECT_EQ(Str(Field(*tools[0], "name")), "add");
    EXPECT_FALSE(std::get<bool>(Field(*tools[0], "async").value));
    EXPECT_EQ(Str(Field(*tools[1], "name")), "divide_async");
    EXPECT_TRUE(std::get<bool>(Field(*tools[1], "async").value));
    EXPECT_EQ(SerializeJSON(Field(*tools[0], "inputSchema")),
              R"({"type":"object","properties":{"a":{"type":"number"},"b":{"type":"number"}},"required":["a","b"]})");
}

TEST(CalculatorExample, SyncAndAsyncArithmetic) {
    CalculatorServer instance;
    StdioServer server(instance, QuietConfig());

    auto sum = toolPayload(server, toolCall("add", R"({"a":10,"b":5})"));
    EXPECT_EQ(Str(Field(sum, "operation")), "addition");
    EXPECT_EQ(Int(Field(sum, "result")), 15);
    EXPECT_FALSE(std::get<bool>(Field(sum, "async").value));

    auto product = toolPayload(server, toolCall("multiply_async", R"({"a":2.5,"b":4})"));
    EXPECT_DOUBLE_EQ(std::get<double>(Field(product, "result").value), 10.0);
    EXPECT_TRUE(std::get<bool>(Field(product, "async").value));

    auto fact = toolPayload(server, toolCall("factorial_async", R"({"n":10})"));
    EXPECT_EQ(Int(Field(fact, "result")), 3628800);
}

TEST(CalculatorExample, DomainErrorsAreResultsNotFailures) {
    CalculatorServer instance;
    StdioServer server(instance, QuietConfig());

    auto div = toolPayload(server, toolCall("divide_async", R"({"a":1,"b":0})"));
    EXPECT_EQ(Str(Field(div, "error")), "Division by zero is not allowed");

    auto fact = toolPayload(server, toolCall("factorial_async", R"({"n":21})"));
    EXPECT_EQ(Str(Field(fact, "error")), "Number too large for factorial calculation");
}

TEST(CalculatorExample, PromptRendering) {
    CalculatorServer instance;
    StdioServer server(instance, QuietConfig());

    auto meta = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":1,"method":"prompts/get","params":{"name":"calculate_product"}})");
    EXPECT_EQ(SerializeJSON(Field(Field(meta, "result"), "categories")), R"(["math","calculation"])");

    auto rendered = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":2,"method":"prompts/get","params":{"name":"calculate_product","arguments":{"a":3,"b":4}}})");
    const auto& msgs = Arr(Field(Field(rendered, "result"), "messages"));
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(Str(Field(Field(*msgs[0], "content"), "text")), "What is the product of 3 and 4?");
}

TEST(MovieExample, CatalogueAndRecommendation) {
    MovieServer instance;
    StdioServer server(instance, QuietConfig());

    auto movies = toolPayload(server, toolCall("get_movies", "{}"));
    EXPECT_EQ(Arr(Field(movies, "movies")).size(), 4u);

    auto rec = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":3,"method":"prompts/get","params":{"name":"recommend_movie","arguments":{"genre":"sci-fi"}}})");
    const auto& msgs = Arr(Field(Field(rec, "result"), "messages"));
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(Str(Field(*msgs[0], "role")), "assistant");
    EXPECT_EQ(Str(Field(Field(*msgs[1], "content"), "text")),
              "Recommend a sci-fi movie suitable for a general audience.");

    auto blank = Roundtrip(server,
        R"({"jsonrpc":"2.0","id":4,"method":"prompts/get","params":{"name":"recommend_movie","arguments":{"genre":"  "}}})");
    EXPECT_EQ(ErrorCode(blank), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(ErrorMessage(blank), "Prompt execution error: Genre cannot be empty");
}

TEST(MovieExample, ConcurrentSearchKeepsBranchOrder) {
    MovieServer instance;
    StdioServer server(instance, QuietConfig());

    auto result = toolPayload(server, toolCall("search_movies_async", R"({"query":"  DUNE "})"));
    EXPECT_EQ(Str(Field(result, "query")), "dune");
    ASSERT_EQ(Arr(Field(result, "local_matches")).size(), 1u);
    EXPECT_EQ(Str(Field(*Arr(Field(result, "external_matches"))[0], "title")), "External Movie: Dune");
    EXPECT_EQ(Str(Field(*Arr(Field(result, "recommendations"))[0], "source")), "recommendations");
    EXPECT_EQ(Int(Field(result, "total_results")), 3);
}

TEST(MovieExample, BookingRoundTrip) {
    MovieServer instance;
    StdioServer server(instance, QuietConfig());

    auto booking = toolPayload(server, toolCall("book_ticket_async",
        R"({"movie_id":3,"show_time":"16:30","num_tickets":2,"customer_email":"a@b.c"})"));
    EXPECT_EQ(Str(Field(booking, "status")), "confirmed");
    EXPECT_DOUBLE_EQ(std::get<double>(Field(booking, "total_price").value), 25.98);
    EXPECT_EQ(instance.BookingCount(), 1u);

    const std::string bookingId = Str(Field(booking, "booking_id"));
    auto fetched = toolPayload(server, toolCall("get_booking_async", R"({"booking_id":")" + bookingId + R"("})", 2));
    EXPECT_EQ(Str(Field(fetched, "movie_title")), "Dune");

    auto invalid = toolPayload(server, toolCall("book_ticket_async",
        R"({"movie_id":3,"show_time":"16:30","num_tickets":0,"customer_email":"a@b.c"})", 3));
    EXPECT_EQ(Str(Field(invalid, "error")), "Invalid booking parameters");
}
