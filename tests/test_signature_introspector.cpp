//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_signature_introspector.cpp
// Purpose: GoogleTests for parameter lists -> input schema
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>

#include "scaffold/schema/SignatureIntrospector.h"

using namespace scaffold;
using namespace scaffold::schema;

TEST(SignatureIntrospector, SingleRequiredStringParameter) {
    // Arrange: tool_echo(x: string)
    std::vector<ParameterDescriptor> params{{"x", TypeTag::Text(), false, std::nullopt}};

    // Act
    auto result = Introspect(params);

    // Assert
    ASSERT_TRUE(result.schema.has_value());
    EXPECT_EQ(SerializeJSON(result.schema.value()),
              R"({"type":"object","properties":{"x":{"type":"string"}},"required":["x"]})");
    ASSERT_EQ(result.parameters.size(), 1u);
    EXPECT_EQ(result.parameters[0].name, "x");
}

TEST(SignatureIntrospector, NoParametersMeansNoSchema) {
    auto result = Introspect({});
    EXPECT_FALSE(result.schema.has_value());
    EXPECT_TRUE(result.parameters.empty());
}

TEST(SignatureIntrospector, RequiredDependsOnDefaultNotPosition) {
    // A defaulted parameter ahead of a required one
    std::vector<ParameterDescriptor> params{
        {"limit", TypeTag::Integer(), true, JSONValue(static_cast<int64_t>(10))},
        {"query", TypeTag::Text(), false, std::nullopt},
        {"tags", TypeTag::SequenceOf(TypeTag::Text()), true, JSONValue(JSONValue::Array{})},
    };

    auto result = Introspect(params);

    ASSERT_TRUE(result.schema.has_value());
    EXPECT_EQ(SerializeJSON(result.schema.value()),
              R"({"type":"object","properties":{"limit":{"type":"integer"},"query":{"type":"string"},)"
              R"("tags":{"type":"array","items":{"type":"string"}}},"required":["query"]})");
}

TEST(SignatureIntrospector, AllDefaultedOmitsRequired) {
    std::vector<ParameterDescriptor> params{{"verbose", TypeTag::Boolean(), true, JSONValue(false)}};
    auto result = Introspect(params);
    ASSERT_TRUE(result.schema.has_value());
    const auto& obj = std::get<JSONValue::Object>(result.schema->value);
    EXPECT_FALSE(obj.contains("required"));
    EXPECT_TRUE(obj.contains("properties"));
}

TEST(SignatureIntrospector, UnknownTypeDegradesToString) {
    std::vector<ParameterDescriptor> params{{"blob", TypeTag::Unknown(), false, std::nullopt}};
    auto result = Introspect(params);
    EXPECT_EQ(SerializeJSON(result.schema.value()),
              R"({"type":"object","properties":{"blob":{"type":"string"}},"required":["blob"]})");
}

TEST(SignatureIntrospector, DuplicateOrEmptyNamesRejected) {
    std::vector<ParameterDescriptor> dup{
        {"a", TypeTag::Number(), false, std::nullopt},
        {"a", TypeTag::Number(), false, std::nullopt},
    };
    EXPECT_THROW(Introspect(dup), std::invalid_argument);

    std::vector<ParameterDescriptor> empty{{"", TypeTag::Number(), false, std::nullopt}};
    EXPECT_THROW(Introspect(empty), std::invalid_argument);
}
