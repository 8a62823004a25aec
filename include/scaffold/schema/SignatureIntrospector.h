//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignatureIntrospector.h
// Purpose: Declared handler parameters -> ordered parameter set and JSON-schema "object" node
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "scaffold/JSONRPCTypes.h"
#include "scaffold/schema/TypeTag.h"

namespace scaffold {
namespace schema {

//==========================================================================================================
// ParameterDescriptor
// Purpose: One user-visible handler parameter.
// Fields:
//   name: Keyword used in the "arguments" object; unique within a handler.
//   declaredType: Semantic type used for the schema.
//   hasDefault/defaultValue: When set, the parameter is optional and binds to defaultValue.
//==========================================================================================================
struct ParameterDescriptor {
    std::string name;
    TypeTag declaredType;
    bool hasDefault{false};
    std::optional<JSONValue> defaultValue;
};

//==========================================================================================================
// IntrospectionResult
// Fields:
//   parameters: Declared parameters in declaration order.
//   schema: {"type":"object","properties":{...},"required":[...]}; absent when there are no
//           parameters. "required" lists the parameters without defaults and is omitted when empty.
//==========================================================================================================
struct IntrospectionResult {
    std::vector<ParameterDescriptor> parameters;
    std::optional<JSONValue> schema;
};

//==========================================================================================================
// Introspect
// Purpose: Validates a declared parameter list and derives its input schema.
// Args:
//   declared: Parameters in declaration order.
// Returns:
//   IntrospectionResult.
// Throws:
//   std::invalid_argument when a parameter name is empty or repeated.
//==========================================================================================================
IntrospectionResult Introspect(const std::vector<ParameterDescriptor>& declared);

} // namespace schema
} // namespace scaffold
