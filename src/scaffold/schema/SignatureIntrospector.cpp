//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignatureIntrospector.cpp
// Purpose: Builds the input schema of a handler from its declared parameters
//==========================================================================================================

#include "scaffold/schema/SignatureIntrospector.h"

#include <stdexcept>
#include <unordered_set>

#include "scaffold/schema/SchemaTranslator.h"

namespace scaffold {
namespace schema {

IntrospectionResult Introspect(const std::vector<ParameterDescriptor>& declared) {
    IntrospectionResult result;
    result.parameters = declared;
    if (declared.empty()) {
        return result;
    }

    std::unordered_set<std::string> seen;
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : declared) {
        if (p.name.empty()) {
            throw std::invalid_argument("Parameter name must not be empty");
        }
        if (!seen.insert(p.name).second) {
            throw std::invalid_argument("Duplicate parameter name: " + p.name);
        }
        properties[p.name] = std::make_shared<JSONValue>(TranslateType(p.declaredType));
        if (!p.hasDefault) {
            required.push_back(std::make_shared<JSONValue>(p.name));
        }
    }

    JSONValue::Object schemaObj;
    schemaObj["type"] = std::make_shared<JSONValue>(std::string("object"));
    schemaObj["properties"] = std::make_shared<JSONValue>(std::move(properties));
    if (!required.empty()) {
        schemaObj["required"] = std::make_shared<JSONValue>(std::move(required));
    }
    result.schema = JSONValue{std::move(schemaObj)};
    return result;
}

} // namespace schema
} // namespace scaffold
