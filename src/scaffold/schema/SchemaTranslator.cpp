//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaTranslator.cpp
// Purpose: TypeTag -> JSON-schema fragment
//==========================================================================================================

#include "scaffold/schema/SchemaTranslator.h"

namespace scaffold {
namespace schema {

namespace {
JSONValue typeOnly(const char* name) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string(name));
    return JSONValue{std::move(obj)};
}
} // namespace

JSONValue TranslateType(const TypeTag& tag) {
    switch (tag.kind) {
        case TypeKind::Null: return typeOnly("null");
        case TypeKind::Text: return typeOnly("string");
        case TypeKind::Integer: return typeOnly("integer");
        case TypeKind::Number: return typeOnly("number");
        case TypeKind::Boolean: return typeOnly("boolean");
        case TypeKind::Mapping: return typeOnly("object");
        case TypeKind::Sequence: {
            JSONValue::Object obj;
            obj["type"] = std::make_shared<JSONValue>(std::string("array"));
            if (tag.inner) {
                obj["items"] = std::make_shared<JSONValue>(TranslateType(*tag.inner));
            }
            return JSONValue{std::move(obj)};
        }
        case TypeKind::Optional:
            // Nullability is dropped: Optional<T> advertises the same schema as T
            if (tag.inner) {
                return TranslateType(*tag.inner);
            }
            return typeOnly("string");
        case TypeKind::Unknown:
            break;
    }
    return typeOnly("string");
}

} // namespace schema
} // namespace scaffold
