//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting text content and prompt messages
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "scaffold/JSONRPCTypes.h"

namespace scaffold {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// {role, content:{type:"text", text}}
inline JSONValue makeMessage(const std::string& role, const std::string& text) {
    JSONValue::Object obj;
    obj["role"] = std::make_shared<JSONValue>(role);
    obj["content"] = std::make_shared<JSONValue>(makeText(text));
    return JSONValue{obj};
}

inline JSONValue makeUserMessage(const std::string& text) {
    return makeMessage("user", text);
}

// {content:[{type:"text", text}]} as returned by tools/call
inline JSONValue makeTextResult(const std::string& text) {
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(makeText(text)));
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    return JSONValue{obj};
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return false;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto itType = o.find("type");
    if (itType == o.end() || !itType->second) return false;
    if (!std::holds_alternative<std::string>(itType->second->value)) return false;
    return std::get<std::string>(itType->second->value) == std::string("text");
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find("text");
    if (it == o.end() || !it->second) return std::nullopt;
    if (!std::holds_alternative<std::string>(it->second->value)) return std::nullopt;
    return std::get<std::string>(it->second->value);
}

// An object carrying both "role" and "content"
inline bool isMessage(const JSONValue& v) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return false;
    const auto& o = std::get<JSONValue::Object>(v.value);
    return o.contains("role") && o.contains("content");
}

// Text of the first content item of a tools/call result
inline std::optional<std::string> firstText(const JSONValue& callResult) {
    if (!std::holds_alternative<JSONValue::Object>(callResult.value)) return std::nullopt;
    const auto& o = std::get<JSONValue::Object>(callResult.value);
    auto it = o.find("content");
    if (it == o.end() || !it->second) return std::nullopt;
    if (!std::holds_alternative<JSONValue::Array>(it->second->value)) return std::nullopt;
    for (const auto& item : std::get<JSONValue::Array>(it->second->value)) {
        if (!item) continue;
        auto t = getText(*item);
        if (t.has_value()) return t;
    }
    return std::nullopt;
}

} // namespace typed
} // namespace scaffold
