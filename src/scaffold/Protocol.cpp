//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON shapes of protocol structures returned by initialize and the list methods
//==========================================================================================================

#include "scaffold/Protocol.h"

namespace scaffold {

JSONValue ToJSON(const Implementation& impl) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(impl.name);
    obj["version"] = std::make_shared<JSONValue>(impl.version);
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(std::move(tools));
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object prompts;
        prompts["listChanged"] = std::make_shared<JSONValue>(caps.prompts->listChanged);
        prompts["get"] = std::make_shared<JSONValue>(caps.prompts->get);
        obj["prompts"] = std::make_shared<JSONValue>(std::move(prompts));
    }
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const ToolDescriptor& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["async"] = std::make_shared<JSONValue>(tool.isAsync);
    if (tool.inputSchema.has_value()) {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema.value());
    }
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const PromptDescriptor& prompt) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(prompt.name);
    obj["description"] = std::make_shared<JSONValue>(prompt.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(prompt.inputSchema);
    JSONValue::Array cats;
    for (const auto& c : prompt.categories) {
        cats.push_back(std::make_shared<JSONValue>(c));
    }
    obj["categories"] = std::make_shared<JSONValue>(std::move(cats));
    return JSONValue{std::move(obj)};
}

} // namespace scaffold
