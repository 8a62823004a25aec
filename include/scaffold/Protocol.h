//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants served by the dispatcher
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace scaffold {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version reported by initialize
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

constexpr const char* DEFAULT_SERVER_VERSION = "0.1.0";
constexpr const char* DEFAULT_INSTRUCTIONS = "Base MCP server with dynamic tool discovery.";

// Handler naming convention used by the registry scan
constexpr const char* TOOL_PREFIX = "tool_";
constexpr const char* PROMPT_PREFIX = "prompt_";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = true;
};

struct PromptsCapability {
    bool listChanged = true;
    bool get = true;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<PromptsCapability> prompts;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Protocol-visible view of one tool_* handler. Built once per registry scan.
struct ToolDescriptor {
    std::string name;
    std::string description;
    bool isAsync = false;
    std::optional<JSONValue> inputSchema;  // absent when the tool takes no parameters
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
// Protocol-visible view of one prompt_* handler.
struct PromptDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema{JSONValue::Object{}};  // {} when the prompt takes no parameters
    std::vector<std::string> categories;          // lowercase, deduplicated, first-seen order
};

///////////////////////////////////////// Serialization ///////////////////////////////////////////
JSONValue ToJSON(const Implementation& impl);
JSONValue ToJSON(const ServerCapabilities& caps);
// {name, description, async, inputSchema?}
JSONValue ToJSON(const ToolDescriptor& tool);
// {name, description, inputSchema, categories}
JSONValue ToJSON(const PromptDescriptor& prompt);

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
}

} // namespace scaffold
