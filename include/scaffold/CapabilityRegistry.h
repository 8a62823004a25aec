//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Startup scan of a server instance's handler table into tool and prompt descriptors
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "scaffold/Handler.h"
#include "scaffold/Protocol.h"

namespace scaffold {

// Lookup result; pointers stay valid until the next Scan().
struct ResolvedTool {
    const ToolDescriptor* descriptor{nullptr};
    const HandlerDefinition* handler{nullptr};
};

struct ResolvedPrompt {
    const PromptDescriptor* descriptor{nullptr};
    const HandlerDefinition* handler{nullptr};
};

//==========================================================================================================
// CapabilityRegistry
// Purpose: Owns the protocol-visible descriptors of one server instance.
// Notes:
//   - Descriptors are built once by Scan() and never mutated afterwards.
//   - Listing order is by name.
//==========================================================================================================
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;
    explicit CapabilityRegistry(IServerInstance& instance) { Scan(instance); }

    //==========================================================================================================
    // Scan
    // Purpose: Replaces the registry content with the handlers of the given instance.
    //   "tool_<name>"   -> ToolDescriptor   {name, description, isAsync, inputSchema?}
    //   "prompt_<name>" -> PromptDescriptor {name, description, inputSchema ({} when none), categories}
    //   Other method names are ignored.
    // Args:
    //   instance: Server instance; its Handlers() table is read once.
    // Throws:
    //   std::invalid_argument on a repeated method name, an empty name after the prefix, or an
    //   invalid parameter list.
    //==========================================================================================================
    void Scan(IServerInstance& instance);

    std::vector<ToolDescriptor> ListTools() const;
    std::vector<PromptDescriptor> ListPrompts() const;

    // Unknown names yield std::nullopt; never throws.
    std::optional<ResolvedTool> ResolveTool(const std::string& name) const;
    std::optional<ResolvedPrompt> ResolvePrompt(const std::string& name) const;

    const Implementation& ServerInfo() const { return serverInfo_; }
    const std::string& Instructions() const { return instructions_; }

    std::size_t ToolCount() const { return tools_.size(); }
    std::size_t PromptCount() const { return prompts_.size(); }

private:
    struct ToolEntry {
        ToolDescriptor descriptor;
        HandlerDefinition handler;
    };
    struct PromptEntry {
        PromptDescriptor descriptor;
        HandlerDefinition handler;
    };

    Implementation serverInfo_;
    std::string instructions_;
    std::map<std::string, ToolEntry> tools_;
    std::map<std::string, PromptEntry> prompts_;
};

// First non-blank line of a documentation block, trimmed; empty when there is none.
std::string FirstDocLine(const std::string& doc);

} // namespace scaffold
