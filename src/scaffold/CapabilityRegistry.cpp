//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Handler table -> tool/prompt descriptors
//==========================================================================================================

#include "scaffold/CapabilityRegistry.h"

#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "logging/Logger.h"
#include "scaffold/CategoryExtractor.h"
#include "scaffold/schema/SignatureIntrospector.h"

namespace scaffold {

namespace {
bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

std::string FirstDocLine(const std::string& doc) {
    std::istringstream in(doc);
    std::string line;
    while (std::getline(in, line)) {
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        auto e = line.find_last_not_of(" \t\r");
        return line.substr(b, e - b + 1);
    }
    return std::string();
}

void CapabilityRegistry::Scan(IServerInstance& instance) {
    FUNC_SCOPE();
    tools_.clear();
    prompts_.clear();
    serverInfo_ = Implementation(instance.Name(), instance.Version());
    instructions_ = instance.Instructions();

    const std::string toolPrefix = TOOL_PREFIX;
    const std::string promptPrefix = PROMPT_PREFIX;
    std::unordered_set<std::string> methodNames;

    for (auto& def : instance.Handlers()) {
        if (!methodNames.insert(def.methodName).second) {
            throw std::invalid_argument("Duplicate handler registration: " + def.methodName);
        }

        if (startsWith(def.methodName, toolPrefix)) {
            const std::string name = def.methodName.substr(toolPrefix.size());
            if (name.empty()) {
                throw std::invalid_argument("Tool handler has an empty name: " + def.methodName);
            }
            auto introspection = schema::Introspect(def.parameters);
            ToolDescriptor d;
            d.name = name;
            d.description = FirstDocLine(def.doc);
            if (d.description.empty()) {
                d.description = "Execute " + name + " tool";
            }
            d.isAsync = def.IsAsync();
            d.inputSchema = std::move(introspection.schema);
            LOG_DEBUG("Registered tool '{}' (async={})", name, d.isAsync);
            tools_.emplace(name, ToolEntry{std::move(d), std::move(def)});
        } else if (startsWith(def.methodName, promptPrefix)) {
            const std::string name = def.methodName.substr(promptPrefix.size());
            if (name.empty()) {
                throw std::invalid_argument("Prompt handler has an empty name: " + def.methodName);
            }
            auto introspection = schema::Introspect(def.parameters);
            PromptDescriptor d;
            d.name = name;
            d.description = FirstDocLine(def.doc);
            if (d.description.empty()) {
                d.description = "Prompt template " + name;
            }
            if (introspection.schema.has_value()) {
                d.inputSchema = std::move(introspection.schema.value());
            }
            d.categories = ExtractCategories(def.doc);
            LOG_DEBUG("Registered prompt '{}' ({} categories)", name, d.categories.size());
            prompts_.emplace(name, PromptEntry{std::move(d), std::move(def)});
        } else {
            LOG_DEBUG("Ignoring handler without tool_/prompt_ prefix: {}", def.methodName);
        }
    }

    LOG_INFO("Capability scan for '{}': {} tools, {} prompts", serverInfo_.name, tools_.size(), prompts_.size());
}

std::vector<ToolDescriptor> CapabilityRegistry::ListTools() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        out.push_back(entry.descriptor);
    }
    return out;
}

std::vector<PromptDescriptor> CapabilityRegistry::ListPrompts() const {
    std::vector<PromptDescriptor> out;
    out.reserve(prompts_.size());
    for (const auto& [name, entry] : prompts_) {
        out.push_back(entry.descriptor);
    }
    return out;
}

std::optional<ResolvedTool> CapabilityRegistry::ResolveTool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return ResolvedTool{&it->second.descriptor, &it->second.handler};
}

std::optional<ResolvedPrompt> CapabilityRegistry::ResolvePrompt(const std::string& name) const {
    auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        return std::nullopt;
    }
    return ResolvedPrompt{&it->second.descriptor, &it->second.handler};
}

} // namespace scaffold
