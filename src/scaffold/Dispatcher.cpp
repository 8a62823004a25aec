//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: JSON-RPC 2.0 routing for initialize / tools / prompts and the error taxonomy
//==========================================================================================================

#include "scaffold/Dispatcher.h"

#include <variant>

#include "logging/Logger.h"
#include "scaffold/Protocol.h"
#include "scaffold/errors/Errors.h"
#include "scaffold/typed/Content.h"

namespace scaffold {

namespace net = boost::asio;

namespace {

const std::string* stringMember(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v) return nullptr;
    return std::get_if<std::string>(&v->value);
}

// Non-object params/arguments are treated as empty.
JSONValue::Object objectMember(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v) {
        if (const auto* o = std::get_if<JSONValue::Object>(&v->value)) return *o;
    }
    return JSONValue::Object{};
}

std::string idToString(const JSONRPCId& id) {
    return SerializeJSON(IdToValue(id));
}

JSONRPCResponse errorResponse(const JSONRPCId& id, int code, const std::string& message) {
    return *errors::makeErrorResponse(id, errors::makeError(code, message));
}

// Version check comes first so a malformed notification still gets an error envelope.
void validateEnvelope(const JSONValue::Object& envelope) {
    const std::string* version = stringMember(envelope, "jsonrpc");
    if (!version || *version != "2.0") {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: Not a JSON-RPC 2.0 request");
    }
    if (!stringMember(envelope, "method")) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: missing method");
    }
}

// Strings are sent verbatim; everything else as compact JSON.
std::string resultText(const JSONValue& value) {
    if (const auto* s = std::get_if<std::string>(&value.value)) return *s;
    return SerializeJSON(value);
}

// Normalizes a prompt handler's return value into a messages array.
JSONValue promptMessages(const JSONValue& ret) {
    if (const auto* s = std::get_if<std::string>(&ret.value)) {
        JSONValue::Array msgs;
        msgs.push_back(std::make_shared<JSONValue>(typed::makeUserMessage(*s)));
        return JSONValue{std::move(msgs)};
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&ret.value)) {
        bool allMessages = true;
        for (const auto& item : *arr) {
            if (!item || !typed::isMessage(*item)) { allMessages = false; break; }
        }
        if (allMessages) return ret;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&ret.value)) {
        const JSONValue* inner = FindMember(*obj, "messages");
        if (inner && inner->isArray()) return *inner;
    }
    JSONValue::Array msgs;
    msgs.push_back(std::make_shared<JSONValue>(typed::makeUserMessage(SerializeJSON(ret))));
    return JSONValue{std::move(msgs)};
}

} // namespace

class Dispatcher::Impl {
public:
    Impl(const CapabilityRegistry& registry, async::ExecutionBridge& bridge)
        : registry(registry), bridge(bridge) {}

    const CapabilityRegistry& registry;
    async::ExecutionBridge& bridge;

    JSONRPCResponse handleInitialize(const JSONRPCId& id, const JSONValue::Object& params) {
        FUNC_SCOPE();
        if (const JSONValue* clientInfo = FindMember(params, "clientInfo")) {
            LOG_INFO("Initialize from client: {}", SerializeJSON(*clientInfo));
        }
        ServerCapabilities caps;
        caps.tools = ToolsCapability{};
        caps.prompts = PromptsCapability{};

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        result["serverInfo"] = std::make_shared<JSONValue>(ToJSON(registry.ServerInfo()));
        result["capabilities"] = std::make_shared<JSONValue>(ToJSON(caps));
        result["instructions"] = std::make_shared<JSONValue>(registry.Instructions());
        return JSONRPCResponse(id, JSONValue{std::move(result)});
    }

    JSONRPCResponse handleToolsList(const JSONRPCId& id) {
        JSONValue::Array tools;
        for (const auto& t : registry.ListTools()) {
            tools.push_back(std::make_shared<JSONValue>(ToJSON(t)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(tools));
        return JSONRPCResponse(id, JSONValue{std::move(result)});
    }

    JSONRPCResponse handlePromptsList(const JSONRPCId& id) {
        JSONValue::Array prompts;
        for (const auto& p : registry.ListPrompts()) {
            prompts.push_back(std::make_shared<JSONValue>(ToJSON(p)));
        }
        JSONValue::Object result;
        result["prompts"] = std::make_shared<JSONValue>(std::move(prompts));
        return JSONRPCResponse(id, JSONValue{std::move(result)});
    }

    net::awaitable<JSONRPCResponse> handleToolsCall(JSONRPCId id, JSONValue::Object params) {
        FUNC_SCOPE();
        const std::string* name = stringMember(params, "name");
        if (!name || name->empty()) {
            co_return errorResponse(id, JSONRPCErrorCodes::InvalidParams, "Missing 'name' parameter");
        }
        const std::string toolName = *name;
        auto resolved = registry.ResolveTool(toolName);
        if (!resolved.has_value()) {
            co_return errorResponse(id, JSONRPCErrorCodes::MethodNotFound, "Tool not found: " + toolName);
        }
        const JSONValue::Object arguments = objectMember(params, "arguments");

        std::optional<JSONValue> value;
        std::string failure;
        try {
            value = co_await bridge.Invoke(*resolved->handler, arguments);
        } catch (const errors::NoResultError&) {
            failure = "Tool execution error for " + toolName;
        } catch (const std::exception& e) {
            failure = "Tool execution error for " + toolName + ": " + e.what();
        } catch (...) {
            // Non-std throws still become a -32603 for this request
            failure = "Tool execution error for " + toolName + ": unknown error";
        }
        if (!value.has_value()) {
            LOG_ERROR("{}", failure);
            co_return errorResponse(id, JSONRPCErrorCodes::InternalError, failure);
        }
        co_return JSONRPCResponse(id, typed::makeTextResult(resultText(value.value())));
    }

    net::awaitable<JSONRPCResponse> handlePromptsGet(JSONRPCId id, JSONValue::Object params) {
        FUNC_SCOPE();
        const std::string* name = stringMember(params, "name");
        if (!name || name->empty()) {
            co_return errorResponse(id, JSONRPCErrorCodes::InvalidParams, "Missing required parameter 'name'");
        }
        const std::string promptName = *name;
        auto resolved = registry.ResolvePrompt(promptName);
        if (!resolved.has_value()) {
            co_return errorResponse(id, JSONRPCErrorCodes::MethodNotFound, "Prompt not found: " + promptName);
        }
        const PromptDescriptor& descriptor = *resolved->descriptor;

        JSONValue::Object body;
        body["description"] = std::make_shared<JSONValue>(descriptor.description);
        if (!descriptor.categories.empty()) {
            JSONValue::Array cats;
            for (const auto& c : descriptor.categories) {
                cats.push_back(std::make_shared<JSONValue>(c));
            }
            body["categories"] = std::make_shared<JSONValue>(std::move(cats));
        }

        // Rendering happens only when arguments were supplied
        const JSONValue::Object arguments = objectMember(params, "arguments");
        if (arguments.empty()) {
            co_return JSONRPCResponse(id, JSONValue{std::move(body)});
        }

        std::optional<JSONValue> value;
        std::string failure;
        try {
            Arguments bound = async::ExecutionBridge::BindArguments(*resolved->handler, arguments);
            value = co_await bridge.Run(*resolved->handler, std::move(bound));
        } catch (const errors::ArgumentError& e) {
            failure = "Missing required argument '" + e.parameter() + "' for prompt " + promptName;
        } catch (const errors::NoResultError&) {
            failure = "Prompt " + promptName + " returned no result";
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "Prompt " + promptName + " failed: unknown error";
        }
        if (!value.has_value()) {
            LOG_ERROR("Prompt execution error for {}: {}", promptName, failure);
            co_return errorResponse(id, JSONRPCErrorCodes::InternalError, "Prompt execution error: " + failure);
        }
        body["messages"] = std::make_shared<JSONValue>(promptMessages(value.value()));
        co_return JSONRPCResponse(id, JSONValue{std::move(body)});
    }
};

Dispatcher::Dispatcher(const CapabilityRegistry& registry, async::ExecutionBridge& bridge)
    : pImpl(std::make_unique<Impl>(registry, bridge)) {}

Dispatcher::~Dispatcher() = default;

net::awaitable<std::optional<std::string>> Dispatcher::HandleMessage(std::string raw) {
    FUNC_SCOPE();
    JSONValue root;
    try {
        root = ParseJSON(raw);
    } catch (const JSONParseError& e) {
        LOG_ERROR("JSON decode error: {}", e.what());
        co_return errorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error").Serialize();
    }

    const auto* envelope = std::get_if<JSONValue::Object>(&root.value);
    if (!envelope) {
        co_return errorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest,
                                "Invalid Request: expected a JSON object").Serialize();
    }

    auto response = co_await HandleRequest(*envelope);
    if (!response.has_value()) {
        co_return std::nullopt;
    }
    co_return response->Serialize();
}

net::awaitable<std::optional<JSONRPCResponse>> Dispatcher::HandleRequest(const JSONValue::Object& envelope) {
    const JSONRPCId id = IdFromValue(FindMember(envelope, "id"));
    const std::string* methodPtr = stringMember(envelope, "method");
    const std::string method = methodPtr ? *methodPtr : std::string();

    LOG_INFO("Processing method: {} (id: {})", method, idToString(id));

    std::optional<JSONRPCResponse> rejected;
    try {
        validateEnvelope(envelope);
    } catch (const errors::ProtocolError& e) {
        LOG_WARN("Rejected request (id: {}): {}", idToString(id), e.what());
        rejected = errorResponse(id, e.code(), e.what());
    }
    if (rejected.has_value()) {
        co_return rejected;
    }

    const JSONValue::Object params = objectMember(envelope, "params");

    if (method == Methods::Initialize) {
        co_return pImpl->handleInitialize(id, params);
    }
    if (method == Methods::ListTools) {
        co_return pImpl->handleToolsList(id);
    }
    if (method == Methods::CallTool) {
        co_return co_await pImpl->handleToolsCall(id, params);
    }
    if (method == Methods::ListPrompts) {
        co_return pImpl->handlePromptsList(id);
    }
    if (method == Methods::GetPrompt) {
        co_return co_await pImpl->handlePromptsGet(id, params);
    }
    if (method == Methods::Initialized) {
        LOG_INFO("Host confirmed tool contract reception with 'notifications/initialized'");
        co_return std::nullopt;
    }
    // Only notifications/initialized is silent; any other unknown method is answered, id or not
    LOG_WARN("Unknown method: {} (id: {})", method, idToString(id));
    co_return errorResponse(id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method);
}

} // namespace scaffold
