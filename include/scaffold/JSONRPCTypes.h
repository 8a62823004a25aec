//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scaffold {

struct JSONValue;

//==========================================================================================================
// OrderedObject
// Purpose: String-keyed map that preserves insertion order. Objects in this codebase are small
//          (envelopes, schemas, argument maps), so lookups are linear.
//==========================================================================================================
class OrderedObject {
public:
    using value_type = std::pair<std::string, std::shared_ptr<JSONValue>>;
    using Storage = std::vector<value_type>;
    using iterator = Storage::iterator;
    using const_iterator = Storage::const_iterator;

    OrderedObject() = default;

    iterator begin() { return items_.begin(); }
    iterator end() { return items_.end(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    iterator find(const std::string& key) {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->first == key) return it;
        }
        return items_.end();
    }

    const_iterator find(const std::string& key) const {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->first == key) return it;
        }
        return items_.end();
    }

    bool contains(const std::string& key) const { return find(key) != end(); }

    // Inserts a null slot at the end when the key is new; existing keys keep their position.
    std::shared_ptr<JSONValue>& operator[](const std::string& key) {
        auto it = find(key);
        if (it != items_.end()) return it->second;
        items_.emplace_back(key, nullptr);
        return items_.back().second;
    }

    std::size_t erase(const std::string& key) {
        auto it = find(key);
        if (it == items_.end()) return 0;
        items_.erase(it);
        return 1;
    }

private:
    Storage items_;
};

//==========================================================================================================
// JSONValue
// Purpose: Tagged JSON value used for request params, handler arguments and handler results.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: insertion-ordered map of string to shared_ptr<JSONValue>.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = OrderedObject;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

// Convenience for building object members: obj["k"] = MakeValue(x)
template <typename T>
inline std::shared_ptr<JSONValue> MakeValue(T&& v) {
    return std::make_shared<JSONValue>(std::forward<T>(v));
}

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed input; offset is the byte position of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const noexcept { return offset_; }
private:
    std::size_t offset_;
};

//==========================================================================================================
// ParseJSON / SerializeJSON
// Purpose: Strict whole-document parse and compact single-line serialization.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);
std::string SerializeJSON(const JSONValue& value);

// Member lookup that treats an absent key and an empty slot alike; returns nullptr for both.
const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Maps a parsed id member to JSONRPCId; ids of any other JSON type become null.
JSONRPCId IdFromValue(const JSONValue* idValue);
JSONValue IdToValue(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    // Single-line JSON; key order is jsonrpc, id, then result or error.
    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace scaffold
