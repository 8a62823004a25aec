//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handler.cpp
// Purpose: Typed argument accessors and IServerInstance defaults
//==========================================================================================================

#include "scaffold/Handler.h"

#include "scaffold/Protocol.h"
#include "scaffold/errors/Errors.h"
#include "scaffold/version.h"

namespace scaffold {

namespace {
[[noreturn]] void wrongType(const std::string& name, const char* expected) {
    throw errors::ArgumentError(name, "Argument '" + name + "' must be " + expected);
}
} // namespace

bool Arguments::Has(const std::string& name) const {
    return FindMember(values_, name) != nullptr;
}

const JSONValue& Arguments::Get(const std::string& name) const {
    const JSONValue* v = FindMember(values_, name);
    if (!v) {
        throw errors::ArgumentError(name, "Required parameter '" + name + "' is missing");
    }
    return *v;
}

std::string Arguments::GetString(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* s = std::get_if<std::string>(&v.value)) return *s;
    wrongType(name, "a string");
}

int64_t Arguments::GetInt(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* i = std::get_if<int64_t>(&v.value)) return *i;
    wrongType(name, "an integer");
}

double Arguments::GetNumber(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* d = std::get_if<double>(&v.value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&v.value)) return static_cast<double>(*i);
    wrongType(name, "a number");
}

bool Arguments::GetBool(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* b = std::get_if<bool>(&v.value)) return *b;
    wrongType(name, "a boolean");
}

const JSONValue::Array& Arguments::GetArray(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* a = std::get_if<JSONValue::Array>(&v.value)) return *a;
    wrongType(name, "an array");
}

const JSONValue::Object& Arguments::GetObject(const std::string& name) const {
    const JSONValue& v = Get(name);
    if (const auto* o = std::get_if<JSONValue::Object>(&v.value)) return *o;
    wrongType(name, "an object");
}

std::optional<std::string> Arguments::GetOptionalString(const std::string& name) const {
    const JSONValue* v = FindMember(values_, name);
    if (!v || v->isNull()) return std::nullopt;
    return GetString(name);
}

std::optional<int64_t> Arguments::GetOptionalInt(const std::string& name) const {
    const JSONValue* v = FindMember(values_, name);
    if (!v || v->isNull()) return std::nullopt;
    return GetInt(name);
}

std::optional<double> Arguments::GetOptionalNumber(const std::string& name) const {
    const JSONValue* v = FindMember(values_, name);
    if (!v || v->isNull()) return std::nullopt;
    return GetNumber(name);
}

std::optional<bool> Arguments::GetOptionalBool(const std::string& name) const {
    const JSONValue* v = FindMember(values_, name);
    if (!v || v->isNull()) return std::nullopt;
    return GetBool(name);
}

std::string IServerInstance::Version() const {
    return getVersionString();
}

std::string IServerInstance::Instructions() const {
    return DEFAULT_INSTRUCTIONS;
}

} // namespace scaffold
