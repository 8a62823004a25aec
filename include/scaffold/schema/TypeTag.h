//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TypeTag.h
// Purpose: Semantic parameter types declared by handlers, and the C++ type -> TypeTag mapping
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "scaffold/JSONRPCTypes.h"

namespace scaffold {
namespace schema {

enum class TypeKind {
    Null,
    Text,
    Integer,
    Number,
    Boolean,
    Sequence,
    Mapping,
    Optional,
    Unknown
};

//==========================================================================================================
// TypeTag
// Purpose: Declared type of one handler parameter.
// Fields:
//   kind: Semantic kind.
//   inner: Element type for Sequence (null when the element type is not declared) or the wrapped
//          type for Optional.
//==========================================================================================================
struct TypeTag {
    TypeKind kind{TypeKind::Unknown};
    std::shared_ptr<const TypeTag> inner;

    static TypeTag Null() { return TypeTag{TypeKind::Null, nullptr}; }
    static TypeTag Text() { return TypeTag{TypeKind::Text, nullptr}; }
    static TypeTag Integer() { return TypeTag{TypeKind::Integer, nullptr}; }
    static TypeTag Number() { return TypeTag{TypeKind::Number, nullptr}; }
    static TypeTag Boolean() { return TypeTag{TypeKind::Boolean, nullptr}; }
    static TypeTag Mapping() { return TypeTag{TypeKind::Mapping, nullptr}; }
    static TypeTag Unknown() { return TypeTag{TypeKind::Unknown, nullptr}; }
    static TypeTag Sequence() { return TypeTag{TypeKind::Sequence, nullptr}; }
    static TypeTag SequenceOf(TypeTag element) {
        return TypeTag{TypeKind::Sequence, std::make_shared<const TypeTag>(std::move(element))};
    }
    static TypeTag OptionalOf(TypeTag wrapped) {
        return TypeTag{TypeKind::Optional, std::make_shared<const TypeTag>(std::move(wrapped))};
    }
};

namespace detail {
template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A> struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
} // namespace detail

//==========================================================================================================
// TypeTagOf
// Purpose: Maps a C++ parameter type to its TypeTag. Types with no JSON counterpart map to Unknown.
//==========================================================================================================
template <typename T>
TypeTag TypeTagOf() {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, void> || std::is_same_v<U, std::nullptr_t>) {
        return TypeTag::Null();
    } else if constexpr (std::is_same_v<U, bool>) {
        return TypeTag::Boolean();
    } else if constexpr (std::is_integral_v<U>) {
        return TypeTag::Integer();
    } else if constexpr (std::is_floating_point_v<U>) {
        return TypeTag::Number();
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, const char*>) {
        return TypeTag::Text();
    } else if constexpr (std::is_same_v<U, JSONValue::Array>) {
        return TypeTag::Sequence();
    } else if constexpr (std::is_same_v<U, JSONValue::Object>) {
        return TypeTag::Mapping();
    } else if constexpr (detail::is_map<U>::value) {
        return TypeTag::Mapping();
    } else if constexpr (detail::is_vector<U>::value) {
        return TypeTag::SequenceOf(TypeTagOf<typename U::value_type>());
    } else if constexpr (detail::is_optional<U>::value) {
        return TypeTag::OptionalOf(TypeTagOf<typename U::value_type>());
    } else {
        return TypeTag::Unknown();
    }
}

} // namespace schema
} // namespace scaffold
