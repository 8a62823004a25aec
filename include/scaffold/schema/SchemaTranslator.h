//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaTranslator.h
// Purpose: Translation of declared parameter types into JSON-schema fragments
//==========================================================================================================

#pragma once

#include "scaffold/JSONRPCTypes.h"
#include "scaffold/schema/TypeTag.h"

namespace scaffold {
namespace schema {

//==========================================================================================================
// TranslateType
// Purpose: Total mapping TypeTag -> JSON-schema fragment.
//   Null -> {"type":"null"}, Text -> string, Integer -> integer, Number -> number, Boolean -> boolean,
//   Sequence -> {"type":"array"} plus "items" when the element type is declared, Mapping -> object,
//   Optional<T> -> TranslateType(T) (no nullable marker), Unknown -> {"type":"string"}.
// Returns:
//   JSONValue Object; never throws.
//==========================================================================================================
JSONValue TranslateType(const TypeTag& tag);

} // namespace schema
} // namespace scaffold
