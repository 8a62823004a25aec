//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

// "1", "true", "TRUE", "yes" and "on" count as enabled; anything else (or unset) yields defaultValue
// only when the variable is absent.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string unset = "\x01";
    const std::string v = GetEnvOrDefault(name, unset);
    if (v == unset) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}
