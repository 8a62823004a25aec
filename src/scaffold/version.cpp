//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Library version, taken from the build's project version.
//==========================================================================================================

#include "scaffold/version.h"

#include <fmt/format.h>

// Set by the build from project(VERSION ...)
#ifndef SCAFFOLD_VERSION_MAJOR
#define SCAFFOLD_VERSION_MAJOR 0
#endif
#ifndef SCAFFOLD_VERSION_MINOR
#define SCAFFOLD_VERSION_MINOR 1
#endif
#ifndef SCAFFOLD_VERSION_PATCH
#define SCAFFOLD_VERSION_PATCH 0
#endif

namespace scaffold {

VersionInfo getVersion() {
    return VersionInfo{SCAFFOLD_VERSION_MAJOR, SCAFFOLD_VERSION_MINOR, SCAFFOLD_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace scaffold
