//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the scaffold library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace scaffold {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
// Returns:
//   VersionInfo {major, minor, patch}
//==========================================================================================================
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; also the serverInfo.version reported by instances that do not override Version().
std::string getVersionString();

} // namespace scaffold
