//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the hostmcp server (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace hostmcp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

// Human readable platform tag reported in serverInfo ("linux", "windows", "macos", ...).
std::string getPlatformName();

} // namespace hostmcp
