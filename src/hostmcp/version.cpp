//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version and platform helpers reported during initialize.
//==========================================================================================================
#include "hostmcp/version.h"

#include <sstream>

namespace hostmcp {

VersionInfo getVersion() {
    auto v = VersionInfo{1, 0, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getPlatformName() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "posix";
#endif
}

} // namespace hostmcp
