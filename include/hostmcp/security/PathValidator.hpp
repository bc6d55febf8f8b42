//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathValidator.hpp
// Purpose: Path normalization and allow/block list enforcement
//==========================================================================================================

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hostmcp/errors/Errors.h"

namespace hostmcp::security {

//==========================================================================================================
// PathValidator
// Purpose: Resolves user supplied paths and checks them against configured roots.
// Notes:
//   Roots are resolved once at construction. Blocked roots are consulted before allowed roots and
//   always win. Membership uses component-wise descent, so /etc2 is not under /etc.
//==========================================================================================================
class PathValidator {
public:
    PathValidator(const std::vector<std::string>& allowedPaths, const std::vector<std::string>& blockedPaths);

    //==========================================================================================================
    // Resolve
    // Purpose: Expands a leading ~, makes the path absolute and resolves symlinks (missing tail allowed).
    // Returns:
    //   The resolved path, or InvalidParams for an empty or unresolvable input.
    //==========================================================================================================
    static errors::Result<std::filesystem::path> Resolve(const std::string& path);

    // Resolve, after rejecting any raw input that contains "..".
    errors::Result<std::filesystem::path> Normalize(const std::string& path) const;

    bool IsAllowed(const std::filesystem::path& normalized) const;

    // Normalize + IsAllowed; PermissionDenied when the path falls outside policy.
    errors::Result<std::filesystem::path> Validate(const std::string& path) const;

    // True when path equals root or lies beneath it.
    static bool IsDescendantOf(const std::filesystem::path& path, const std::filesystem::path& root);

    const std::vector<std::filesystem::path>& AllowedRoots() const { return allowed; }
    const std::vector<std::filesystem::path>& BlockedRoots() const { return blocked; }

private:
    std::vector<std::filesystem::path> allowed;
    std::vector<std::filesystem::path> blocked;
};

} // namespace hostmcp::security
