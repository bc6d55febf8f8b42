//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hostmcp/security/PathValidator.cpp
// Purpose: Path normalization and allow/block list enforcement
//==========================================================================================================

#include <cctype>
#include <cstdlib>
#include <system_error>
#ifdef _WIN32
#include <cwctype>
#endif

#include "hostmcp/security/PathValidator.hpp"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace hostmcp::security {

namespace {
    static std::string homeDirectory() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? std::string(home) : std::string();
    }

    static std::string expandUser(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }
        if (path.size() > 1 && path[1] != '/' && path[1] != '\\') {
            // ~otheruser is not expanded
            return path;
        }
        const std::string home = homeDirectory();
        if (home.empty()) {
            return path;
        }
        return home + path.substr(1);
    }

    static fs::path stripTrailingSeparator(fs::path p) {
        while (p.has_relative_path() && p.filename().empty()) {
            p = p.parent_path();
        }
        return p;
    }

    static bool componentEqual(const fs::path& a, const fs::path& b) {
#ifdef _WIN32
        const auto sa = a.native();
        const auto sb = b.native();
        if (sa.size() != sb.size()) return false;
        for (size_t i = 0; i < sa.size(); ++i) {
            if (std::towlower(sa[i]) != std::towlower(sb[i])) return false;
        }
        return true;
#else
        return a == b;
#endif
    }
}

PathValidator::PathValidator(const std::vector<std::string>& allowedPaths, const std::vector<std::string>& blockedPaths) {
    for (const auto& p : allowedPaths) {
        auto r = Resolve(p);
        if (!r.ok()) {
            LOG_WARN("Ignoring allowed path '{}': {}", p, r.error().message);
            continue;
        }
        allowed.push_back(r.value());
    }
    for (const auto& p : blockedPaths) {
        auto r = Resolve(p);
        if (!r.ok()) {
            LOG_WARN("Ignoring blocked path '{}': {}", p, r.error().message);
            continue;
        }
        blocked.push_back(r.value());
    }
    LOG_DEBUG("PathValidator: {} allowed root(s), {} blocked root(s)", allowed.size(), blocked.size());
}

errors::Result<fs::path> PathValidator::Resolve(const std::string& path) {
    using errors::ErrorKind;
    if (path.empty()) {
        return errors::makeError(ErrorKind::InvalidParams, "Path must not be empty");
    }
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(expandUser(path)), ec);
    if (ec) {
        return errors::makeError(ErrorKind::InvalidParams, "Cannot resolve path: " + path);
    }
    fs::path resolved = fs::weakly_canonical(p, ec);
    if (ec) {
        resolved = p.lexically_normal();
    }
    return stripTrailingSeparator(resolved);
}

errors::Result<fs::path> PathValidator::Normalize(const std::string& path) const {
    if (path.find("..") != std::string::npos) {
        LOG_WARN("Path traversal attempt rejected: {}", path);
        return errors::makeError(errors::ErrorKind::PermissionDenied, "Path traversal detected: " + path);
    }
    return Resolve(path);
}

bool PathValidator::IsDescendantOf(const fs::path& path, const fs::path& root) {
    const fs::path p = stripTrailingSeparator(path);
    const fs::path r = stripTrailingSeparator(root);
    auto pi = p.begin();
    for (auto ri = r.begin(); ri != r.end(); ++ri, ++pi) {
        if (pi == p.end() || !componentEqual(*pi, *ri)) {
            return false;
        }
    }
    return true;
}

bool PathValidator::IsAllowed(const fs::path& normalized) const {
    for (const auto& b : blocked) {
        if (IsDescendantOf(normalized, b)) {
            return false;
        }
    }
    if (allowed.empty()) {
        return true;
    }
    for (const auto& a : allowed) {
        if (IsDescendantOf(normalized, a)) {
            return true;
        }
    }
    return false;
}

errors::Result<fs::path> PathValidator::Validate(const std::string& path) const {
    auto normalized = Normalize(path);
    if (!normalized.ok()) {
        return normalized;
    }
    if (!IsAllowed(normalized.value())) {
        LOG_WARN("Access denied by path policy: {}", normalized.value().string());
        return errors::makeError(errors::ErrorKind::PermissionDenied, "Access denied: " + path);
    }
    return normalized;
}

} // namespace hostmcp::security
