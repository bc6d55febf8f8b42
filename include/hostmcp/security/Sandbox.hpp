//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Sandbox.hpp
// Purpose: File, process, registry and clipboard policy checks consulted by every privileged tool
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hostmcp/config/Settings.h"
#include "hostmcp/errors/Errors.h"
#include "hostmcp/security/PathValidator.hpp"

namespace hostmcp::security {

enum class FileOperation { Read, Write, Delete, List };
enum class ProcessOperation { List, Info, Stop, Execute, Start };
enum class RegistryOperation { Read, Write, Delete, Create };
enum class ClipboardOperation { Read, Write };

const char* FileOperationName(FileOperation op);
const char* ProcessOperationName(ProcessOperation op);
const char* RegistryOperationName(RegistryOperation op);

struct SandboxPolicy {
    bool enabled{true};
    bool allowProcessManagement{true};
    bool allowRegistryAccess{false};
    bool allowClipboardAccess{false};
    std::vector<std::string> allowedPaths;
    std::vector<std::string> blockedPaths;

    static SandboxPolicy FromSettings(const config::SecuritySettings& settings);
};

//==========================================================================================================
// Sandbox
// Purpose: Immutable policy engine. Safe to share between threads without locking.
// Notes:
//   Write/delete under the OS-protected roots is refused regardless of the configured allow list.
//   Stopping a protected process and reading sensitive registry hives are always refused.
//==========================================================================================================
class Sandbox {
public:
    explicit Sandbox(SandboxPolicy policy);

    //==========================================================================================================
    // CheckFileAccess
    // Purpose: Validate a path for the given operation.
    // Returns:
    //   The resolved path on success. With the sandbox disabled the path is only resolved.
    //==========================================================================================================
    errors::Result<std::filesystem::path> CheckFileAccess(const std::string& path, FileOperation op) const;

    //==========================================================================================================
    // PermitsEntry
    // Purpose: Per-entry filter for walks below a directory that already passed CheckFileAccess.
    // Returns:
    //   False when the entry (symlinks resolved) is blocked or outside the allowed roots. Walkers skip
    //   such entries and must not descend into them. Always true with the sandbox disabled.
    //==========================================================================================================
    bool PermitsEntry(const std::filesystem::path& entry) const;

    errors::Status CheckProcessOperation(ProcessOperation op,
                                         const std::optional<std::string>& name = std::nullopt,
                                         const std::optional<int64_t>& pid = std::nullopt) const;

    errors::Status CheckRegistryAccess(const std::string& keyPath, RegistryOperation op) const;

    errors::Status CheckClipboardAccess(ClipboardOperation op) const;

    // Case-insensitive; a trailing ".exe" is ignored.
    static bool IsProtectedProcessName(const std::string& name);
    static bool IsSensitiveRegistryKey(const std::string& keyPath);

    bool IsProtectedPath(const std::filesystem::path& resolved) const;

    const SandboxPolicy& Policy() const { return policy; }
    const PathValidator& Paths() const { return validator; }
    const std::vector<std::filesystem::path>& ProtectedRoots() const { return protectedRoots; }

private:
    SandboxPolicy policy;
    PathValidator validator;
    std::vector<std::filesystem::path> protectedRoots;
};

} // namespace hostmcp::security
