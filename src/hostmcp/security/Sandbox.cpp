//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hostmcp/security/Sandbox.cpp
// Purpose: Sandbox policy checks (file, process, registry, clipboard)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "hostmcp/security/Sandbox.hpp"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace hostmcp::security {

namespace {
    const char* const kProtectedProcesses[] = {
        "system", "smss", "csrss", "wininit", "winlogon", "services",
        "lsass", "svchost", "init", "systemd", "kthreadd"
    };

    const char* const kSensitiveRegistryPrefixes[] = {
        "HKEY_LOCAL_MACHINE\\SAM",
        "HKLM\\SAM",
        "HKEY_LOCAL_MACHINE\\SECURITY",
        "HKLM\\SECURITY",
        "HKEY_LOCAL_MACHINE\\SYSTEM\\CURRENTCONTROLSET\\CONTROL\\LSA",
        "HKLM\\SYSTEM\\CURRENTCONTROLSET\\CONTROL\\LSA"
    };

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static int64_t currentPid() {
#ifdef _WIN32
        return static_cast<int64_t>(::GetCurrentProcessId());
#else
        return static_cast<int64_t>(::getpid());
#endif
    }

    static std::vector<std::string> protectedRootCandidates() {
#ifdef _WIN32
        std::vector<std::string> roots;
        for (const char* var : {"SystemRoot", "ProgramFiles", "ProgramFiles(x86)"}) {
            const char* v = std::getenv(var);
            if (v && *v) roots.emplace_back(v);
        }
        if (roots.empty()) {
            roots = {"C:\\Windows", "C:\\Program Files", "C:\\Program Files (x86)"};
        }
        return roots;
#else
        return {"/bin", "/boot", "/dev", "/etc", "/lib", "/lib32", "/lib64", "/proc", "/sbin", "/sys", "/usr"};
#endif
    }

    static errors::McpError denied(const std::string& message) {
        LOG_WARN("Sandbox denied: {}", message);
        return errors::makeError(errors::ErrorKind::PermissionDenied, message);
    }
}

const char* FileOperationName(FileOperation op) {
    switch (op) {
        case FileOperation::Read: return "read";
        case FileOperation::Write: return "write";
        case FileOperation::Delete: return "delete";
        case FileOperation::List: return "list";
    }
    return "read";
}

const char* ProcessOperationName(ProcessOperation op) {
    switch (op) {
        case ProcessOperation::List: return "list";
        case ProcessOperation::Info: return "info";
        case ProcessOperation::Stop: return "stop";
        case ProcessOperation::Execute: return "execute";
        case ProcessOperation::Start: return "start";
    }
    return "list";
}

const char* RegistryOperationName(RegistryOperation op) {
    switch (op) {
        case RegistryOperation::Read: return "read";
        case RegistryOperation::Write: return "write";
        case RegistryOperation::Delete: return "delete";
        case RegistryOperation::Create: return "create";
    }
    return "read";
}

SandboxPolicy SandboxPolicy::FromSettings(const config::SecuritySettings& settings) {
    SandboxPolicy p;
    p.enabled = settings.sandboxEnabled;
    p.allowProcessManagement = settings.allowProcessManagement;
    p.allowRegistryAccess = settings.allowRegistryAccess;
    p.allowClipboardAccess = settings.allowClipboardAccess;
    p.allowedPaths = settings.allowedPaths;
    p.blockedPaths = settings.blockedPaths;
    return p;
}

Sandbox::Sandbox(SandboxPolicy policyIn)
    : policy(std::move(policyIn)), validator(policy.allowedPaths, policy.blockedPaths) {
    for (const auto& root : protectedRootCandidates()) {
        fs::path raw = fs::path(root).lexically_normal();
        protectedRoots.push_back(raw);
        auto resolved = PathValidator::Resolve(root);
        if (resolved.ok() && resolved.value() != raw) {
            protectedRoots.push_back(resolved.value());
        }
    }
    LOG_INFO("Sandbox {}: process={}, registry={}, clipboard={}",
             policy.enabled ? "enabled" : "disabled",
             policy.allowProcessManagement, policy.allowRegistryAccess, policy.allowClipboardAccess);
}

bool Sandbox::IsProtectedPath(const fs::path& resolved) const {
    for (const auto& root : protectedRoots) {
        if (PathValidator::IsDescendantOf(resolved, root)) {
            return true;
        }
    }
    return false;
}

errors::Result<fs::path> Sandbox::CheckFileAccess(const std::string& path, FileOperation op) const {
    if (!policy.enabled) {
        return PathValidator::Resolve(path);
    }
    auto validated = validator.Validate(path);
    if (!validated.ok()) {
        return validated;
    }
    if ((op == FileOperation::Write || op == FileOperation::Delete) && IsProtectedPath(validated.value())) {
        return denied(std::string("Cannot ") + FileOperationName(op) + " protected system path: " + path);
    }
    return validated;
}

bool Sandbox::PermitsEntry(const fs::path& entry) const {
    if (!policy.enabled) {
        return true;
    }
    auto resolved = PathValidator::Resolve(entry.string());
    if (!resolved.ok()) {
        return false;
    }
    return validator.IsAllowed(resolved.value());
}

errors::Status Sandbox::CheckProcessOperation(ProcessOperation op,
                                              const std::optional<std::string>& name,
                                              const std::optional<int64_t>& pid) const {
    if (!policy.allowProcessManagement) {
        return denied("Process management is disabled");
    }
    if (op != ProcessOperation::Stop) {
        return errors::okStatus();
    }
    if (name.has_value() && IsProtectedProcessName(name.value())) {
        return denied("Cannot stop protected process: " + name.value());
    }
    if (pid.has_value()) {
        const int64_t p = pid.value();
        if (p == 0 || p == 1 || p == currentPid()) {
            return denied("Cannot stop protected process id: " + std::to_string(p));
        }
    }
    return errors::okStatus();
}

errors::Status Sandbox::CheckRegistryAccess(const std::string& keyPath, RegistryOperation op) const {
    if (!policy.allowRegistryAccess) {
        return denied("Registry access is disabled");
    }
    if (op != RegistryOperation::Read) {
        return denied(std::string("Registry ") + RegistryOperationName(op) + " operations are not permitted");
    }
    if (IsSensitiveRegistryKey(keyPath)) {
        return denied("Access to sensitive registry key denied: " + keyPath);
    }
    return errors::okStatus();
}

errors::Status Sandbox::CheckClipboardAccess(ClipboardOperation op) const {
    if (!policy.allowClipboardAccess) {
        return denied(std::string("Clipboard ") + (op == ClipboardOperation::Read ? "read" : "write") + " access is disabled");
    }
    return errors::okStatus();
}

bool Sandbox::IsProtectedProcessName(const std::string& name) {
    std::string n = toLower(name);
    if (n.size() > 4 && n.compare(n.size() - 4, 4, ".exe") == 0) {
        n.resize(n.size() - 4);
    }
    for (const char* p : kProtectedProcesses) {
        if (n == p) {
            return true;
        }
    }
    return false;
}

bool Sandbox::IsSensitiveRegistryKey(const std::string& keyPath) {
    std::string k;
    k.reserve(keyPath.size());
    for (char c : keyPath) {
        k.push_back(c == '/' ? '\\' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    for (const char* prefix : kSensitiveRegistryPrefixes) {
        if (k.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace hostmcp::security
