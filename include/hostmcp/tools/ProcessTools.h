//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTools.h
// Purpose: list_processes, get_process_info, stop_process, execute_command
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class ToolRegistry;

struct ProcessEntry {
    int64_t pid{0};
    int64_t parentPid{0};
    std::string name;
    std::string status;
    uint64_t rssBytes{0};
    int64_t threads{0};
};

// Snapshot of running processes (Linux /proc, Windows Toolhelp). Throws ToolError(PlatformNotSupported) elsewhere.
std::vector<ProcessEntry> SnapshotProcesses();
std::optional<ProcessEntry> FindProcess(int64_t pid);

struct CommandOutput {
    int64_t pid{0};
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;
};

//==========================================================================================================
// RunCommand
// Purpose: Runs a command through the platform shell, capturing stdout/stderr.
// Notes:
//   The wait loop polls the stop token and the deadline; on either, the child is killed and
//   ToolError(Cancelled) or ToolError(Timeout) is thrown.
//==========================================================================================================
CommandOutput RunCommand(const std::string& command,
                         const std::optional<std::string>& workingDir,
                         const std::unordered_map<std::string, std::string>& extraEnv,
                         std::chrono::milliseconds timeout,
                         std::stop_token stop);

//==========================================================================================================
// StartDetached
// Purpose: Starts command in its own session with stdio on the null device and returns its pid
//          without waiting. shell=false executes the program directly (PATH lookup) with arguments
//          passed verbatim; shell=true runs "command args..." through the platform shell.
// Throws:
//   ToolError(ResourceNotFound) when the program cannot be found, ToolError(PermissionDenied) when it
//   is not executable.
//==========================================================================================================
int64_t StartDetached(const std::string& command,
                      const std::vector<std::string>& arguments,
                      bool shell,
                      const std::optional<std::string>& workingDir);

void RegisterProcessTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox);

} // namespace hostmcp::tools
