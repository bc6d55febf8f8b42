//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed registry of tools with discovery and dispatch
//==========================================================================================================

#pragma once

#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "hostmcp/Protocol.h"
#include "hostmcp/config/Settings.h"
#include "hostmcp/tools/Tool.h"

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class IRegistryReader;

//==========================================================================================================
// ToolRegistry
// Purpose: Thread-safe tool table. Reads (list/dispatch) take a shared lock; (un)registration is exclusive.
// Notes:
//   Registering a name that already exists replaces the previous tool and logs a warning.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void Register(std::shared_ptr<ITool> tool);
    bool Unregister(const std::string& name);

    std::shared_ptr<ITool> Find(const std::string& name) const;
    std::size_t Size() const;

    // All definitions, sorted by tool name.
    std::vector<ToolDefinition> ListDefinitions() const;

    //==========================================================================================================
    // ExecuteTool
    // Purpose: Dispatch by name through SafeExecute.
    // Returns:
    //   ToolResult; an unknown name yields Fail("Not found: Tool not found: <name>").
    //==========================================================================================================
    ToolResult ExecuteTool(const std::string& name, const JSONValue& args, std::stop_token stop = {}) const;

    //==========================================================================================================
    // CreateDefault
    // Purpose: Registry populated with the built-in filesystem, process, system, registry and clipboard tools.
    // Args:
    //   registryReader: Registry backend; nullptr selects the platform default (none off Windows).
    //==========================================================================================================
    static std::unique_ptr<ToolRegistry> CreateDefault(const config::ToolSettings& settings,
                                                       std::shared_ptr<const security::Sandbox> sandbox,
                                                       std::shared_ptr<IRegistryReader> registryReader = nullptr);

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<ITool>> tools;
};

} // namespace hostmcp::tools
