//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool table management and dispatch
//==========================================================================================================

#include <algorithm>
#include <mutex>

#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/tools/ClipboardTools.h"
#include "hostmcp/tools/FileSystemTools.h"
#include "hostmcp/tools/ProcessTools.h"
#include "hostmcp/tools/RegistryTools.h"
#include "hostmcp/tools/SystemTools.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

void ToolRegistry::Register(std::shared_ptr<ITool> tool) {
    if (!tool) {
        LOG_WARN("Ignoring registration of a null tool");
        return;
    }
    const std::string name = tool->Definition().name;
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = tools.find(name);
    if (it != tools.end()) {
        LOG_WARN("Tool '{}' already registered; replacing", name);
        it->second = std::move(tool);
        return;
    }
    tools.emplace(name, std::move(tool));
    LOG_DEBUG("Registered tool '{}'", name);
}

bool ToolRegistry::Unregister(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return tools.erase(name) > 0;
}

std::shared_ptr<ITool> ToolRegistry::Find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second;
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return tools.size();
}

std::vector<ToolDefinition> ToolRegistry::ListDefinitions() const {
    std::vector<ToolDefinition> defs;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        defs.reserve(tools.size());
        for (const auto& [name, tool] : tools) {
            defs.push_back(tool->Definition());
        }
    }
    std::sort(defs.begin(), defs.end(), [](const ToolDefinition& a, const ToolDefinition& b) { return a.name < b.name; });
    return defs;
}

ToolResult ToolRegistry::ExecuteTool(const std::string& name, const JSONValue& args, std::stop_token stop) const {
    auto tool = Find(name);
    if (!tool) {
        LOG_WARN("tools/call for unknown tool '{}'", name);
        return FailWithKind(errors::ErrorKind::ToolNotFound, "Tool not found: " + name);
    }
    LOG_DEBUG("Executing tool '{}'", name);
    return SafeExecute(*tool, args, std::move(stop));
}

std::unique_ptr<ToolRegistry> ToolRegistry::CreateDefault(const config::ToolSettings& settings,
                                                          std::shared_ptr<const security::Sandbox> sandbox,
                                                          std::shared_ptr<IRegistryReader> registryReader) {
    auto registry = std::make_unique<ToolRegistry>();
    RegisterFileSystemTools(*registry, sandbox, settings);
    RegisterProcessTools(*registry, sandbox);
    RegisterSystemTools(*registry, sandbox);
    if (!registryReader) {
        registryReader = MakePlatformRegistryReader();
    }
    RegisterRegistryTools(*registry, sandbox, registryReader);
    RegisterClipboardTools(*registry, sandbox);
    LOG_INFO("Registered {} tools", registry->Size());
    return registry;
}

} // namespace hostmcp::tools
