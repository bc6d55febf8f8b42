//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistryTools.h
// Purpose: Read-only registry tools (read_registry, list_registry_keys, search_registry)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "hostmcp/JSONRPCTypes.h"

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class ToolRegistry;

struct RegistryValue {
    std::string name;       // empty for the default value
    std::string type;       // "REG_SZ", "REG_DWORD", ...
    JSONValue data;         // strings, integers, string arrays; binary as lowercase hex
};

//==========================================================================================================
// IRegistryReader
// Purpose: Read-only view of a hierarchical key/value store addressed by "HIVE\sub\key" paths.
// Notes:
//   Implementations throw errors::ToolError: ResourceNotFound for a missing key or value,
//   PermissionDenied when access is refused, InvalidParams for an unknown hive.
//==========================================================================================================
class IRegistryReader {
public:
    virtual ~IRegistryReader() = default;
    virtual std::vector<std::string> ListSubKeys(const std::string& keyPath) = 0;
    virtual std::vector<RegistryValue> ListValues(const std::string& keyPath) = 0;
    virtual RegistryValue ReadValue(const std::string& keyPath, const std::string& valueName) = 0;
};

// Windows registry reader; nullptr on platforms without a registry.
std::shared_ptr<IRegistryReader> MakePlatformRegistryReader();

struct RegistrySearchOptions {
    std::string pattern;
    bool searchKeys{true};
    bool searchValues{true};
    bool searchData{false};
    int64_t maxResults{50};
    int64_t maxDepth{5};
};

struct RegistrySearchHit {
    std::string type;                 // "key", "value_name" or "value_data"
    std::string path;
    std::optional<std::string> name;  // value name, "(Default)" for the unnamed value
    std::optional<JSONValue> value;   // value_data hits only
};

struct RegistrySearchResult {
    std::vector<RegistrySearchHit> hits;
    bool maxReached{false};
};

//==========================================================================================================
// SearchRegistry
// Purpose: Case-insensitive substring search below root.
// Order:
//   Depth-first. At each key: matching sub-key names, then matching value names and data, then the
//   sub-keys are descended in case-insensitive lexicographic order. The walk ends as soon as maxResults
//   hits exist and never enters keys deeper than maxDepth below root. Unreadable sub-keys are skipped;
//   an unreadable root throws.
//==========================================================================================================
RegistrySearchResult SearchRegistry(IRegistryReader& reader,
                                    const std::string& root,
                                    const RegistrySearchOptions& options,
                                    const std::stop_token& stop = {});

void RegisterRegistryTools(ToolRegistry& registry,
                           std::shared_ptr<const security::Sandbox> sandbox,
                           std::shared_ptr<IRegistryReader> reader);

} // namespace hostmcp::tools
