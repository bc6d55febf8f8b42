//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants for the hostmcp tool server
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostmcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "hostmcp";

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Empty; presence advertises logging support
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
};

// Renders capabilities in wire form: { tools:{listChanged}, resources:{...}, prompts:{...}, logging:{} }.
JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);

///////////////////////////////////////// Tools ///////////////////////////////////////////
enum class ParameterType {
    String,
    Number,
    Boolean,
    Array,
    Object
};

const char* ParameterTypeName(ParameterType type);

// Returns true when value has the JSON type declared by a tool parameter.
bool MatchesParameterType(const JSONValue& value, ParameterType type);

//==========================================================================================================
// ToolParameter
// Purpose: One named argument of a tool, rendered as an inputSchema property.
//==========================================================================================================
struct ToolParameter {
    std::string name;
    std::string description;
    ParameterType type{ParameterType::String};
    bool required{false};
    std::optional<JSONValue> defaultValue;
    std::vector<std::string> enumValues;
};

//==========================================================================================================
// ToolDefinition
// Purpose: Immutable description of a registered tool.
// Fields:
//   name: Unique registry key.
//   category: Grouping label ("filesystem", "process", ...).
//   requiresAuth / isDestructive: Advertised as annotations in tools/list.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::string category;
    bool requiresAuth{false};
    bool isDestructive{false};
};

// JSON-Schema-shaped descriptor: { name, description, inputSchema{type,properties,required}, annotations }.
JSONValue ToolDefinitionToJSON(const ToolDefinition& def);

//==========================================================================================================
// ToolResult
// Purpose: Structured outcome of one tool execution. data is meaningful on success, error otherwise.
//==========================================================================================================
struct ToolResult {
    bool success{false};
    std::optional<JSONValue> data;
    std::optional<std::string> error;
    std::unordered_map<std::string, JSONValue> metadata;

    static ToolResult Ok(std::optional<JSONValue> data = std::nullopt,
                         std::unordered_map<std::string, JSONValue> metadata = {}) {
        ToolResult r;
        r.success = true;
        r.data = std::move(data);
        r.metadata = std::move(metadata);
        return r;
    }

    static ToolResult Fail(std::string error,
                           std::unordered_map<std::string, JSONValue> metadata = {}) {
        ToolResult r;
        r.success = false;
        r.error = std::move(error);
        r.metadata = std::move(metadata);
        return r;
    }
};

struct CallToolParams {
    std::string name;
    JSONValue arguments;
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

// { content:[{type:"text",text}], isError }
JSONValue SerializeCallToolResult(const CallToolResult& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* NotificationsInitialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Ping = "ping";
}

} // namespace hostmcp
