//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tool.h
// Purpose: Tool interface, the SafeExecute wrapper, and argument accessors for tool implementations
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

#include "hostmcp/JSONRPCTypes.h"
#include "hostmcp/Protocol.h"
#include "hostmcp/errors/Errors.h"

namespace hostmcp::tools {

//==========================================================================================================
// ITool
// Purpose: A single named operation dispatched by tools/call.
// Notes:
//   Execute receives arguments already checked and defaulted by SafeExecute. Implementations report
//   failure by returning ToolResult::Fail or by throwing (errors::ToolError for a specific category).
//   Long-running work polls the stop token and throws ToolError(Cancelled) when stop is requested.
//==========================================================================================================
class ITool {
public:
    virtual ~ITool() = default;
    virtual const ToolDefinition& Definition() const = 0;
    virtual ToolResult Execute(const JSONValue& args, std::stop_token stop) = 0;
};

// Holds the immutable definition; concrete tools populate it in their constructor.
class ToolBase : public ITool {
public:
    const ToolDefinition& Definition() const override { return definition; }

protected:
    ToolDefinition definition;
};

//==========================================================================================================
// SafeExecute
// Purpose: Uniform wrapper the registry always calls instead of ITool::Execute.
// Behavior:
//   - arguments must be an object (null counts as empty)
//   - required parameters must be present; primitive types and enum values must match the declaration
//   - declared defaults are filled in for absent parameters
//   - thrown failures become ToolResult::Fail with a category prefix ("Permission denied: ...",
//     "Not found: ...", "Timeout: ...", "Execution error: ...") and metadata.errorKind
//==========================================================================================================
ToolResult SafeExecute(ITool& tool, const JSONValue& args, std::stop_token stop = {});

// Failure result for an explicit error kind, with the same prefix SafeExecute would apply.
ToolResult FailWithKind(errors::ErrorKind kind, const std::string& message);

// Throws ToolError(Cancelled) when stop has been requested.
void ThrowIfStopRequested(const std::stop_token& stop);

namespace args {
    // Member lookup; nullptr when absent or null.
    const JSONValue* Get(const JSONValue& args, const std::string& key);

    std::string RequireString(const JSONValue& args, const std::string& key);
    std::optional<std::string> OptString(const JSONValue& args, const std::string& key);
    std::string GetString(const JSONValue& args, const std::string& key, const std::string& fallback);
    std::optional<int64_t> OptInt(const JSONValue& args, const std::string& key);
    int64_t GetInt(const JSONValue& args, const std::string& key, int64_t fallback);
    bool GetBool(const JSONValue& args, const std::string& key, bool fallback);
}

// Builds a ToolParameter inline in definitions.
ToolParameter Param(std::string name, std::string description, ParameterType type, bool required,
                    std::optional<JSONValue> defaultValue = std::nullopt,
                    std::vector<std::string> enumValues = {});

} // namespace hostmcp::tools
