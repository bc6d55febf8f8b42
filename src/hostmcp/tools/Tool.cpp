//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tool.cpp
// Purpose: SafeExecute error classification and argument helpers
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

#include "hostmcp/tools/Tool.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;

namespace {
    const char* prefixForKind(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::PermissionDenied:
            case ErrorKind::AuthenticationRequired:
                return "Permission denied";
            case ErrorKind::ResourceNotFound:
            case ErrorKind::ToolNotFound:
                return "Not found";
            case ErrorKind::Timeout:
                return "Timeout";
            case ErrorKind::Cancelled:
                return "Cancelled";
            case ErrorKind::InvalidParams:
            case ErrorKind::InvalidRequest:
                return "Invalid parameters";
            case ErrorKind::PlatformNotSupported:
                return "Not supported";
            default:
                return "Execution error";
        }
    }

    ErrorKind kindForFilesystemError(const std::error_code& ec) {
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
            return ErrorKind::PermissionDenied;
        }
        if (ec == std::errc::no_such_file_or_directory) {
            return ErrorKind::ResourceNotFound;
        }
        return ErrorKind::ToolExecution;
    }

    // Returns an error message when an argument does not satisfy its declaration.
    std::optional<std::string> checkParameter(const ToolParameter& p, const JSONValue& value) {
        if (!MatchesParameterType(value, p.type)) {
            return "parameter '" + p.name + "' must be of type " + ParameterTypeName(p.type);
        }
        if (!p.enumValues.empty() && value.isString()) {
            const auto& s = std::get<std::string>(value.value);
            if (std::find(p.enumValues.begin(), p.enumValues.end(), s) == p.enumValues.end()) {
                return "parameter '" + p.name + "' has unsupported value '" + s + "'";
            }
        }
        return std::nullopt;
    }
}

ToolResult FailWithKind(ErrorKind kind, const std::string& message) {
    std::unordered_map<std::string, JSONValue> metadata;
    metadata["errorKind"] = JSONValue(errors::kindName(kind));
    return ToolResult::Fail(std::string(prefixForKind(kind)) + ": " + message, std::move(metadata));
}

void ThrowIfStopRequested(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw ToolError(ErrorKind::Cancelled, "Operation cancelled");
    }
}

ToolResult SafeExecute(ITool& tool, const JSONValue& args, std::stop_token stop) {
    FUNC_SCOPE();
    const ToolDefinition& def = tool.Definition();

    JSONValue::Object filled;
    if (args.isObject()) {
        filled = std::get<JSONValue::Object>(args.value);
    } else if (!args.isNull()) {
        return FailWithKind(ErrorKind::InvalidParams, "arguments must be an object");
    }

    for (const auto& p : def.parameters) {
        auto it = filled.find(p.name);
        const bool present = it != filled.end() && it->second && !it->second->isNull();
        if (!present) {
            if (p.required) {
                return FailWithKind(ErrorKind::InvalidParams, "missing required parameter '" + p.name + "'");
            }
            if (p.defaultValue.has_value()) {
                filled[p.name] = std::make_shared<JSONValue>(p.defaultValue.value());
            }
            continue;
        }
        if (auto problem = checkParameter(p, *it->second)) {
            return FailWithKind(ErrorKind::InvalidParams, problem.value());
        }
    }

    const JSONValue checkedArgs(std::move(filled));
    try {
        return tool.Execute(checkedArgs, stop);
    } catch (const ToolError& e) {
        LOG_DEBUG("Tool '{}' failed ({}): {}", def.name, errors::kindName(e.kind()), e.what());
        return FailWithKind(e.kind(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_DEBUG("Tool '{}' filesystem error: {}", def.name, e.what());
        return FailWithKind(kindForFilesystemError(e.code()), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Tool '{}' raised: {}", def.name, e.what());
        return FailWithKind(ErrorKind::ToolExecution, e.what());
    } catch (...) {
        LOG_ERROR("Tool '{}' raised a non-standard exception", def.name);
        return FailWithKind(ErrorKind::ToolExecution, "unknown failure");
    }
}

namespace args {

const JSONValue* Get(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (v == nullptr || v->isNull()) {
        return nullptr;
    }
    return v;
}

std::optional<std::string> OptString(const JSONValue& args, const std::string& key) {
    const JSONValue* v = Get(args, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->isString()) {
        throw ToolError(ErrorKind::InvalidParams, "parameter '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

std::string RequireString(const JSONValue& args, const std::string& key) {
    auto v = OptString(args, key);
    if (!v.has_value()) {
        throw ToolError(ErrorKind::InvalidParams, "missing required parameter '" + key + "'");
    }
    return v.value();
}

std::string GetString(const JSONValue& args, const std::string& key, const std::string& fallback) {
    return OptString(args, key).value_or(fallback);
}

std::optional<int64_t> OptInt(const JSONValue& args, const std::string& key) {
    const JSONValue* v = Get(args, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->isInt()) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        const double d = std::get<double>(v->value);
        if (std::isfinite(d) && std::floor(d) == d) {
            // [-2^63, 2^63) converts exactly; anything else has no int64 value
            if (d < -0x1p63 || d >= 0x1p63) {
                throw ToolError(ErrorKind::InvalidParams, "parameter '" + key + "' is out of range");
            }
            return static_cast<int64_t>(d);
        }
    }
    throw ToolError(ErrorKind::InvalidParams, "parameter '" + key + "' must be an integer");
}

int64_t GetInt(const JSONValue& args, const std::string& key, int64_t fallback) {
    return OptInt(args, key).value_or(fallback);
}

bool GetBool(const JSONValue& args, const std::string& key, bool fallback) {
    const JSONValue* v = Get(args, key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->isBool()) {
        throw ToolError(ErrorKind::InvalidParams, "parameter '" + key + "' must be a boolean");
    }
    return std::get<bool>(v->value);
}

} // namespace args

ToolParameter Param(std::string name, std::string description, ParameterType type, bool required,
                    std::optional<JSONValue> defaultValue, std::vector<std::string> enumValues) {
    ToolParameter p;
    p.name = std::move(name);
    p.description = std::move(description);
    p.type = type;
    p.required = required;
    p.defaultValue = std::move(defaultValue);
    p.enumValues = std::move(enumValues);
    return p;
}

} // namespace hostmcp::tools
