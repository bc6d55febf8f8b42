//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error kinds, typed errors, and Result<T> returns shared by the security gate and protocol layer
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "hostmcp/JSONRPCTypes.h"

namespace hostmcp {
namespace errors {

// Every failure class the server can report. Each kind maps to exactly one JSON-RPC code.
enum class ErrorKind {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Internal,
    ToolNotFound,
    ToolExecution,
    AuthenticationRequired,
    PermissionDenied,
    ResourceNotFound,
    RateLimited,
    Timeout,
    Cancelled,
    PlatformNotSupported
};

namespace detail {
struct KindEntry {
    ErrorKind kind;
    int code;
    const char* name;
};

inline constexpr KindEntry kKindTable[] = {
    {ErrorKind::ParseError, JSONRPCErrorCodes::ParseError, "ParseError"},
    {ErrorKind::InvalidRequest, JSONRPCErrorCodes::InvalidRequest, "InvalidRequest"},
    {ErrorKind::MethodNotFound, JSONRPCErrorCodes::MethodNotFound, "MethodNotFound"},
    {ErrorKind::InvalidParams, JSONRPCErrorCodes::InvalidParams, "InvalidParams"},
    {ErrorKind::Internal, JSONRPCErrorCodes::InternalError, "InternalError"},
    {ErrorKind::ToolNotFound, JSONRPCErrorCodes::ToolNotFound, "ToolNotFound"},
    {ErrorKind::ToolExecution, JSONRPCErrorCodes::ToolExecutionError, "ToolExecutionError"},
    {ErrorKind::AuthenticationRequired, JSONRPCErrorCodes::AuthenticationRequired, "AuthenticationRequired"},
    {ErrorKind::PermissionDenied, JSONRPCErrorCodes::PermissionDenied, "PermissionDenied"},
    {ErrorKind::ResourceNotFound, JSONRPCErrorCodes::ResourceNotFound, "ResourceNotFound"},
    {ErrorKind::RateLimited, JSONRPCErrorCodes::RateLimited, "RateLimited"},
    {ErrorKind::Timeout, JSONRPCErrorCodes::Timeout, "Timeout"},
    {ErrorKind::Cancelled, JSONRPCErrorCodes::Cancelled, "Cancelled"},
    {ErrorKind::PlatformNotSupported, JSONRPCErrorCodes::PlatformNotSupported, "PlatformNotSupported"},
};
} // namespace detail

// Map an ErrorKind to its fixed JSON-RPC error code.
inline constexpr int codeForKind(ErrorKind kind) {
    for (const auto& e : detail::kKindTable) {
        if (e.kind == kind) return e.code;
    }
    return JSONRPCErrorCodes::InternalError;
}

// Map a numeric code back to its kind. Unknown codes classify as Internal.
inline constexpr ErrorKind kindFromCode(int code) {
    for (const auto& e : detail::kKindTable) {
        if (e.code == code) return e.kind;
    }
    return ErrorKind::Internal;
}

inline constexpr const char* kindName(ErrorKind kind) {
    for (const auto& e : detail::kKindTable) {
        if (e.kind == kind) return e.name;
    }
    return "InternalError";
}

//==========================================================================================================
// McpError
// Purpose: Typed error carried through Result<T> and rendered as a JSON-RPC error object.
// Fields:
//   code: JSON-RPC code (always codeForKind(kind) when built through makeError).
//   message: Human readable message returned to the caller.
//   data: Optional structured detail (e.g. { retryAfter }).
//   kind: Failure class.
//==========================================================================================================
struct McpError {
    int code{JSONRPCErrorCodes::InternalError};
    std::string message;
    std::optional<JSONValue> data;
    ErrorKind kind{ErrorKind::Internal};
};

inline McpError makeError(ErrorKind kind, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = codeForKind(kind);
    e.message = std::move(message);
    e.data = std::move(data);
    e.kind = kind;
    return e;
}

//==========================================================================================================
// Result<T>
// Purpose: Value-or-error return used at every security gate boundary instead of exceptions.
//==========================================================================================================
template <typename T>
class Result {
public:
    Result(T value) : state(std::move(value)) {}
    Result(McpError error) : state(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state); }
    const T& value() const { return std::get<T>(state); }
    const McpError& error() const { return std::get<McpError>(state); }

private:
    std::variant<T, McpError> state;
};

using Status = Result<std::monostate>;

inline Status okStatus() { return Status(std::monostate{}); }

//==========================================================================================================
// ToolError
// Purpose: Exception thrown from inside tool implementations; SafeExecute turns it into ToolResult::Fail.
//==========================================================================================================
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    explicit ToolError(const McpError& err)
        : std::runtime_error(err.message), kind_(err.kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Unwraps a Result or throws its error as ToolError. For use inside tool bodies only.
template <typename T>
T valueOrThrow(Result<T> r) {
    if (!r.ok()) {
        throw ToolError(r.error());
    }
    return std::move(r.value());
}

inline void throwIfError(const Status& s) {
    if (!s.ok()) {
        throw ToolError(s.error());
    }
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace hostmcp
