//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types for the hostmcp server
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hostmcp {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isInt() const { return std::holds_alternative<int64_t>(value); }
    bool isNumber() const { return isInt() || std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    // Returns the member value for key, or nullptr when this is not an object or the key is absent.
    const JSONValue* find(const std::string& key) const;
};

// Shorthand for building object members. Integral arguments must already be int64_t.
template <typename T>
inline std::shared_ptr<JSONValue> MakeJSON(T&& v) { return std::make_shared<JSONValue>(std::forward<T>(v)); }

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed documents; offset points at the offending byte.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& message, std::size_t offset)
        : std::runtime_error(message + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses one complete JSON document (surrounding whitespace allowed, nothing else).
// Throws:
//   JSONParseError on any grammar violation, trailing content, or nesting deeper than the cap.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

// Compact serialization (no insignificant whitespace).
std::string SerializeJSON(const JSONValue& value);

// Indented serialization with object keys sorted, for human-facing text.
std::string SerializeJSONPretty(const JSONValue& value, int indent = 2);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

JSONValue IdToJSON(const JSONRPCId& id);
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCRequest
// Purpose: Validated JSON-RPC 2.0 request. A null id marks a notification.
// Fields:
//   params: Always an object when present; positional params are re-keyed "0", "1", ...
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    bool IsNotification() const { return std::holds_alternative<std::nullptr_t>(id); }
    std::string Serialize() const;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response; exactly one of result/error is present.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    bool IsError() const { return error.has_value(); }
    JSONValue ToJSON() const;
    std::string Serialize() const;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the server-specific -320xx range. Closed set.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int ToolNotFound = -32001;
    constexpr int ToolExecutionError = -32002;
    constexpr int AuthenticationRequired = -32003;
    constexpr int PermissionDenied = -32004;
    constexpr int ResourceNotFound = -32005;
    constexpr int RateLimited = -32006;
    constexpr int Timeout = -32007;
    constexpr int Cancelled = -32008;
    constexpr int PlatformNotSupported = -32009;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace hostmcp
