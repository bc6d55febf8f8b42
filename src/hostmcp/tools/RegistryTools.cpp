//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistryTools.cpp
// Purpose: Registry reader, recursive search, and the read-only registry tools
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/RegistryTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;
using security::RegistryOperation;

namespace {

constexpr const char* kDefaultValueName = "(Default)";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string displayName(const std::string& name) {
    return name.empty() ? std::string(kDefaultValueName) : name;
}

std::string joinKey(const std::string& parent, const std::string& child) {
    if (parent.empty()) return child;
    if (parent.back() == '\\') return parent + child;
    return parent + "\\" + child;
}

// Text form of value data for substring search
std::string dataText(const JSONValue& data) {
    if (data.isString()) return std::get<std::string>(data.value);
    return SerializeJSON(data);
}

JSONValue valueToJSON(const RegistryValue& v) {
    JSONValue::Object obj;
    obj["name"] = MakeJSON(displayName(v.name));
    obj["value"] = MakeJSON(v.data);
    obj["type"] = MakeJSON(v.type);
    return JSONValue(std::move(obj));
}

#ifdef _WIN32

std::wstring widen(const std::string& s) {
    if (s.empty()) return std::wstring();
    int len = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<std::size_t>(len), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len);
    return out;
}

std::string narrow(const wchar_t* w, std::size_t n) {
    if (n == 0) return std::string();
    int len = ::WideCharToMultiByte(CP_UTF8, 0, w, static_cast<int>(n), nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(len), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, w, static_cast<int>(n), out.data(), len, nullptr, nullptr);
    return out;
}

const char* typeName(DWORD type) {
    switch (type) {
        case REG_SZ: return "REG_SZ";
        case REG_EXPAND_SZ: return "REG_EXPAND_SZ";
        case REG_BINARY: return "REG_BINARY";
        case REG_DWORD: return "REG_DWORD";
        case REG_DWORD_BIG_ENDIAN: return "REG_DWORD_BIG_ENDIAN";
        case REG_LINK: return "REG_LINK";
        case REG_MULTI_SZ: return "REG_MULTI_SZ";
        case REG_QWORD: return "REG_QWORD";
        case REG_NONE: return "REG_NONE";
        default: return nullptr;
    }
}

JSONValue decodeData(DWORD type, const std::vector<BYTE>& buf, DWORD size) {
    switch (type) {
        case REG_SZ:
        case REG_EXPAND_SZ: {
            const auto* w = reinterpret_cast<const wchar_t*>(buf.data());
            std::size_t n = size / sizeof(wchar_t);
            while (n > 0 && w[n - 1] == L'\0') --n;
            return JSONValue(narrow(w, n));
        }
        case REG_MULTI_SZ: {
            JSONValue::Array arr;
            const auto* w = reinterpret_cast<const wchar_t*>(buf.data());
            const std::size_t n = size / sizeof(wchar_t);
            std::size_t start = 0;
            for (std::size_t i = 0; i < n; ++i) {
                if (w[i] == L'\0') {
                    if (i > start) arr.push_back(MakeJSON(narrow(w + start, i - start)));
                    start = i + 1;
                }
            }
            return JSONValue(std::move(arr));
        }
        case REG_DWORD:
            if (size >= sizeof(DWORD)) {
                DWORD v = 0;
                std::memcpy(&v, buf.data(), sizeof(v));
                return JSONValue(static_cast<int64_t>(v));
            }
            break;
        case REG_QWORD:
            if (size >= sizeof(uint64_t)) {
                uint64_t v = 0;
                std::memcpy(&v, buf.data(), sizeof(v));
                return JSONValue(static_cast<int64_t>(v));
            }
            break;
        default:
            break;
    }
    std::string hex;
    hex.reserve(size * 2);
    for (DWORD i = 0; i < size; ++i) hex += std::format("{:02x}", buf[i]);
    return JSONValue(std::move(hex));
}

[[noreturn]] void throwRegistryError(LONG rc, const std::string& what) {
    if (rc == ERROR_FILE_NOT_FOUND || rc == ERROR_PATH_NOT_FOUND) {
        throw ToolError(ErrorKind::ResourceNotFound, "Registry key or value not found: " + what);
    }
    if (rc == ERROR_ACCESS_DENIED) {
        throw ToolError(ErrorKind::PermissionDenied, "Access denied to registry key: " + what);
    }
    throw ToolError(ErrorKind::ToolExecution, std::format("Registry error {} for {}", rc, what));
}

class WindowsRegistryReader : public IRegistryReader {
public:
    std::vector<std::string> ListSubKeys(const std::string& keyPath) override {
        Key key = open(keyPath);
        std::vector<std::string> out;
        wchar_t name[256];
        for (DWORD i = 0;; ++i) {
            DWORD len = 256;
            LONG rc = ::RegEnumKeyExW(key.h, i, name, &len, nullptr, nullptr, nullptr, nullptr);
            if (rc == ERROR_NO_MORE_ITEMS) break;
            if (rc != ERROR_SUCCESS) throwRegistryError(rc, keyPath);
            out.push_back(narrow(name, len));
        }
        return out;
    }

    std::vector<RegistryValue> ListValues(const std::string& keyPath) override {
        Key key = open(keyPath);
        DWORD maxName = 0, maxData = 0;
        ::RegQueryInfoKeyW(key.h, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
                           &maxName, &maxData, nullptr, nullptr);
        std::vector<RegistryValue> out;
        std::vector<wchar_t> name(maxName + 2);
        std::vector<BYTE> data(maxData + 2);
        for (DWORD i = 0;; ++i) {
            DWORD nameLen = static_cast<DWORD>(name.size());
            DWORD dataLen = static_cast<DWORD>(data.size());
            DWORD type = 0;
            LONG rc = ::RegEnumValueW(key.h, i, name.data(), &nameLen, nullptr, &type, data.data(), &dataLen);
            if (rc == ERROR_NO_MORE_ITEMS) break;
            if (rc != ERROR_SUCCESS) throwRegistryError(rc, keyPath);
            RegistryValue v;
            v.name = narrow(name.data(), nameLen);
            const char* tn = typeName(type);
            v.type = tn ? tn : std::format("UNKNOWN({})", type);
            v.data = decodeData(type, data, dataLen);
            out.push_back(std::move(v));
        }
        return out;
    }

    RegistryValue ReadValue(const std::string& keyPath, const std::string& valueName) override {
        Key key = open(keyPath);
        const std::wstring wname = widen(valueName);
        DWORD type = 0;
        DWORD size = 0;
        LONG rc = ::RegQueryValueExW(key.h, wname.c_str(), nullptr, &type, nullptr, &size);
        if (rc != ERROR_SUCCESS) throwRegistryError(rc, keyPath + "\\" + valueName);
        std::vector<BYTE> data(size + 2);
        rc = ::RegQueryValueExW(key.h, wname.c_str(), nullptr, &type, data.data(), &size);
        if (rc != ERROR_SUCCESS) throwRegistryError(rc, keyPath + "\\" + valueName);
        RegistryValue v;
        v.name = valueName;
        const char* tn = typeName(type);
        v.type = tn ? tn : std::format("UNKNOWN({})", type);
        v.data = decodeData(type, data, size);
        return v;
    }

private:
    struct Key {
        HKEY h{nullptr};
        Key() = default;
        Key(const Key&) = delete;
        Key& operator=(const Key&) = delete;
        Key(Key&& o) noexcept : h(o.h) { o.h = nullptr; }
        ~Key() { if (h) ::RegCloseKey(h); }
    };

    static Key open(const std::string& keyPath) {
        std::string path = keyPath;
        std::replace(path.begin(), path.end(), '/', '\\');
        const auto sep = path.find('\\');
        std::string hiveName = path.substr(0, sep);
        std::transform(hiveName.begin(), hiveName.end(), hiveName.begin(),
                       [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        const std::string sub = sep == std::string::npos ? std::string() : path.substr(sep + 1);

        HKEY hive = nullptr;
        if (hiveName == "HKEY_CLASSES_ROOT" || hiveName == "HKCR") hive = HKEY_CLASSES_ROOT;
        else if (hiveName == "HKEY_CURRENT_USER" || hiveName == "HKCU") hive = HKEY_CURRENT_USER;
        else if (hiveName == "HKEY_LOCAL_MACHINE" || hiveName == "HKLM") hive = HKEY_LOCAL_MACHINE;
        else if (hiveName == "HKEY_USERS" || hiveName == "HKU") hive = HKEY_USERS;
        else if (hiveName == "HKEY_CURRENT_CONFIG" || hiveName == "HKCC") hive = HKEY_CURRENT_CONFIG;
        else throw ToolError(ErrorKind::InvalidParams, "Unknown registry hive: " + hiveName);

        Key key;
        const std::wstring wsub = widen(sub);
        LONG rc = ::RegOpenKeyExW(hive, wsub.c_str(), 0, KEY_READ, &key.h);
        if (rc != ERROR_SUCCESS) throwRegistryError(rc, keyPath);
        return key;
    }
};

#endif

struct SearchState {
    IRegistryReader& reader;
    const RegistrySearchOptions& options;
    const std::string needle;
    const std::stop_token& stop;
    RegistrySearchResult result;

    bool full() const { return static_cast<int64_t>(result.hits.size()) >= options.maxResults; }

    void add(RegistrySearchHit hit) {
        if (!full()) result.hits.push_back(std::move(hit));
    }

    bool matches(const std::string& text) const { return toLower(text).find(needle) != std::string::npos; }

    void visit(const std::string& path, int64_t depth, bool isRoot) {
        if (full() || depth > options.maxDepth) return;
        ThrowIfStopRequested(stop);

        std::vector<std::string> subKeys;
        std::vector<RegistryValue> values;
        try {
            subKeys = reader.ListSubKeys(path);
            if (options.searchValues || options.searchData) {
                values = reader.ListValues(path);
            }
        } catch (const ToolError& e) {
            if (isRoot) throw;
            LOG_DEBUG("search_registry: skipping {}: {}", path, e.what());
            return;
        }
        std::sort(subKeys.begin(), subKeys.end(),
                  [](const std::string& a, const std::string& b) { return toLower(a) < toLower(b); });

        if (options.searchKeys) {
            for (const auto& sk : subKeys) {
                if (full()) return;
                if (matches(sk)) add({"key", joinKey(path, sk), sk, std::nullopt});
            }
        }
        for (const auto& v : values) {
            if (full()) return;
            if (options.searchValues && !v.name.empty() && matches(v.name)) {
                add({"value_name", path, displayName(v.name), std::nullopt});
            }
            if (options.searchData && matches(dataText(v.data))) {
                add({"value_data", path, displayName(v.name), v.data});
            }
        }
        for (const auto& sk : subKeys) {
            if (full()) return;
            visit(joinKey(path, sk), depth + 1, false);
        }
    }
};

class RegistryToolBase : public ToolBase {
public:
    RegistryToolBase(std::shared_ptr<const security::Sandbox> sandbox, std::shared_ptr<IRegistryReader> reader)
        : sandbox(std::move(sandbox)), reader(std::move(reader)) {}

protected:
    // Policy first, then platform availability.
    IRegistryReader& checkedReader(const std::string& keyPath) const {
        errors::throwIfError(sandbox->CheckRegistryAccess(keyPath, RegistryOperation::Read));
        if (!reader) {
            throw ToolError(ErrorKind::PlatformNotSupported, "Registry operations are only available on Windows");
        }
        return *reader;
    }

    std::shared_ptr<const security::Sandbox> sandbox;
    std::shared_ptr<IRegistryReader> reader;
};

class ReadRegistryTool : public RegistryToolBase {
public:
    ReadRegistryTool(std::shared_ptr<const security::Sandbox> sandbox, std::shared_ptr<IRegistryReader> reader)
        : RegistryToolBase(std::move(sandbox), std::move(reader)) {
        definition.name = "read_registry";
        definition.description = "Read a value from the Windows registry";
        definition.category = "registry";
        definition.parameters = {
            Param("key_path", "Full registry key path (e.g., 'HKLM\\SOFTWARE\\Microsoft')", ParameterType::String, true),
            Param("value_name", "Name of the value to read (empty for default value)", ParameterType::String, false, JSONValue("")),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const std::string keyPath = args::RequireString(a, "key_path");
        const std::string valueName = args::GetString(a, "value_name", "");
        RegistryValue v = checkedReader(keyPath).ReadValue(keyPath, valueName);
        JSONValue::Object result;
        result["key_path"] = MakeJSON(keyPath);
        result["value_name"] = MakeJSON(displayName(valueName));
        result["value"] = MakeJSON(std::move(v.data));
        result["type"] = MakeJSON(v.type);
        return ToolResult::Ok(JSONValue(std::move(result)));
    }
};

class ListRegistryKeysTool : public RegistryToolBase {
public:
    ListRegistryKeysTool(std::shared_ptr<const security::Sandbox> sandbox, std::shared_ptr<IRegistryReader> reader)
        : RegistryToolBase(std::move(sandbox), std::move(reader)) {
        definition.name = "list_registry_keys";
        definition.description = "List all subkeys and values in a Windows registry key";
        definition.category = "registry";
        definition.parameters = {
            Param("key_path", "Full registry key path (e.g., 'HKLM\\SOFTWARE')", ParameterType::String, true),
            Param("include_values", "Include values in the listing", ParameterType::Boolean, false, JSONValue(true)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const std::string keyPath = args::RequireString(a, "key_path");
        const bool includeValues = args::GetBool(a, "include_values", true);
        IRegistryReader& r = checkedReader(keyPath);

        JSONValue::Array subKeys;
        for (auto& sk : r.ListSubKeys(keyPath)) subKeys.push_back(MakeJSON(std::move(sk)));
        JSONValue::Object result;
        result["key_path"] = MakeJSON(keyPath);
        result["subkey_count"] = MakeJSON(static_cast<int64_t>(subKeys.size()));
        result["subkeys"] = MakeJSON(std::move(subKeys));
        if (includeValues) {
            JSONValue::Array values;
            for (const auto& v : r.ListValues(keyPath)) values.push_back(MakeJSON(valueToJSON(v)));
            result["value_count"] = MakeJSON(static_cast<int64_t>(values.size()));
            result["values"] = MakeJSON(std::move(values));
        }
        return ToolResult::Ok(JSONValue(std::move(result)));
    }
};

class SearchRegistryTool : public RegistryToolBase {
public:
    SearchRegistryTool(std::shared_ptr<const security::Sandbox> sandbox, std::shared_ptr<IRegistryReader> reader)
        : RegistryToolBase(std::move(sandbox), std::move(reader)) {
        definition.name = "search_registry";
        definition.description = "Search Windows registry for keys or values matching a pattern";
        definition.category = "registry";
        definition.parameters = {
            Param("key_path", "Starting registry key path for search", ParameterType::String, true),
            Param("pattern", "Pattern to search for (case-insensitive)", ParameterType::String, true),
            Param("search_keys", "Search in key names", ParameterType::Boolean, false, JSONValue(true)),
            Param("search_values", "Search in value names", ParameterType::Boolean, false, JSONValue(true)),
            Param("search_data", "Search in value data", ParameterType::Boolean, false, JSONValue(false)),
            Param("max_results", "Maximum number of results", ParameterType::Number, false, JSONValue(int64_t{50})),
            Param("max_depth", "Maximum recursion depth", ParameterType::Number, false, JSONValue(int64_t{5})),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string keyPath = args::RequireString(a, "key_path");
        RegistrySearchOptions options;
        options.pattern = args::RequireString(a, "pattern");
        options.searchKeys = args::GetBool(a, "search_keys", true);
        options.searchValues = args::GetBool(a, "search_values", true);
        options.searchData = args::GetBool(a, "search_data", false);
        options.maxResults = args::GetInt(a, "max_results", 50);
        options.maxDepth = args::GetInt(a, "max_depth", 5);
        if (options.maxResults <= 0 || options.maxDepth < 0) {
            throw ToolError(ErrorKind::InvalidParams, "max_results must be positive and max_depth non-negative");
        }
        IRegistryReader& r = checkedReader(keyPath);

        RegistrySearchResult found = SearchRegistry(r, keyPath, options, stop);
        JSONValue::Array hits;
        for (auto& h : found.hits) {
            JSONValue::Object obj;
            obj["type"] = MakeJSON(h.type);
            obj["path"] = MakeJSON(h.path);
            if (h.name) obj[h.type == "key" ? "match" : "name"] = MakeJSON(*h.name);
            if (h.value) obj["value"] = MakeJSON(std::move(*h.value));
            hits.push_back(MakeJSON(std::move(obj)));
        }
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["search_path"] = JSONValue(keyPath);
        metadata["pattern"] = JSONValue(options.pattern);
        metadata["result_count"] = JSONValue(static_cast<int64_t>(hits.size()));
        metadata["max_reached"] = JSONValue(found.maxReached);
        return ToolResult::Ok(JSONValue(std::move(hits)), std::move(metadata));
    }
};

} // namespace

std::shared_ptr<IRegistryReader> MakePlatformRegistryReader() {
#ifdef _WIN32
    return std::make_shared<WindowsRegistryReader>();
#else
    return nullptr;
#endif
}

RegistrySearchResult SearchRegistry(IRegistryReader& reader,
                                    const std::string& root,
                                    const RegistrySearchOptions& options,
                                    const std::stop_token& stop) {
    SearchState state{reader, options, toLower(options.pattern), stop, {}};
    if (options.maxResults > 0) {
        state.visit(root, 0, true);
    }
    state.result.maxReached = state.full();
    return std::move(state.result);
}

void RegisterRegistryTools(ToolRegistry& registry,
                           std::shared_ptr<const security::Sandbox> sandbox,
                           std::shared_ptr<IRegistryReader> reader) {
    registry.Register(std::make_shared<ReadRegistryTool>(sandbox, reader));
    registry.Register(std::make_shared<ListRegistryKeysTool>(sandbox, reader));
    registry.Register(std::make_shared<SearchRegistryTool>(sandbox, reader));
    if (!reader) {
        LOG_DEBUG("Registry tools registered without a platform reader");
    }
}

} // namespace hostmcp::tools
