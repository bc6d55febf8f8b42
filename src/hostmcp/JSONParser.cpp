//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser and serializers for JSONValue
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <sstream>
#include <string>
#include <vector>

#include "hostmcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace hostmcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() = default;

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

namespace {

constexpr int MaxNestingDepth = 128;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += static_cast<unsigned int>(10 + (h - 'a'));
            else if (h >= 'A' && h <= 'F') code += static_cast<unsigned int>(10 + (h - 'A'));
            else fail("Invalid hex digit in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"'");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Unterminated escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate: combine with a following low surrogate when present
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            std::size_t save = i;
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                i = save;
                                code = 0xFFFD;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Digit expected after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Digit expected in exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: fall through to double
        }
        try {
            return JSONValue(std::stod(std::string(first, last)));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        ++i; // '['
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("Unexpected character");
    }
};

void writeString(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void writeDouble(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    std::string num = std::format("{}", d);
    if (num.find_first_of(".eE") == std::string::npos) {
        num += ".0";
    }
    out += num;
}

void writeValue(std::string& out, const JSONValue& value, int indent, int level) {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (pretty) {
            out.push_back('\n');
            out.append(static_cast<std::size_t>(lvl * indent), ' ');
        }
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (v.empty()) { out += "[]"; return; }
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                newline(level + 1);
                if (v[k]) writeValue(out, *v[k], indent, level + 1); else out += "null";
            }
            newline(level);
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (v.empty()) { out += "{}"; return; }
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            if (pretty) {
                std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b){ return *a < *b; });
            }
            out.push_back('{');
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) out.push_back(',');
                first = false;
                newline(level + 1);
                writeString(out, *key);
                out += pretty ? ": " : ":";
                const auto& member = v.at(*key);
                if (member) writeValue(out, *member, indent, level + 1); else out += "null";
            }
            newline(level);
            out.push_back('}');
        }
    }, value.get());
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    writeValue(out, value, 0, 0);
    return out;
}

std::string SerializeJSONPretty(const JSONValue& value, int indent) {
    std::string out;
    writeValue(out, value, indent < 1 ? 2 : indent, 0);
    return out;
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { return JSONValue(v); }
        else if constexpr (std::is_same_v<T, int64_t>) { return JSONValue(v); }
        else { return JSONValue(nullptr); }
    }, id);
}

std::string IdToString(const JSONRPCId& id) {
    std::string idStr;
    std::visit([&](const auto& v){
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { idStr = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { idStr = std::to_string(v); }
    }, id);
    return idStr;
}

std::string JSONRPCRequest::Serialize() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = MakeJSON(jsonrpc);
    if (!IsNotification()) {
        obj["id"] = MakeJSON(IdToJSON(id));
    }
    obj["method"] = MakeJSON(method);
    if (params.has_value()) {
        obj["params"] = MakeJSON(params.value());
    }
    return SerializeJSON(JSONValue(std::move(obj)));
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = MakeJSON(jsonrpc);
    obj["id"] = MakeJSON(IdToJSON(id));
    if (error.has_value()) {
        obj["error"] = MakeJSON(error.value());
    } else {
        obj["result"] = MakeJSON(result.value_or(JSONValue(nullptr)));
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = MakeJSON(static_cast<int64_t>(code));
    errorObj["message"] = MakeJSON(message);
    if (data.has_value()) {
        errorObj["data"] = MakeJSON(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace hostmcp
