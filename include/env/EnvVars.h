//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read and interpret HOSTMCP_* environment variables.
//==========================================================================================================
#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseBoolFlag
// Purpose: Interprets 1/true/yes/on and 0/false/no/off (case-insensitive).
// Returns:
//   The parsed flag, or std::nullopt when the text is not a recognised boolean.
//==========================================================================================================
inline std::optional<bool> ParseBoolFlag(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

// Splits a list on any of the separator characters, trimming blanks and dropping empty items.
inline std::vector<std::string> SplitList(const std::string& text, const std::string& separators = ";,") {
    std::vector<std::string> out;
    std::string item;
    auto flush = [&]() {
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) {
            out.push_back(item);
        }
        item.clear();
    };
    for (char c : text) {
        if (separators.find(c) != std::string::npos) {
            flush();
        } else {
            item.push_back(c);
        }
    }
    flush();
    return out;
}
