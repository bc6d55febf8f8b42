//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Settings.cpp
// Purpose: Environment and command-line parsing for config::Settings
//==========================================================================================================

#include "hostmcp/config/Settings.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace hostmcp {
namespace config {

namespace {

// Every option understood by ApplyOption; the environment variable is HOSTMCP_<KEY> with '-' -> '_'.
const char* const kOptionKeys[] = {
    "transport", "host", "port", "tls-cert", "tls-key", "max-content-length",
    "require-auth", "api-keys", "signing-secret", "require-signature",
    "rate-limit-enabled", "rate-limit-requests", "rate-limit-window",
    "sandbox-enabled", "allowed-paths", "blocked-paths",
    "allow-process-management", "allow-registry-access", "allow-clipboard-access",
    "tool-timeout-ms", "max-file-read-bytes",
    "log-level", "log-file"
};

const char* const kBooleanKeys[] = {
    "require-auth", "require-signature", "rate-limit-enabled", "sandbox-enabled",
    "allow-process-management", "allow-registry-access", "allow-clipboard-access"
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string envNameForKey(const std::string& key) {
    std::string name = "HOSTMCP_";
    for (char c : key) {
        name.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

template <typename T>
bool parseNumber(const std::string& key, const std::string& text, T minValue, T& out) {
    T v{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size() || v < minValue) {
        LOG_WARN("Ignoring invalid value for {}: '{}'", key, text);
        return false;
    }
    out = v;
    return true;
}

bool parseBool(const std::string& key, const std::string& text, bool& out) {
    auto flag = ParseBoolFlag(text);
    if (!flag.has_value()) {
        LOG_WARN("Ignoring invalid boolean for {}: '{}'", key, text);
        return false;
    }
    out = flag.value();
    return true;
}

} // namespace

std::optional<TransportType> ParseTransportType(const std::string& text) {
    const std::string s = toLower(text);
    if (s == "stdio") return TransportType::Stdio;
    if (s == "http" || s == "https") return TransportType::Http;
    if (s == "websocket" || s == "ws") return TransportType::WebSocket;
    return std::nullopt;
}

const char* TransportTypeName(TransportType type) {
    switch (type) {
        case TransportType::Stdio: return "stdio";
        case TransportType::Http: return "http";
        case TransportType::WebSocket: return "websocket";
    }
    return "stdio";
}

Settings Settings::FromEnvironment() {
    Settings settings;
    for (const char* key : kOptionKeys) {
        const std::string envName = envNameForKey(key);
        const char* raw = std::getenv(envName.c_str());
        if (raw == nullptr) {
            continue;
        }
        settings.ApplyOption(key, raw);
    }
    return settings;
}

std::vector<std::string> Settings::ApplyArguments(int argc, char** argv) {
    std::vector<std::string> unknown;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        if (arg.rfind("--", 0) != 0) {
            unknown.push_back(arg);
            continue;
        }
        std::string key = arg.substr(2);
        std::string value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else if (std::find(std::begin(kBooleanKeys), std::end(kBooleanKeys), key) != std::end(kBooleanKeys)) {
            value = "true";
        } else {
            unknown.push_back(arg);
            continue;
        }
        if (!ApplyOption(key, value)) {
            unknown.push_back(arg);
        }
    }
    return unknown;
}

bool Settings::ApplyOption(const std::string& key, const std::string& value) {
    if (key == "transport") {
        auto t = ParseTransportType(value);
        if (!t.has_value()) {
            LOG_WARN("Ignoring unknown transport '{}'", value);
        } else {
            server.transport = t.value();
        }
    } else if (key == "host") {
        server.host = value;
    } else if (key == "port") {
        unsigned int port = server.port;
        if (parseNumber<unsigned int>(key, value, 0u, port)) {
            if (port > std::numeric_limits<uint16_t>::max()) {
                LOG_WARN("Ignoring out of range port: {}", port);
            } else {
                server.port = static_cast<uint16_t>(port);
            }
        }
    } else if (key == "tls-cert") {
        server.tlsCertFile = value;
    } else if (key == "tls-key") {
        server.tlsKeyFile = value;
    } else if (key == "max-content-length") {
        parseNumber<std::size_t>(key, value, 1, server.maxContentLength);
    } else if (key == "require-auth") {
        parseBool(key, value, security.requireAuth);
    } else if (key == "api-keys") {
        for (const auto& entry : SplitList(value, ",;")) {
            auto colon = entry.find(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 >= entry.size()) {
                LOG_WARN("Ignoring malformed api key entry (expected key:client)");
                continue;
            }
            security.apiKeys[entry.substr(0, colon)] = entry.substr(colon + 1);
        }
    } else if (key == "signing-secret") {
        security.signingSecret = value;
    } else if (key == "require-signature") {
        parseBool(key, value, security.requireSignature);
    } else if (key == "rate-limit-enabled") {
        parseBool(key, value, security.rateLimitEnabled);
    } else if (key == "rate-limit-requests") {
        parseNumber<int>(key, value, 1, security.rateLimitRequests);
    } else if (key == "rate-limit-window") {
        parseNumber<int>(key, value, 1, security.rateLimitWindowSeconds);
    } else if (key == "sandbox-enabled") {
        parseBool(key, value, security.sandboxEnabled);
    } else if (key == "allowed-paths") {
        security.allowedPaths = SplitList(value);
    } else if (key == "blocked-paths") {
        security.blockedPaths = SplitList(value);
    } else if (key == "allow-process-management") {
        parseBool(key, value, security.allowProcessManagement);
    } else if (key == "allow-registry-access") {
        parseBool(key, value, security.allowRegistryAccess);
    } else if (key == "allow-clipboard-access") {
        parseBool(key, value, security.allowClipboardAccess);
    } else if (key == "tool-timeout-ms") {
        int64_t ms = tools.timeout.count();
        if (parseNumber<int64_t>(key, value, 1, ms)) {
            tools.timeout = std::chrono::milliseconds(ms);
        }
    } else if (key == "max-file-read-bytes") {
        parseNumber<uint64_t>(key, value, 1, tools.maxFileReadBytes);
    } else if (key == "log-level") {
        logging.level = value;
    } else if (key == "log-file") {
        logging.file = value;
    } else {
        return false;
    }
    return true;
}

} // namespace config
} // namespace hostmcp
