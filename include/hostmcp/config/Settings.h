//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Settings.h
// Purpose: Server configuration assembled from HOSTMCP_* environment variables and --key=value switches
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostmcp {
namespace config {

enum class TransportType {
    Stdio,
    Http,
    WebSocket
};

// Accepts stdio | http | https | websocket | ws (case-insensitive).
std::optional<TransportType> ParseTransportType(const std::string& text);
const char* TransportTypeName(TransportType type);

struct ServerSettings {
    TransportType transport{TransportType::Stdio};
    std::string host{"127.0.0.1"};
    uint16_t port{8765};
    std::string tlsCertFile;
    std::string tlsKeyFile;
    std::size_t maxContentLength{4 * 1024 * 1024};

    bool TlsEnabled() const { return !tlsCertFile.empty() && !tlsKeyFile.empty(); }
};

struct SecuritySettings {
    bool requireAuth{false};
    // api key -> client identity
    std::unordered_map<std::string, std::string> apiKeys;
    std::string signingSecret;
    bool requireSignature{false};

    bool rateLimitEnabled{true};
    int rateLimitRequests{100};
    int rateLimitWindowSeconds{60};

    bool sandboxEnabled{true};
    std::vector<std::string> allowedPaths;
    std::vector<std::string> blockedPaths;
    bool allowProcessManagement{true};
    bool allowRegistryAccess{false};
    bool allowClipboardAccess{false};
};

struct ToolSettings {
    std::chrono::milliseconds timeout{30000};
    uint64_t maxFileReadBytes{10 * 1024 * 1024};
};

struct LoggingSettings {
    std::string level{"INFO"};
    std::string file;
};

//==========================================================================================================
// Settings
// Purpose: Aggregate configuration for one server process.
// Notes:
//   Option keys are shared between the two sources: the switch --rate-limit-requests=N and the variable
//   HOSTMCP_RATE_LIMIT_REQUESTS=N set the same field. Malformed values keep the previous value and log.
//==========================================================================================================
struct Settings {
    ServerSettings server;
    SecuritySettings security;
    ToolSettings tools;
    LoggingSettings logging;

    // Defaults overlaid with every HOSTMCP_* variable that is set.
    static Settings FromEnvironment();

    //==========================================================================================================
    // ApplyArguments
    // Purpose: Overrides fields from --key=value switches. A bare --flag sets a boolean option to true.
    // Returns:
    //   Arguments that were not recognised (left for the caller to report).
    //==========================================================================================================
    std::vector<std::string> ApplyArguments(int argc, char** argv);

    // Applies a single option by key (e.g. "port", "allowed-paths"). Returns false for unknown keys.
    bool ApplyOption(const std::string& key, const std::string& value);
};

} // namespace config
} // namespace hostmcp
