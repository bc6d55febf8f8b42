//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Authenticator.hpp
// Purpose: API key / bearer authentication and HMAC request signature verification
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "hostmcp/errors/Errors.h"

namespace hostmcp::security {

//==========================================================================================================
// AuthResult
// Purpose: Outcome of one authentication attempt. Produced per call, never stored.
// Fields:
//   clientId: Identity bound to the presented key (set when authenticated).
//   error: Reason for rejection (set when not authenticated).
//==========================================================================================================
struct AuthResult {
    bool authenticated{false};
    std::optional<std::string> clientId;
    std::optional<std::string> error;
};

//==========================================================================================================
// Authenticator
// Purpose: Maps API keys to client identities and verifies signed requests.
// Notes:
//   The key table is read-mostly: lookups take a shared lock, add/remove take an exclusive lock.
//   Adding a key that already exists rebinds it to the new identity (last write wins).
//==========================================================================================================
class Authenticator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // Accepted distance between the signed timestamp and the local clock.
    static constexpr std::chrono::seconds kSignatureWindow{300};
    static constexpr const char* kAnonymousClient = "anonymous";
    static constexpr const char* kKeyPrefix = "hmcp_";

    explicit Authenticator(bool requireAuth, std::string signingSecret = std::string(), Clock clock = {});

    bool RequiresAuth() const { return requireAuth; }

    //==========================================================================================================
    // Authenticate
    // Purpose: Resolve credentials to a client identity.
    // Args:
    //   apiKey: Raw key (X-API-Key header or equivalent). Takes precedence when present.
    //   bearerToken: Authorization value; a leading "Bearer " is stripped before lookup.
    // Returns:
    //   AuthResult; always authenticated as "anonymous" when authentication is not required.
    //==========================================================================================================
    AuthResult Authenticate(const std::optional<std::string>& apiKey,
                            const std::optional<std::string>& bearerToken) const;

    void AddApiKey(const std::string& key, const std::string& clientId);
    bool RemoveApiKey(const std::string& key);

    // Creates a random key (kKeyPrefix + 64 hex chars), binds it to clientId and returns it.
    errors::Result<std::string> GenerateApiKey(const std::string& clientId);

    std::size_t KeyCount() const;

    //==========================================================================================================
    // VerifySignature
    // Purpose: Check an HMAC-SHA256 request signature.
    // Args:
    //   timestamp: Decimal seconds since the epoch as sent by the client.
    //   signature: Hex digest (either case) of method\npath\ntimestamp\nbody.
    // Returns:
    //   Ok, or AuthenticationRequired describing why the signature was rejected.
    //==========================================================================================================
    errors::Status VerifySignature(const std::string& method, const std::string& path,
                                   const std::string& body, const std::string& timestamp,
                                   const std::string& signature) const;

    // Lowercase hex HMAC-SHA256 over the canonical signing string. Empty on OpenSSL failure.
    static std::string ComputeSignature(const std::string& secret, const std::string& method,
                                        const std::string& path, const std::string& timestamp,
                                        const std::string& body);

private:
    std::optional<std::string> lookup(const std::string& key) const;

    bool requireAuth;
    std::string signingSecret;
    Clock clock;

    mutable std::shared_mutex keysMutex;
    std::unordered_map<std::string, std::string> keys;
};

} // namespace hostmcp::security
