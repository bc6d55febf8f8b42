//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hostmcp/security/Authenticator.cpp
// Purpose: API key authentication and HMAC-SHA256 signature verification (OpenSSL)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <mutex>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "hostmcp/security/Authenticator.hpp"
#include "logging/Logger.h"

namespace hostmcp::security {

namespace {
    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    static std::string toHex(const unsigned char* data, std::size_t len) {
        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            out.push_back(digits[(data[i] >> 4) & 0x0F]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

    static AuthResult rejected(const std::string& why) {
        AuthResult r;
        r.authenticated = false;
        r.error = why;
        return r;
    }
}

Authenticator::Authenticator(bool requireAuth, std::string signingSecret, Clock clock)
    : requireAuth(requireAuth), signingSecret(std::move(signingSecret)), clock(std::move(clock)) {
    if (!this->clock) {
        this->clock = [](){ return std::chrono::system_clock::now(); };
    }
}

std::optional<std::string> Authenticator::lookup(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(keysMutex);
    auto it = keys.find(key);
    if (it == keys.end()) {
        return std::nullopt;
    }
    return it->second;
}

AuthResult Authenticator::Authenticate(const std::optional<std::string>& apiKey,
                                       const std::optional<std::string>& bearerToken) const {
    if (!requireAuth) {
        AuthResult r;
        r.authenticated = true;
        r.clientId = kAnonymousClient;
        return r;
    }

    std::string candidate;
    if (apiKey.has_value() && !apiKey->empty()) {
        candidate = apiKey.value();
    } else if (bearerToken.has_value() && !bearerToken->empty()) {
        candidate = bearerToken.value();
        if (startsWithBearer(candidate)) {
            candidate = candidate.substr(7);
        }
    } else {
        return rejected("Authentication required");
    }

    auto client = lookup(candidate);
    if (!client.has_value()) {
        LOG_WARN("Authentication failed: unknown API key");
        return rejected("Invalid API key");
    }
    AuthResult r;
    r.authenticated = true;
    r.clientId = client;
    return r;
}

void Authenticator::AddApiKey(const std::string& key, const std::string& clientId) {
    std::unique_lock<std::shared_mutex> lock(keysMutex);
    auto it = keys.find(key);
    if (it != keys.end() && it->second != clientId) {
        LOG_WARN("API key rebound from client '{}' to '{}'", it->second, clientId);
    }
    keys[key] = clientId;
}

bool Authenticator::RemoveApiKey(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(keysMutex);
    return keys.erase(key) > 0;
}

errors::Result<std::string> Authenticator::GenerateApiKey(const std::string& clientId) {
    unsigned char buf[32];
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
        LOG_ERROR("RAND_bytes failed while generating API key");
        return errors::makeError(errors::ErrorKind::Internal, "Failed to generate API key");
    }
    std::string key = std::string(kKeyPrefix) + toHex(buf, sizeof(buf));
    AddApiKey(key, clientId);
    LOG_INFO("Generated API key for client '{}'", clientId);
    return key;
}

std::size_t Authenticator::KeyCount() const {
    std::shared_lock<std::shared_mutex> lock(keysMutex);
    return keys.size();
}

std::string Authenticator::ComputeSignature(const std::string& secret, const std::string& method,
                                            const std::string& path, const std::string& timestamp,
                                            const std::string& body) {
    const std::string message = method + "\n" + path + "\n" + timestamp + "\n" + body;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    unsigned char* out = HMAC(EVP_sha256(),
                              secret.data(), static_cast<int>(secret.size()),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                              digest, &digestLen);
    if (out == nullptr) {
        return std::string();
    }
    return toHex(digest, digestLen);
}

errors::Status Authenticator::VerifySignature(const std::string& method, const std::string& path,
                                              const std::string& body, const std::string& timestamp,
                                              const std::string& signature) const {
    using errors::ErrorKind;
    if (signingSecret.empty()) {
        return errors::makeError(ErrorKind::AuthenticationRequired, "Request signing is not configured");
    }

    double ts = 0.0;
    auto [ptr, ec] = std::from_chars(timestamp.data(), timestamp.data() + timestamp.size(), ts);
    if (timestamp.empty() || ec != std::errc() || ptr != timestamp.data() + timestamp.size() || !std::isfinite(ts)) {
        return errors::makeError(ErrorKind::AuthenticationRequired, "Invalid signature timestamp");
    }
    const double now = std::chrono::duration<double>(clock().time_since_epoch()).count();
    if (std::fabs(now - ts) > static_cast<double>(kSignatureWindow.count())) {
        LOG_WARN("Rejected signature outside the {}s window", kSignatureWindow.count());
        return errors::makeError(ErrorKind::AuthenticationRequired, "Signature timestamp expired");
    }

    const std::string expected = ComputeSignature(signingSecret, method, path, timestamp, body);
    std::string supplied;
    supplied.reserve(signature.size());
    for (char c : signature) {
        supplied.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (expected.empty() || supplied.size() != expected.size() ||
        CRYPTO_memcmp(expected.data(), supplied.data(), expected.size()) != 0) {
        LOG_WARN("Rejected request with invalid signature");
        return errors::makeError(ErrorKind::AuthenticationRequired, "Invalid signature");
    }
    return errors::okStatus();
}

} // namespace hostmcp::security
