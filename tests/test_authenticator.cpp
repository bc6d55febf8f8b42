//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_authenticator.cpp
// Purpose: GoogleTests for API key authentication and HMAC request signatures
//==========================================================================================================

#include <gtest/gtest.h>

#include <cctype>
#include <chrono>
#include <string>

#include "hostmcp/security/Authenticator.hpp"

using hostmcp::security::Authenticator;
using hostmcp::errors::ErrorKind;

namespace {

Authenticator::Clock fixedClock(double seconds) {
    return [seconds]() {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(seconds)));
    };
}

} // namespace

TEST(Authenticator, AnonymousWhenNotRequired) {
    Authenticator auth(false);
    auto r = auth.Authenticate(std::nullopt, std::nullopt);
    EXPECT_TRUE(r.authenticated);
    ASSERT_TRUE(r.clientId.has_value());
    EXPECT_EQ(r.clientId.value(), "anonymous");
}

TEST(Authenticator, MissingCredentialsAreRejected) {
    Authenticator auth(true);
    auth.AddApiKey("k1", "alice");
    auto r = auth.Authenticate(std::nullopt, std::string());
    EXPECT_FALSE(r.authenticated);
    EXPECT_EQ(r.error.value_or(""), "Authentication required");
}

TEST(Authenticator, ApiKeyAndBearerResolveToClient) {
    Authenticator auth(true);
    auth.AddApiKey("k1", "alice");
    auth.AddApiKey("k2", "bob");

    auto byKey = auth.Authenticate(std::string("k1"), std::nullopt);
    EXPECT_TRUE(byKey.authenticated);
    EXPECT_EQ(byKey.clientId.value_or(""), "alice");

    auto byBearer = auth.Authenticate(std::nullopt, std::string("Bearer k2"));
    EXPECT_TRUE(byBearer.authenticated);
    EXPECT_EQ(byBearer.clientId.value_or(""), "bob");

    // The explicit key wins over the Authorization value.
    auto both = auth.Authenticate(std::string("k1"), std::string("Bearer k2"));
    EXPECT_EQ(both.clientId.value_or(""), "alice");
}

TEST(Authenticator, UnknownOrRemovedKeyIsInvalid) {
    Authenticator auth(true);
    auth.AddApiKey("k1", "alice");
    EXPECT_EQ(auth.Authenticate(std::string("nope"), std::nullopt).error.value_or(""), "Invalid API key");
    EXPECT_TRUE(auth.RemoveApiKey("k1"));
    EXPECT_FALSE(auth.RemoveApiKey("k1"));
    EXPECT_FALSE(auth.Authenticate(std::string("k1"), std::nullopt).authenticated);
}

TEST(Authenticator, GeneratedKeysArePrefixedAndUsable) {
    Authenticator auth(true);
    auto key = auth.GenerateApiKey("carol");
    ASSERT_TRUE(key.ok());
    EXPECT_EQ(key.value().rfind(Authenticator::kKeyPrefix, 0), 0u);
    EXPECT_EQ(key.value().size(), std::string(Authenticator::kKeyPrefix).size() + 64u);
    EXPECT_EQ(auth.KeyCount(), 1u);
    EXPECT_EQ(auth.Authenticate(key.value(), std::nullopt).clientId.value_or(""), "carol");
}

TEST(Authenticator, SignatureIsDeterministicHexDigest) {
    const std::string sig = Authenticator::ComputeSignature("secret", "POST", "/", "100", "{}");
    EXPECT_EQ(sig, "fa82b647ee99cc477940aa2fecffc7b64ec0cef0d6d0216fe7ab6ff7e49f09fd");
    EXPECT_NE(sig, Authenticator::ComputeSignature("secret", "POST", "/", "100", "{ }"));
}

TEST(Authenticator, VerifySignatureAcceptsFreshValidSignature) {
    Authenticator auth(false, "secret", fixedClock(1000.0));
    const std::string sig = Authenticator::ComputeSignature("secret", "POST", "/", "1000", "{}");
    EXPECT_TRUE(auth.VerifySignature("POST", "/", "{}", "1000", sig).ok());

    std::string upper = sig;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(auth.VerifySignature("POST", "/", "{}", "1000", upper).ok());
}

TEST(Authenticator, VerifySignatureRejectsTamperingAndStaleTimestamps) {
    Authenticator auth(false, "secret", fixedClock(1000.0));
    const std::string sig = Authenticator::ComputeSignature("secret", "POST", "/", "1000", "{}");

    auto tampered = auth.VerifySignature("POST", "/", "{\"x\":1}", "1000", sig);
    ASSERT_FALSE(tampered.ok());
    EXPECT_EQ(tampered.error().kind, ErrorKind::AuthenticationRequired);
    EXPECT_EQ(tampered.error().message, "Invalid signature");

    const std::string oldSig = Authenticator::ComputeSignature("secret", "POST", "/", "600", "{}");
    auto stale = auth.VerifySignature("POST", "/", "{}", "600", oldSig);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().message, "Signature timestamp expired");

    auto garbage = auth.VerifySignature("POST", "/", "{}", "soon", sig);
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error().message, "Invalid signature timestamp");
}

TEST(Authenticator, VerifySignatureWithoutSecretFails) {
    Authenticator auth(false);
    auto st = auth.VerifySignature("POST", "/", "{}", "1", "00");
    ASSERT_FALSE(st.ok());
    EXPECT_EQ(st.error().message, "Request signing is not configured");
}
