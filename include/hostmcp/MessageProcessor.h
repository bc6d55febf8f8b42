//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageProcessor.h
// Purpose: Single entry point shared by every transport: rate-limit, parse, dispatch, serialize
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "hostmcp/JSONRPCTypes.h"
#include "hostmcp/errors/Errors.h"

namespace hostmcp {

class ProtocolHandler;
namespace security { class RateLimiter; }

//==========================================================================================================
// MessageProcessor
// Purpose: Turns one inbound message (single request or batch) into at most one outbound message.
// Behavior:
//   - rate limit admission first (one admission per message, a batch counts once); rejection answers
//     RateLimited with id null and data.retryAfter
//   - malformed JSON answers ParseError with id null
//   - an invalid envelope answers InvalidRequest, echoing its id when that id is a string or integer
//   - batch elements are handled in order; replies keep input order; all-notification and empty
//     batches produce no reply
// Notes:
//   A null rate limiter disables admission control.
//==========================================================================================================
class MessageProcessor {
public:
    MessageProcessor(std::shared_ptr<ProtocolHandler> handler, std::shared_ptr<security::RateLimiter> rateLimiter);

    // Returns the serialized reply, or std::nullopt when nothing must be sent back.
    std::optional<std::string> HandleMessage(const std::string& message, const std::string& clientId);

    //==========================================================================================================
    // ParseRequest
    // Purpose: Validates a decoded JSON value into a request envelope.
    // Rules:
    //   object; jsonrpc (when present) == "2.0"; method a non-empty string after trimming; id string,
    //   integer or null; params object, array (re-keyed "0", "1", ...) or absent/null.
    // Returns:
    //   The request, or InvalidRequest.
    //==========================================================================================================
    static errors::Result<JSONRPCRequest> ParseRequest(const JSONValue& value);

    // Drops per-client state (the rate limit bucket) once a connection-scoped client id is gone.
    void ForgetClient(const std::string& clientId);

private:
    std::optional<JSONValue> handleOne(const JSONValue& value);

    std::shared_ptr<ProtocolHandler> handler;
    std::shared_ptr<security::RateLimiter> rateLimiter;
};

} // namespace hostmcp
