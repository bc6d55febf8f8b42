//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageProcessor.cpp
// Purpose: Envelope validation, batch handling and reply serialization
//==========================================================================================================

#include "hostmcp/MessageProcessor.h"
#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/security/RateLimiter.hpp"
#include "logging/Logger.h"

namespace hostmcp {

using errors::ErrorKind;
using errors::makeError;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

JSONValue errorReply(const JSONRPCId& id, const errors::McpError& err) {
    return errors::makeErrorResponse(id, err)->ToJSON();
}

// The envelope's id when it is a usable string or integer, otherwise null.
JSONRPCId salvageId(const JSONValue& value) {
    if (!value.isObject()) return nullptr;
    const JSONValue* id = value.find("id");
    if (!id) return nullptr;
    if (id->isString()) return std::get<std::string>(id->value);
    if (id->isInt()) return std::get<int64_t>(id->value);
    return nullptr;
}

} // namespace

MessageProcessor::MessageProcessor(std::shared_ptr<ProtocolHandler> handler,
                                   std::shared_ptr<security::RateLimiter> rateLimiter)
    : handler(std::move(handler)), rateLimiter(std::move(rateLimiter)) {}

errors::Result<JSONRPCRequest> MessageProcessor::ParseRequest(const JSONValue& value) {
    if (!value.isObject()) {
        return makeError(ErrorKind::InvalidRequest, "Invalid Request: expected an object");
    }
    JSONRPCRequest req;

    if (const JSONValue* v = value.find("jsonrpc")) {
        if (!v->isString() || std::get<std::string>(v->value) != "2.0") {
            return makeError(ErrorKind::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
        }
    }

    const JSONValue* m = value.find("method");
    if (!m || !m->isString()) {
        return makeError(ErrorKind::InvalidRequest, "Invalid Request: method must be a string");
    }
    req.method = trim(std::get<std::string>(m->value));
    if (req.method.empty()) {
        return makeError(ErrorKind::InvalidRequest, "Invalid Request: method must not be empty");
    }

    if (const JSONValue* id = value.find("id")) {
        if (id->isString()) {
            req.id = std::get<std::string>(id->value);
        } else if (id->isInt()) {
            req.id = std::get<int64_t>(id->value);
        } else if (!id->isNull()) {
            return makeError(ErrorKind::InvalidRequest, "Invalid Request: id must be a string, integer or null");
        }
    }

    if (const JSONValue* p = value.find("params"); p && !p->isNull()) {
        if (p->isObject()) {
            req.params = *p;
        } else if (p->isArray()) {
            JSONValue::Object keyed;
            const auto& arr = std::get<JSONValue::Array>(p->value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                keyed[std::to_string(i)] = arr[i];
            }
            req.params = JSONValue(std::move(keyed));
        } else {
            return makeError(ErrorKind::InvalidRequest, "Invalid Request: params must be an object or array");
        }
    }
    return req;
}

std::optional<JSONValue> MessageProcessor::handleOne(const JSONValue& value) {
    auto parsed = ParseRequest(value);
    if (!parsed.ok()) {
        LOG_WARN("Rejected envelope: {}", parsed.error().message);
        return errorReply(salvageId(value), parsed.error());
    }
    const JSONRPCRequest& req = parsed.value();
    try {
        auto resp = handler->HandleRequest(req);
        if (!resp) {
            return std::nullopt;
        }
        return resp->ToJSON();
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error for {}: {}", req.method, e.what());
        if (req.IsNotification()) {
            return std::nullopt;
        }
        return errorReply(req.id, makeError(ErrorKind::Internal, "Internal error"));
    }
}

std::optional<std::string> MessageProcessor::HandleMessage(const std::string& message, const std::string& clientId) {
    FUNC_SCOPE();
    if (rateLimiter) {
        auto admitted = rateLimiter->Admit(clientId);
        if (!admitted.ok()) {
            LOG_WARN("Rate limit exceeded for client {}", clientId);
            return SerializeJSON(errorReply(nullptr, admitted.error()));
        }
    }

    JSONValue doc;
    try {
        doc = ParseJSON(message);
    } catch (const JSONParseError& e) {
        LOG_WARN("Parse error from client {}: {}", clientId, e.what());
        return SerializeJSON(errorReply(nullptr, makeError(ErrorKind::ParseError, std::string("Invalid JSON: ") + e.what())));
    }

    if (doc.isArray()) {
        const auto& elements = std::get<JSONValue::Array>(doc.value);
        if (elements.empty()) {
            LOG_WARN("Empty batch from client {} ignored", clientId);
            return std::nullopt;
        }
        JSONValue::Array replies;
        for (const auto& element : elements) {
            if (auto reply = handleOne(element ? *element : JSONValue(nullptr))) {
                replies.push_back(std::make_shared<JSONValue>(std::move(reply.value())));
            }
        }
        if (replies.empty()) {
            return std::nullopt;
        }
        return SerializeJSON(JSONValue(std::move(replies)));
    }

    auto reply = handleOne(doc);
    if (!reply) {
        return std::nullopt;
    }
    return SerializeJSON(reply.value());
}

void MessageProcessor::ForgetClient(const std::string& clientId) {
    if (rateLimiter) {
        rateLimiter->Forget(clientId);
    }
}

} // namespace hostmcp
