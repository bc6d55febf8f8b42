//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_processor.cpp
// Purpose: GoogleTests for envelope validation, batches, parse errors and rate limiting
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "hostmcp/MessageProcessor.h"
#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/security/RateLimiter.hpp"
#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/ToolRegistry.h"

using namespace hostmcp;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<ProtocolHandler> emptyHandler() {
    return std::make_shared<ProtocolHandler>(std::make_shared<tools::ToolRegistry>(), 5s);
}

int64_t code(const JSONValue& reply) {
    return std::get<int64_t>(reply.find("error")->find("code")->value);
}

} // namespace

TEST(MessageProcessor, SingleRequestGetsSingleReply) {
    MessageProcessor mp(emptyHandler(), nullptr);
    auto out = mp.HandleMessage(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "c");
    ASSERT_TRUE(out.has_value());
    auto reply = ParseJSON(out.value());
    EXPECT_EQ(std::get<int64_t>(reply.find("id")->value), 1);
    EXPECT_TRUE(reply.find("result")->isObject());
}

TEST(MessageProcessor, NotificationsProduceNothing) {
    MessageProcessor mp(emptyHandler(), nullptr);
    EXPECT_FALSE(mp.HandleMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", "c").has_value());
    EXPECT_FALSE(mp.HandleMessage(R"({"jsonrpc":"2.0","method":"ping","id":null})", "c").has_value());
}

TEST(MessageProcessor, MalformedJsonIsParseError) {
    MessageProcessor mp(emptyHandler(), nullptr);
    auto out = mp.HandleMessage("{not json", "c");
    ASSERT_TRUE(out.has_value());
    auto reply = ParseJSON(out.value());
    EXPECT_EQ(code(reply), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(reply.find("id")->isNull());
}

TEST(MessageProcessor, InvalidEnvelopesAreRejected) {
    MessageProcessor mp(emptyHandler(), nullptr);
    for (const char* bad : {R"("just a string")",
                            R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})",
                            R"({"jsonrpc":"2.0","id":[1],"method":"   "})"}) {
        auto out = mp.HandleMessage(bad, "c");
        ASSERT_TRUE(out.has_value()) << bad;
        auto reply = ParseJSON(out.value());
        EXPECT_EQ(code(reply), JSONRPCErrorCodes::InvalidRequest) << bad;
        EXPECT_TRUE(reply.find("id")->isNull()) << bad;
    }
}

TEST(MessageProcessor, InvalidEnvelopeEchoesUsableId) {
    MessageProcessor mp(emptyHandler(), nullptr);
    for (const char* bad : {R"({"jsonrpc":"1.0","id":1,"method":"ping"})",
                            R"({"jsonrpc":"2.0","id":1})",
                            R"({"jsonrpc":"2.0","id":1,"method":"   "})",
                            R"({"jsonrpc":"2.0","id":1,"method":"ping","params":7})"}) {
        auto out = mp.HandleMessage(bad, "c");
        ASSERT_TRUE(out.has_value()) << bad;
        auto reply = ParseJSON(out.value());
        EXPECT_EQ(code(reply), JSONRPCErrorCodes::InvalidRequest) << bad;
        EXPECT_EQ(std::get<int64_t>(reply.find("id")->value), 1) << bad;
    }

    auto named = ParseJSON(mp.HandleMessage(R"({"jsonrpc":"2.0","id":"req-7","method":""})", "c").value());
    EXPECT_EQ(code(named), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(std::get<std::string>(named.find("id")->value), "req-7");
}

TEST(MessageProcessor, FailingNotificationsProduceNothing) {
    MessageProcessor mp(emptyHandler(), nullptr);
    EXPECT_FALSE(mp.HandleMessage(R"({"jsonrpc":"2.0","method":"no/such/method"})", "c").has_value());
    EXPECT_FALSE(mp.HandleMessage(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":7}})", "c").has_value());
    EXPECT_FALSE(mp.HandleMessage(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"missing_tool"}})", "c")
                     .has_value());
    EXPECT_FALSE(mp.HandleMessage(
        R"([{"jsonrpc":"2.0","method":"tools/call"},{"jsonrpc":"2.0","method":"tools/call","params":{"name":""}}])", "c")
                     .has_value());
}

TEST(MessageProcessor, ParseRequestNormalisesFields) {
    auto parsed = MessageProcessor::ParseRequest(ParseJSON(R"({"id":"x","method":" tools/list ","params":[1,"a"]})"));
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value().method, "tools/list");
    EXPECT_EQ(std::get<std::string>(parsed.value().id), "x");
    ASSERT_TRUE(parsed.value().params.has_value());
    EXPECT_EQ(std::get<int64_t>(parsed.value().params->find("0")->value), 1);
    EXPECT_EQ(std::get<std::string>(parsed.value().params->find("1")->value), "a");
}

TEST(MessageProcessor, BatchRepliesKeepOrderAndSkipNotifications) {
    MessageProcessor mp(emptyHandler(), nullptr);
    auto out = mp.HandleMessage(R"([
        {"jsonrpc":"2.0","id":"a","method":"ping"},
        {"jsonrpc":"2.0","method":"notifications/initialized"},
        {"jsonrpc":"2.0","id":"b","method":"nope"},
        42
    ])", "c");
    ASSERT_TRUE(out.has_value());
    auto reply = ParseJSON(out.value());
    ASSERT_TRUE(reply.isArray());
    const auto& items = std::get<JSONValue::Array>(reply.value);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(std::get<std::string>(items[0]->find("id")->value), "a");
    EXPECT_EQ(std::get<std::string>(items[1]->find("id")->value), "b");
    EXPECT_EQ(code(*items[1]), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(code(*items[2]), JSONRPCErrorCodes::InvalidRequest);
}

TEST(MessageProcessor, EmptyAndNotificationOnlyBatchesAreSilent) {
    MessageProcessor mp(emptyHandler(), nullptr);
    EXPECT_FALSE(mp.HandleMessage("[]", "c").has_value());
    EXPECT_FALSE(mp.HandleMessage(R"([{"jsonrpc":"2.0","method":"notifications/initialized"}])", "c").has_value());
}

TEST(MessageProcessor, RateLimitAppliesPerClientAndPerMessage) {
    auto limiter = std::make_shared<security::RateLimiter>(2, 60s);
    MessageProcessor mp(emptyHandler(), limiter);
    const std::string batch = R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","id":2,"method":"ping"}])";

    auto first = ParseJSON(mp.HandleMessage(batch, "alice").value());
    EXPECT_TRUE(first.isArray());
    auto second = ParseJSON(mp.HandleMessage(batch, "alice").value());
    EXPECT_TRUE(second.isArray());

    auto third = ParseJSON(mp.HandleMessage(R"({"jsonrpc":"2.0","id":3,"method":"ping"})", "alice").value());
    EXPECT_EQ(code(third), JSONRPCErrorCodes::RateLimited);
    EXPECT_TRUE(third.find("id")->isNull());
    const JSONValue* data = third.find("error")->find("data");
    ASSERT_NE(data, nullptr);
    EXPECT_GE(std::get<int64_t>(data->find("retryAfter")->value), 1);

    auto other = ParseJSON(mp.HandleMessage(R"({"jsonrpc":"2.0","id":4,"method":"ping"})", "bob").value());
    EXPECT_EQ(other.find("error"), nullptr);
}

TEST(MessageProcessor, ToolCallRoundTrip) {
    auto sandbox = std::make_shared<const security::Sandbox>(security::SandboxPolicy{});
    std::shared_ptr<tools::ToolRegistry> registry = tools::ToolRegistry::CreateDefault(config::ToolSettings{}, sandbox);
    MessageProcessor mp(std::make_shared<ProtocolHandler>(registry, 5s), nullptr);
    auto out = mp.HandleMessage(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"get_system_info","arguments":{}}})", "c");
    ASSERT_TRUE(out.has_value());
    auto reply = ParseJSON(out.value());
    const JSONValue* result = reply.find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(std::get<bool>(result->find("isError")->value));
    const auto& content = std::get<JSONValue::Array>(result->find("content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_NO_THROW(ParseJSON(std::get<std::string>(content[0]->find("text")->value)));
}
