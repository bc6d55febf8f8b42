//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_handler.cpp
// Purpose: GoogleTests for MCP method dispatch, tool calls, timeouts and cancellation
//==========================================================================================================

#include <gtest/gtest.h>

#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/version.h"

using namespace hostmcp;
using namespace hostmcp::tools;
using namespace std::chrono_literals;

namespace {

class UpperTool : public ToolBase {
public:
    UpperTool() {
        definition.name = "upper";
        definition.description = "Upper-case text";
        definition.parameters = {Param("text", "Input", ParameterType::String, true)};
    }
    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        std::string s = args::RequireString(a, "text");
        for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return ToolResult::Ok(JSONValue(s));
    }
};

class StructuredTool : public ToolBase {
public:
    StructuredTool() { definition.name = "structured"; definition.description = "Returns an object"; }
    ToolResult Execute(const JSONValue&, std::stop_token) override {
        JSONValue::Object obj;
        obj["b"] = MakeJSON(int64_t{2});
        obj["a"] = MakeJSON(true);
        return ToolResult::Ok(JSONValue(obj));
    }
};

class SilentTool : public ToolBase {
public:
    SilentTool() { definition.name = "silent"; definition.description = "Returns nothing"; }
    ToolResult Execute(const JSONValue&, std::stop_token) override { return ToolResult::Ok(); }
};

// Blocks until asked to stop.
class WaitTool : public ToolBase {
public:
    WaitTool() { definition.name = "wait"; definition.description = "Waits for cancellation"; }
    ToolResult Execute(const JSONValue&, std::stop_token stop) override {
        while (true) {
            ThrowIfStopRequested(stop);
            std::this_thread::sleep_for(10ms);
        }
    }
};

std::shared_ptr<ToolRegistry> testRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->Register(std::make_shared<UpperTool>());
    registry->Register(std::make_shared<StructuredTool>());
    registry->Register(std::make_shared<SilentTool>());
    registry->Register(std::make_shared<WaitTool>());
    return registry;
}

JSONValue callParams(const std::string& name, JSONValue::Object arguments = {}) {
    JSONValue::Object params;
    params["name"] = MakeJSON(name);
    params["arguments"] = MakeJSON(JSONValue(std::move(arguments)));
    return JSONValue(params);
}

int64_t errorCode(const JSONRPCResponse& resp) {
    return std::get<int64_t>(resp.error->find("code")->value);
}

std::string contentText(const JSONRPCResponse& resp) {
    const auto& content = std::get<JSONValue::Array>(resp.result->find("content")->value);
    return std::get<std::string>(content.at(0)->find("text")->value);
}

bool isError(const JSONRPCResponse& resp) {
    return std::get<bool>(resp.result->find("isError")->value);
}

} // namespace

TEST(ProtocolHandler, InitializeAdvertisesServer) {
    ProtocolHandler handler(testRegistry(), 5s);
    JSONValue::Object params;
    JSONValue::Object caps;
    caps["roots"] = MakeJSON(JSONValue(JSONValue::Object{}));
    params["capabilities"] = MakeJSON(JSONValue(caps));
    auto resp = handler.HandleRequest(JSONRPCRequest(int64_t{1}, "initialize", JSONValue(params)));
    ASSERT_TRUE(resp);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resp->result->find("protocolVersion")->value), PROTOCOL_VERSION);
    const JSONValue* info = resp->result->find("serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(std::get<std::string>(info->find("name")->value), SERVER_NAME);
    EXPECT_EQ(std::get<std::string>(info->find("version")->value), getVersionString());
    EXPECT_NE(resp->result->find("capabilities")->find("tools"), nullptr);
    EXPECT_NE(handler.ClientCapabilities().find("roots"), nullptr);
    EXPECT_FALSE(handler.IsInitialized());
}

TEST(ProtocolHandler, InitializedNotificationHasNoReply) {
    ProtocolHandler handler(testRegistry(), 5s);
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "notifications/initialized")), nullptr);
    EXPECT_TRUE(handler.IsInitialized());
}

TEST(ProtocolHandler, PingAndUnknownMethods) {
    ProtocolHandler handler(testRegistry(), 5s);
    auto pong = handler.HandleRequest(JSONRPCRequest(std::string("p"), "ping"));
    ASSERT_TRUE(pong);
    EXPECT_TRUE(pong->result->isObject());

    auto unknown = handler.HandleRequest(JSONRPCRequest(int64_t{2}, "resources/list"));
    ASSERT_TRUE(unknown && unknown->IsError());
    EXPECT_EQ(errorCode(*unknown), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<std::string>(unknown->error->find("message")->value), "Method not found: resources/list");

    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "made/up")), nullptr);
}

TEST(ProtocolHandler, ToolsListIsSortedWithSchemas) {
    ProtocolHandler handler(testRegistry(), 5s);
    auto resp = handler.HandleRequest(JSONRPCRequest(int64_t{3}, "tools/list"));
    ASSERT_TRUE(resp && !resp->IsError());
    const auto& tools = std::get<JSONValue::Array>(resp->result->find("tools")->value);
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(std::get<std::string>(tools[0]->find("name")->value), "silent");
    EXPECT_EQ(std::get<std::string>(tools[3]->find("name")->value), "wait");
    EXPECT_NE(tools[2]->find("inputSchema"), nullptr);
}

TEST(ProtocolHandler, ToolCallRendersTextContent) {
    ProtocolHandler handler(testRegistry(), 5s);
    JSONValue::Object arguments;
    arguments["text"] = MakeJSON(std::string("abc"));
    auto resp = handler.HandleRequest(JSONRPCRequest(int64_t{4}, "tools/call", callParams("upper", arguments)));
    ASSERT_TRUE(resp && !resp->IsError());
    EXPECT_EQ(contentText(*resp), "ABC");
    EXPECT_FALSE(isError(*resp));

    auto structured = handler.HandleRequest(JSONRPCRequest(int64_t{5}, "tools/call", callParams("structured")));
    EXPECT_EQ(contentText(*structured), "{\n  \"a\": true,\n  \"b\": 2\n}");

    auto silent = handler.HandleRequest(JSONRPCRequest(int64_t{6}, "tools/call", callParams("silent")));
    EXPECT_EQ(contentText(*silent), "Operation completed successfully.");
}

TEST(ProtocolHandler, ToolFailuresAreInBandErrors) {
    ProtocolHandler handler(testRegistry(), 5s);
    auto missingArg = handler.HandleRequest(JSONRPCRequest(int64_t{7}, "tools/call", callParams("upper")));
    ASSERT_TRUE(missingArg && !missingArg->IsError());
    EXPECT_TRUE(isError(*missingArg));
    EXPECT_EQ(contentText(*missingArg), "Invalid parameters: missing required parameter 'text'");

    auto unknown = handler.HandleRequest(JSONRPCRequest(int64_t{8}, "tools/call", callParams("nope")));
    ASSERT_TRUE(unknown && !unknown->IsError());
    EXPECT_TRUE(isError(*unknown));
    EXPECT_EQ(contentText(*unknown), "Not found: Tool not found: nope");
}

TEST(ProtocolHandler, MalformedToolCallParamsAreInvalidParams) {
    ProtocolHandler handler(testRegistry(), 5s);
    auto noParams = handler.HandleRequest(JSONRPCRequest(int64_t{9}, "tools/call"));
    ASSERT_TRUE(noParams && noParams->IsError());
    EXPECT_EQ(errorCode(*noParams), JSONRPCErrorCodes::InvalidParams);

    JSONValue::Object params;
    params["name"] = MakeJSON(std::string("upper"));
    params["arguments"] = MakeJSON(JSONValue(JSONValue::Array{}));
    auto badArgs = handler.HandleRequest(JSONRPCRequest(int64_t{10}, "tools/call", JSONValue(params)));
    ASSERT_TRUE(badArgs && badArgs->IsError());
    EXPECT_EQ(errorCode(*badArgs), JSONRPCErrorCodes::InvalidParams);
}

TEST(ProtocolHandler, FailingNotificationsHaveNoReply) {
    ProtocolHandler handler(testRegistry(), 5s);
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "resources/list")), nullptr);
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "tools/call")), nullptr);

    JSONValue::Object badArgs;
    badArgs["name"] = MakeJSON(std::string("upper"));
    badArgs["arguments"] = MakeJSON(std::string("not an object"));
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "tools/call", JSONValue(badArgs))), nullptr);

    // Missing required argument fails inside the tool.
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "tools/call", callParams("upper"))), nullptr);
    EXPECT_EQ(handler.PendingCount(), 0u);
}

TEST(ProtocolHandler, SlowToolTimesOut) {
    ProtocolHandler handler(testRegistry(), 150ms);
    const auto started = std::chrono::steady_clock::now();
    auto resp = handler.HandleRequest(JSONRPCRequest(int64_t{11}, "tools/call", callParams("wait")));
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::Timeout);
    EXPECT_EQ(std::get<std::string>(resp->error->find("message")->value), "Tool execution timed out after 150 ms");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(handler.PendingCount(), 0u);
}

TEST(ProtocolHandler, CancelledNotificationStopsPendingCall) {
    ProtocolHandler handler(testRegistry(), 10s);
    auto call = std::async(std::launch::async, [&]() {
        return handler.HandleRequest(JSONRPCRequest(std::string("req-42"), "tools/call", callParams("wait")));
    });
    for (int i = 0; i < 200 && handler.PendingCount() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(handler.PendingCount(), 1u);

    JSONValue::Object params;
    params["requestId"] = MakeJSON(std::string("req-42"));
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "notifications/cancelled", JSONValue(params))), nullptr);

    auto resp = call.get();
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::Cancelled);
    EXPECT_EQ(std::get<std::string>(resp->id), "req-42");
}

TEST(ProtocolHandler, CancelAllStopsEveryPendingCall) {
    ProtocolHandler handler(testRegistry(), 10s);
    auto first = std::async(std::launch::async, [&]() {
        return handler.HandleRequest(JSONRPCRequest(int64_t{1}, "tools/call", callParams("wait")));
    });
    auto second = std::async(std::launch::async, [&]() {
        return handler.HandleRequest(JSONRPCRequest(int64_t{2}, "tools/call", callParams("wait")));
    });
    for (int i = 0; i < 200 && handler.PendingCount() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    handler.CancelAll();
    EXPECT_EQ(errorCode(*first.get()), JSONRPCErrorCodes::Cancelled);
    EXPECT_EQ(errorCode(*second.get()), JSONRPCErrorCodes::Cancelled);
}

TEST(ProtocolHandler, CancellationForUnknownIdIsIgnored) {
    ProtocolHandler handler(testRegistry(), 5s);
    JSONValue::Object params;
    params["requestId"] = MakeJSON(int64_t{999});
    EXPECT_EQ(handler.HandleRequest(JSONRPCRequest(nullptr, "notifications/cancelled", JSONValue(params))), nullptr);
}
