//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_server.cpp
// Purpose: GoogleTests for the HTTP transport: routing, authentication, signatures and JSON-RPC replies
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "hostmcp/HTTPServer.hpp"
#include "hostmcp/JSONRPCTypes.h"
#include "hostmcp/MessageProcessor.h"
#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/security/Authenticator.hpp"
#include "hostmcp/tools/ToolRegistry.h"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

using namespace hostmcp;
using namespace std::chrono_literals;

namespace {

using Headers = std::map<std::string, std::string>;

//==========================================================================================================
// Sends one HTTP request and returns the full response.
// Args:
//   verb/target/body: Request line and payload.
//   headers: Extra header fields (e.g. X-API-Key).
//==========================================================================================================
http::response<http::string_body> httpRequest(uint16_t port, http::verb verb, const std::string& target,
                                              const std::string& body = std::string(),
                                              const Headers& headers = {}) {
    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return res;
}

//==========================================================================================================
// Writes raw bytes and returns the server's response.
//==========================================================================================================
http::response<http::string_body> rawExchange(uint16_t port, const std::string& bytes) {
    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));
    net::write(stream, net::buffer(bytes));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
}

// Runs until cancelled or timed out.
class WaitTool : public tools::ToolBase {
public:
    WaitTool() { definition.name = "wait"; definition.description = "Waits for cancellation"; }
    ToolResult Execute(const JSONValue&, std::stop_token stop) override {
        while (true) {
            tools::ThrowIfStopRequested(stop);
            std::this_thread::sleep_for(10ms);
        }
    }
};

class HTTPServerTest : public ::testing::Test {
protected:
    void start(std::shared_ptr<const security::Authenticator> auth, HTTPServer::Options opts = {},
               std::shared_ptr<tools::ToolRegistry> registry = std::make_shared<tools::ToolRegistry>()) {
        opts.port = 0;
        handler = std::make_shared<ProtocolHandler>(std::move(registry), 10s);
        server = std::make_unique<HTTPServer>(opts, std::make_shared<MessageProcessor>(handler, nullptr), std::move(auth));
        server->Start().get();
        port = server->LocalPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) {
            server->Stop().get();
        }
    }

    static std::shared_ptr<const security::Authenticator> openAuth() {
        return std::make_shared<const security::Authenticator>(false);
    }

    std::shared_ptr<ProtocolHandler> handler;
    std::unique_ptr<HTTPServer> server;
    uint16_t port{0};
};

const std::string kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

} // namespace

TEST_F(HTTPServerTest, HealthEndpoint) {
    start(openAuth());
    EXPECT_TRUE(server->IsRunning());
    auto res = httpRequest(port, http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    auto doc = ParseJSON(res.body());
    EXPECT_EQ(std::get<std::string>(doc.find("status")->value), "healthy");
    EXPECT_EQ(std::get<std::string>(doc.find("server")->value), "hostmcp");

    auto post = httpRequest(port, http::verb::post, "/health", "{}");
    EXPECT_EQ(post.result(), http::status::method_not_allowed);
    EXPECT_EQ(post[http::field::allow], "GET");
}

TEST_F(HTTPServerTest, RoutingErrors) {
    start(openAuth());
    auto missing = httpRequest(port, http::verb::post, "/rpc", kPing);
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(missing.body(), "{\"error\":\"Not found\"}");

    auto get = httpRequest(port, http::verb::get, "/");
    EXPECT_EQ(get.result(), http::status::method_not_allowed);
    EXPECT_EQ(get.body(), "{\"error\":\"POST required\"}");
}

TEST_F(HTTPServerTest, PingAndToolsList) {
    start(openAuth());
    auto res = httpRequest(port, http::verb::post, "/", kPing);
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto doc = ParseJSON(res.body());
    EXPECT_EQ(std::get<int64_t>(doc.find("id")->value), 1);
    EXPECT_TRUE(doc.find("result")->isObject());

    auto list = httpRequest(port, http::verb::post, "/?trace=1", R"({"jsonrpc":"2.0","id":"t","method":"tools/list"})");
    ASSERT_EQ(list.result(), http::status::ok);
    EXPECT_TRUE(ParseJSON(list.body()).find("result")->find("tools")->isArray());
}

TEST_F(HTTPServerTest, NotificationGetsNoContent) {
    start(openAuth());
    auto res = httpRequest(port, http::verb::post, "/", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HTTPServerTest, MalformedBodyIsJsonRpcParseError) {
    start(openAuth());
    auto res = httpRequest(port, http::verb::post, "/", "{broken");
    ASSERT_EQ(res.result(), http::status::ok);
    auto doc = ParseJSON(res.body());
    EXPECT_EQ(std::get<int64_t>(doc.find("error")->find("code")->value), JSONRPCErrorCodes::ParseError);
}

TEST_F(HTTPServerTest, UnreadableRequestIsBadRequest) {
    start(openAuth());
    auto res = rawExchange(port, "GARBAGE\r\n\r\n");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HTTPServerTest, OversizedBodyIsBadRequest) {
    HTTPServer::Options opts;
    opts.maxBodyBytes = 16;
    start(openAuth(), opts);
    auto res = httpRequest(port, http::verb::post, "/", kPing);
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HTTPServerTest, AuthenticationRequired) {
    auto auth = std::make_shared<security::Authenticator>(true);
    auth->AddApiKey("k-123", "alice");
    start(auth);

    auto anonymous = httpRequest(port, http::verb::post, "/", kPing);
    EXPECT_EQ(anonymous.result(), http::status::unauthorized);
    EXPECT_EQ(anonymous[http::field::www_authenticate], "Bearer");
    auto doc = ParseJSON(anonymous.body());
    EXPECT_EQ(std::get<int64_t>(doc.find("error")->find("code")->value), JSONRPCErrorCodes::AuthenticationRequired);

    auto wrong = httpRequest(port, http::verb::post, "/", kPing, {{"X-API-Key", "nope"}});
    EXPECT_EQ(wrong.result(), http::status::unauthorized);

    auto apiKey = httpRequest(port, http::verb::post, "/", kPing, {{"X-API-Key", "k-123"}});
    EXPECT_EQ(apiKey.result(), http::status::ok);

    auto bearer = httpRequest(port, http::verb::post, "/", kPing, {{"Authorization", "Bearer k-123"}});
    EXPECT_EQ(bearer.result(), http::status::ok);

    // Health stays public.
    EXPECT_EQ(httpRequest(port, http::verb::get, "/health").result(), http::status::ok);
}

TEST_F(HTTPServerTest, SignedRequests) {
    HTTPServer::Options opts;
    opts.requireSignature = true;
    start(std::make_shared<const security::Authenticator>(false, "shh"), opts);

    auto noHeaders = httpRequest(port, http::verb::post, "/", kPing);
    EXPECT_EQ(noHeaders.result(), http::status::unauthorized);

    const std::string ts = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
    const std::string sig = security::Authenticator::ComputeSignature("shh", "POST", "/", ts, kPing);

    auto bad = httpRequest(port, http::verb::post, "/", kPing, {{"X-Timestamp", ts}, {"X-Signature", std::string(64, '0')}});
    EXPECT_EQ(bad.result(), http::status::unauthorized);
    auto badDoc = ParseJSON(bad.body());
    EXPECT_EQ(std::get<std::string>(badDoc.find("error")->find("message")->value), "Invalid signature");

    auto good = httpRequest(port, http::verb::post, "/?x=1", kPing, {{"X-Timestamp", ts}, {"X-Signature", sig}});
    EXPECT_EQ(good.result(), http::status::ok);
}

TEST_F(HTTPServerTest, StopReleasesPortAndFiresClosed) {
    start(openAuth());
    bool closed = false;
    server->SetClosedHandler([&closed]() { closed = true; });
    server->Stop().get();
    EXPECT_FALSE(server->IsRunning());
    EXPECT_TRUE(closed);
    server.reset();
}

TEST_F(HTTPServerTest, PingAndCancelStayResponsiveWhileToolsRun) {
    auto registry = std::make_shared<tools::ToolRegistry>();
    registry->Register(std::make_shared<WaitTool>());
    start(openAuth(), {}, registry);

    constexpr int kCalls = 6;
    std::vector<std::future<http::response<http::string_body>>> calls;
    for (int i = 0; i < kCalls; ++i) {
        const std::string body = R"({"jsonrpc":"2.0","id":)" + std::to_string(100 + i) +
                                 R"(,"method":"tools/call","params":{"name":"wait","arguments":{}}})";
        calls.push_back(std::async(std::launch::async, [this, body]() {
            return httpRequest(port, http::verb::post, "/", body);
        }));
    }
    for (int i = 0; i < 400 && handler->PendingCount() < static_cast<std::size_t>(kCalls); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(handler->PendingCount(), static_cast<std::size_t>(kCalls));

    const auto started = std::chrono::steady_clock::now();
    auto ping = httpRequest(port, http::verb::post, "/", kPing);
    EXPECT_EQ(ping.result(), http::status::ok);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);

    for (int i = 0; i < kCalls; ++i) {
        const std::string cancel = R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":)" +
                                   std::to_string(100 + i) + "}}";
        EXPECT_EQ(httpRequest(port, http::verb::post, "/", cancel).result(), http::status::no_content);
    }
    for (auto& call : calls) {
        auto doc = ParseJSON(call.get().body());
        EXPECT_EQ(std::get<int64_t>(doc.find("error")->find("code")->value), JSONRPCErrorCodes::Cancelled);
    }
    EXPECT_EQ(handler->PendingCount(), 0u);
}
