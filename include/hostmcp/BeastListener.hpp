//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastListener.hpp
// Purpose: Boost.Beast accept loop and request helpers shared by the HTTP and WebSocket servers
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "hostmcp/errors/Errors.h"
#include "hostmcp/security/Authenticator.hpp"

namespace hostmcp {

class MessageProcessor;

namespace web {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;
using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

// Budget for reading one request (headers and body) or completing a TLS handshake.
constexpr std::chrono::seconds kReadTimeout{30};

// {"status":"healthy","server":"hostmcp","version":"..."}
std::string HealthBody();

// JSON-RPC error response with a null id.
std::string ErrorBody(const errors::McpError& err);

// Request target without its query string.
std::string TargetPath(beast::string_view target);

StringResponse JsonResponse(http::status status, unsigned version, std::string body, bool keepAlive);

std::optional<std::string> HeaderValue(const StringRequest& req, beast::string_view name);

//==========================================================================================================
// AuthenticateRequest
// Purpose: Authenticates with the X-API-Key header, falling back to Authorization (Bearer).
//==========================================================================================================
security::AuthResult AuthenticateRequest(const security::Authenticator& auth, const StringRequest& req);

// True for Beast HTTP parse failures (malformed header, body over the limit) as opposed to socket errors.
bool IsProtocolError(const boost::system::error_code& ec);

//==========================================================================================================
// MakeTlsServerContext
// Purpose: TLS 1.3 only server context loaded from a PEM certificate chain and private key.
// Throws:
//   boost::system::system_error when a file cannot be loaded.
//==========================================================================================================
std::unique_ptr<ssl::context> MakeTlsServerContext(const std::string& certFile, const std::string& keyFile);

net::awaitable<void> Shutdown(PlainStream& stream);
net::awaitable<void> Shutdown(TlsStream& stream);

//==========================================================================================================
// Listener
// Purpose: Owns the io_context, the acceptor and the optional TLS context. Each accepted connection runs
//          as a detached coroutine; TLS connections are handshaken before Serve().
// Notes:
//   Start() binds synchronously so a bad address or busy port is reported to the caller.
//   Port 0 binds an ephemeral port; LocalPort() reports the bound one.
//   Every message is handled on its own thread, so a long tools/call never delays ping or a
//   cancellation arriving on another request. Stop() waits for those threads.
//==========================================================================================================
class Listener {
public:
    struct Endpoint {
        std::string host{"127.0.0.1"};
        uint16_t port{0};
        std::string certFile;
        std::string keyFile;
    };

    Listener(std::string name, Endpoint endpoint);
    virtual ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void Start();
    void Stop();

    bool IsRunning() const { return running.load(); }
    uint16_t LocalPort() const { return boundPort.load(); }
    bool TlsEnabled() const { return !endpoint.certFile.empty() && !endpoint.keyFile.empty(); }
    const std::string& Name() const { return name; }

    void SetErrorHandler(std::function<void(const std::string&)> handler);

protected:
    virtual net::awaitable<void> Serve(PlainStream stream) = 0;
    virtual net::awaitable<void> Serve(TlsStream stream) = 0;

    void reportError(const std::string& msg);

    // Runs MessageProcessor::HandleMessage on a dedicated thread and resumes the caller with the reply.
    net::awaitable<std::optional<std::string>> processMessage(std::shared_ptr<MessageProcessor> processor,
                                                              std::string message,
                                                              std::string clientId);

    std::atomic<bool> running{false};

private:
    net::awaitable<void> acceptLoop();
    net::awaitable<void> runSession(tcp::socket socket);

    std::string name;
    Endpoint endpoint;
    std::unique_ptr<ssl::context> sslCtx;
    net::io_context ioc;
    tcp::acceptor acceptor;
    std::thread ioThread;
    std::atomic<uint16_t> boundPort{0};

    std::mutex messageMutex;
    std::condition_variable messagesDone;
    std::size_t activeMessages{0};

    std::mutex errorMutex;
    std::function<void(const std::string&)> errorHandler;
};

} // namespace web
} // namespace hostmcp
