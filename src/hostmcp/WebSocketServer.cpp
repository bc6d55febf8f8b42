//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.cpp
// Purpose: JSON-RPC over WebSocket (ws:// or wss:// with TLS 1.3) using Boost.Beast
//==========================================================================================================

#include "hostmcp/WebSocketServer.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <utility>

#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "hostmcp/BeastListener.hpp"
#include "hostmcp/MessageProcessor.h"
#include "hostmcp/Protocol.h"
#include "hostmcp/config/Settings.h"
#include "hostmcp/security/Authenticator.hpp"
#include "logging/Logger.h"

namespace hostmcp {

using namespace web;
namespace websocket = boost::beast::websocket;
using errors::ErrorKind;
using errors::makeError;

namespace {

constexpr const char* kHealthPath = "/health";
constexpr std::size_t kUpgradeRequestLimit = 64 * 1024;

//==========================================================================================================
// Per-connection state. Only touched from the I/O thread.
// The writer coroutine sleeps on `wakeup` (expiry never) and is woken by cancel_one().
//==========================================================================================================
template <class Stream>
struct WsConnection {
    websocket::stream<Stream> ws;
    net::steady_timer wakeup;
    std::deque<std::string> outbox;
    bool closing{false};

    explicit WsConnection(Stream&& s)
        : ws(std::move(s)), wakeup(ws.get_executor(), net::steady_timer::time_point::max()) {}
};

} // namespace

WebSocketServer::Options WebSocketServer::Options::FromSettings(const config::Settings& settings) {
    Options o;
    o.host = settings.server.host;
    o.port = settings.server.port;
    o.certFile = settings.server.tlsCertFile;
    o.keyFile = settings.server.tlsKeyFile;
    o.maxMessageBytes = settings.server.maxContentLength;
    return o;
}

class WebSocketServer::Impl : public Listener {
public:
    Options opts;
    std::shared_ptr<MessageProcessor> processor;
    std::shared_ptr<const security::Authenticator> authenticator;
    std::atomic<uint64_t> connectionCounter{0};
    std::atomic<std::size_t> openConnections{0};

    std::mutex closedMutex;
    ITransport::ClosedHandler closedHandler;

    Impl(const Options& o, std::shared_ptr<MessageProcessor> proc, std::shared_ptr<const security::Authenticator> auth)
        : Listener("WebSocketServer", Endpoint{o.host, o.port, o.certFile, o.keyFile}),
          opts(o), processor(std::move(proc)), authenticator(std::move(auth)) {}

    ~Impl() override {
        Stop();
    }

    net::awaitable<void> Serve(PlainStream stream) override {
        co_await serveConnection(stream);
    }

    net::awaitable<void> Serve(TlsStream stream) override {
        co_await serveConnection(stream);
    }

    template <class Stream>
    net::awaitable<void> reply(Stream& stream, StringResponse res) {
        boost::system::error_code ec;
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("WebSocketServer: response write failed: {}", ec.message());
        }
        co_await Shutdown(stream);
    }

    //==========================================================================================================
    // Reads the opening HTTP request, answers /health and rejections directly, otherwise upgrades.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> serveConnection(Stream& stream) {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(kUpgradeRequestLimit);
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);

        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (IsProtocolError(ec)) {
                LOG_WARN("WebSocketServer: unreadable upgrade request: {}", ec.message());
                co_await reply(stream, JsonResponse(http::status::bad_request, 11,
                                                    ErrorBody(makeError(ErrorKind::ParseError, "Unreadable request: " + ec.message())),
                                                    false));
            } else {
                LOG_DEBUG("WebSocketServer: read ended: {}", ec.message());
            }
            co_return;
        }

        StringRequest req = parser.release();
        const unsigned version = req.version();
        const std::string path = TargetPath(req.target());

        if (path == kHealthPath) {
            co_await reply(stream, JsonResponse(http::status::ok, version, HealthBody(), false));
            co_return;
        }
        if (path != kUpgradePath) {
            co_await reply(stream, JsonResponse(http::status::not_found, version, "{\"error\":\"Not found\"}", false));
            co_return;
        }
        if (!websocket::is_upgrade(req)) {
            auto res = JsonResponse(http::status::upgrade_required, version, "{\"error\":\"WebSocket upgrade required\"}", false);
            res.set(http::field::upgrade, "websocket");
            co_await reply(stream, std::move(res));
            co_return;
        }

        std::string clientId;
        if (authenticator->RequiresAuth()) {
            auto auth = AuthenticateRequest(*authenticator, req);
            if (!auth.authenticated) {
                const std::string reason = auth.error.value_or("Authentication required");
                LOG_WARN("WebSocketServer: rejected upgrade: {}", reason);
                auto res = JsonResponse(http::status::unauthorized, version,
                                        ErrorBody(makeError(ErrorKind::AuthenticationRequired, reason)), false);
                res.set(http::field::www_authenticate, "Bearer");
                co_await reply(stream, std::move(res));
                co_return;
            }
            clientId = auth.clientId.value_or(security::Authenticator::kAnonymousClient);
        } else {
            clientId = "ws_" + std::to_string(++connectionCounter);
        }

        auto conn = std::make_shared<WsConnection<Stream>>(std::move(stream));
        beast::get_lowest_layer(conn->ws).expires_never();
        conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        conn->ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, SERVER_NAME);
        }));
        conn->ws.read_message_max(opts.maxMessageBytes);
        conn->ws.text(true);
        co_await conn->ws.async_accept(req, net::use_awaitable);

        ++openConnections;
        LOG_INFO("WebSocketServer: client {} connected", clientId);
        auto executor = co_await net::this_coro::executor;
        net::co_spawn(executor, writerLoop(conn), net::detached);

        for (;;) {
            beast::flat_buffer frame;
            co_await conn->ws.async_read(frame, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec == websocket::error::closed) {
                    LOG_INFO("WebSocketServer: client {} closed the connection", clientId);
                } else {
                    LOG_DEBUG("WebSocketServer: client {} read ended: {}", clientId, ec.message());
                }
                break;
            }
            if (!conn->ws.got_text()) {
                LOG_WARN("WebSocketServer: ignoring binary frame from {}", clientId);
                continue;
            }
            net::co_spawn(executor, dispatch(conn, beast::buffers_to_string(frame.data()), clientId), net::detached);
        }

        conn->closing = true;
        conn->wakeup.cancel();
        if (!authenticator->RequiresAuth()) {
            // ws_N ids never come back once the connection is gone
            processor->ForgetClient(clientId);
        }
        --openConnections;
    }

    template <class Stream>
    net::awaitable<void> dispatch(std::shared_ptr<WsConnection<Stream>> conn, std::string text, std::string clientId) {
        try {
            auto out = co_await processMessage(processor, std::move(text), std::move(clientId));
            if (out && !conn->closing) {
                conn->outbox.push_back(std::move(*out));
                conn->wakeup.cancel_one();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer: message handling failed: {}", e.what());
        }
    }

    template <class Stream>
    net::awaitable<void> writerLoop(std::shared_ptr<WsConnection<Stream>> conn) {
        try {
            while (!conn->closing) {
                if (conn->outbox.empty()) {
                    boost::system::error_code ec;
                    co_await conn->wakeup.async_wait(net::redirect_error(net::use_awaitable, ec));
                    continue;
                }
                std::string msg = std::move(conn->outbox.front());
                conn->outbox.pop_front();
                co_await conn->ws.async_write(net::buffer(msg), net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("WebSocketServer: writer stopped: {}", e.what());
        }
    }

    void fireClosed() {
        ITransport::ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lk(closedMutex);
            handler = std::move(closedHandler);
        }
        if (handler) {
            handler();
        }
    }
};

WebSocketServer::WebSocketServer(const Options& opts,
                                 std::shared_ptr<MessageProcessor> processor,
                                 std::shared_ptr<const security::Authenticator> authenticator)
    : pImpl(std::make_unique<Impl>(opts, std::move(processor), std::move(authenticator))) {}

WebSocketServer::~WebSocketServer() = default;

std::future<void> WebSocketServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->Start();
        ready.set_value();
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->Stop();
    pImpl->fireClosed();
    done.set_value();
    return fut;
}

bool WebSocketServer::IsRunning() const {
    return pImpl->IsRunning();
}

void WebSocketServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->SetErrorHandler(std::move(handler));
}

void WebSocketServer::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->closedMutex);
    pImpl->closedHandler = std::move(handler);
}

uint16_t WebSocketServer::LocalPort() const {
    return pImpl->LocalPort();
}

std::size_t WebSocketServer::ConnectionCount() const {
    return pImpl->openConnections.load();
}

} // namespace hostmcp
