//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastListener.cpp
// Purpose: Boost.Beast accept loop and request helpers shared by the HTTP and WebSocket servers
//==========================================================================================================

#include "hostmcp/BeastListener.hpp"

#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <openssl/ssl.h>

#include "hostmcp/JSONRPCTypes.h"
#include "hostmcp/MessageProcessor.h"
#include "hostmcp/Protocol.h"
#include "hostmcp/version.h"
#include "logging/Logger.h"

namespace hostmcp {
namespace web {

std::string HealthBody() {
    JSONValue::Object obj;
    obj["status"] = MakeJSON("healthy");
    obj["server"] = MakeJSON(SERVER_NAME);
    obj["version"] = MakeJSON(getVersionString());
    return SerializeJSON(JSONValue(std::move(obj)));
}

std::string ErrorBody(const errors::McpError& err) {
    return errors::makeErrorResponse(nullptr, err)->Serialize();
}

std::string TargetPath(beast::string_view target) {
    const auto q = target.find('?');
    return std::string(q == beast::string_view::npos ? target : target.substr(0, q));
}

StringResponse JsonResponse(http::status status, unsigned version, std::string body, bool keepAlive) {
    StringResponse res{status, version};
    res.set(http::field::server, SERVER_NAME);
    if (!body.empty()) {
        res.set(http::field::content_type, "application/json");
    }
    res.keep_alive(keepAlive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::optional<std::string> HeaderValue(const StringRequest& req, beast::string_view name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

security::AuthResult AuthenticateRequest(const security::Authenticator& auth, const StringRequest& req) {
    return auth.Authenticate(HeaderValue(req, "X-API-Key"), HeaderValue(req, "Authorization"));
}

bool IsProtocolError(const boost::system::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_target).category();
}

std::unique_ptr<ssl::context> MakeTlsServerContext(const std::string& certFile, const std::string& keyFile) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_server);
    // TLS 1.3 only
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ctx->set_options(
        ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    ctx->use_certificate_chain_file(certFile);
    ctx->use_private_key_file(keyFile, ssl::context::file_format::pem);
    return ctx;
}

net::awaitable<void> Shutdown(PlainStream& stream) {
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    co_return;
}

net::awaitable<void> Shutdown(TlsStream& stream) {
    boost::system::error_code ec;
    stream.next_layer().expires_after(std::chrono::seconds(5));
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("TLS shutdown: {}", ec.message());
    }
}

//==========================================================================================================
// Listener
//==========================================================================================================
Listener::Listener(std::string name, Endpoint endpoint)
    : name(std::move(name)), endpoint(std::move(endpoint)), acceptor(ioc) {}

Listener::~Listener() {
    Stop();
}

void Listener::SetErrorHandler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lk(errorMutex);
    errorHandler = std::move(handler);
}

void Listener::reportError(const std::string& msg) {
    std::function<void(const std::string&)> handler;
    {
        std::lock_guard<std::mutex> lk(errorMutex);
        handler = errorHandler;
    }
    if (handler) {
        handler(msg);
    }
}

void Listener::Start() {
    FUNC_SCOPE();
    if (running.exchange(true)) {
        throw std::runtime_error(name + " already running");
    }
    try {
        if (TlsEnabled()) {
            sslCtx = MakeTlsServerContext(endpoint.certFile, endpoint.keyFile);
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port));
        if (results.empty()) {
            throw std::runtime_error("address did not resolve");
        }
        const tcp::endpoint ep = results.begin()->endpoint();
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(net::socket_base::max_listen_connections);
        boundPort.store(acceptor.local_endpoint().port());
    } catch (const std::exception& e) {
        running.store(false);
        boost::system::error_code ec;
        acceptor.close(ec);
        throw std::runtime_error(std::format("{} failed to listen on {}:{}: {}", name, endpoint.host, endpoint.port, e.what()));
    }

    net::co_spawn(ioc, acceptLoop(), net::detached);
    ioThread = std::thread([this]() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("{} I/O loop failed: {}", name, e.what());
            reportError(name + " I/O loop failed: " + e.what());
        }
    });
    LOG_INFO("{} listening on {}://{}:{}", name, TlsEnabled() ? "https" : "http", endpoint.host, boundPort.load());
}

void Listener::Stop() {
    const bool wasRunning = running.exchange(false);
    if (!wasRunning && !ioThread.joinable()) {
        return;
    }
    ioc.stop();
    if (ioThread.joinable()) {
        if (ioThread.get_id() == std::this_thread::get_id()) {
            ioThread.detach();
        } else {
            ioThread.join();
        }
    }
    boost::system::error_code ec;
    acceptor.close(ec);
    // In-flight HandleMessage calls finish; their completions are discarded with the stopped io_context.
    {
        std::unique_lock<std::mutex> lk(messageMutex);
        messagesDone.wait(lk, [this]() { return activeMessages == 0; });
    }
    LOG_INFO("{} stopped", name);
}

net::awaitable<std::optional<std::string>> Listener::processMessage(std::shared_ptr<MessageProcessor> processor,
                                                                    std::string message,
                                                                    std::string clientId) {
    auto initiate = [this](auto handler, std::shared_ptr<MessageProcessor> processor, std::string message,
                           std::string clientId) {
        auto executor = net::get_associated_executor(handler, ioc.get_executor());
        {
            std::lock_guard<std::mutex> lk(messageMutex);
            ++activeMessages;
        }
        try {
            std::thread([this, executor, handler = std::move(handler), processor = std::move(processor),
                         message = std::move(message), clientId = std::move(clientId)]() mutable {
                std::optional<std::string> reply;
                try {
                    reply = processor->HandleMessage(message, clientId);
                } catch (const std::exception& e) {
                    LOG_ERROR("{} message handling failed: {}", name, e.what());
                    reply = ErrorBody(errors::makeError(errors::ErrorKind::Internal, e.what()));
                }
                net::post(executor, [handler = std::move(handler), reply = std::move(reply)]() mutable {
                    handler(std::move(reply));
                });
                std::unique_lock<std::mutex> lk(messageMutex);
                --activeMessages;
                std::notify_all_at_thread_exit(messagesDone, std::move(lk));
            }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("{} could not start a message thread: {}", name, e.what());
            std::lock_guard<std::mutex> lk(messageMutex);
            --activeMessages;
            throw;
        }
    };
    co_return co_await net::async_initiate<net::use_awaitable_t<>, void(std::optional<std::string>)>(
        std::move(initiate), net::use_awaitable, std::move(processor), std::move(message), std::move(clientId));
}

net::awaitable<void> Listener::acceptLoop() {
    for (;;) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (!running.load() || ec == net::error::operation_aborted) {
                co_return;
            }
            LOG_WARN("{} accept failed: {}", name, ec.message());
            continue;
        }
        net::co_spawn(ioc, runSession(std::move(socket)), net::detached);
    }
}

net::awaitable<void> Listener::runSession(tcp::socket socket) {
    try {
        if (sslCtx) {
            TlsStream stream(std::move(socket), *sslCtx);
            stream.next_layer().expires_after(kReadTimeout);
            co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await Serve(std::move(stream));
        } else {
            co_await Serve(PlainStream(std::move(socket)));
        }
    } catch (const boost::system::system_error& e) {
        if (running.load()) {
            LOG_DEBUG("{} session ended: {}", name, e.what());
        }
    } catch (const std::exception& e) {
        if (running.load()) {
            LOG_ERROR("{} session error: {}", name, e.what());
            reportError(name + " session error: " + e.what());
        }
    }
}

} // namespace web
} // namespace hostmcp
