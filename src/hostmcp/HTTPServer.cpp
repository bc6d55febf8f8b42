//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include "hostmcp/HTTPServer.hpp"

#include <atomic>
#include <mutex>
#include <utility>

#include "hostmcp/BeastListener.hpp"
#include "hostmcp/MessageProcessor.h"
#include "hostmcp/config/Settings.h"
#include "hostmcp/security/Authenticator.hpp"
#include "logging/Logger.h"

namespace hostmcp {

using namespace web;
using errors::ErrorKind;
using errors::makeError;

namespace {
constexpr const char* kRpcPath = "/";
constexpr const char* kHealthPath = "/health";
} // namespace

HTTPServer::Options HTTPServer::Options::FromSettings(const config::Settings& settings) {
    Options o;
    o.host = settings.server.host;
    o.port = settings.server.port;
    o.certFile = settings.server.tlsCertFile;
    o.keyFile = settings.server.tlsKeyFile;
    o.maxBodyBytes = settings.server.maxContentLength;
    o.requireSignature = settings.security.requireSignature;
    return o;
}

class HTTPServer::Impl : public Listener {
public:
    Options opts;
    std::shared_ptr<MessageProcessor> processor;
    std::shared_ptr<const security::Authenticator> authenticator;

    std::mutex closedMutex;
    ITransport::ClosedHandler closedHandler;

    Impl(const Options& o, std::shared_ptr<MessageProcessor> proc, std::shared_ptr<const security::Authenticator> auth)
        : Listener("HTTPServer", Endpoint{o.host, o.port, o.certFile, o.keyFile}),
          opts(o), processor(std::move(proc)), authenticator(std::move(auth)) {}

    ~Impl() override {
        Stop();
    }

    net::awaitable<void> Serve(PlainStream stream) override {
        co_await serveHttp(stream);
    }

    net::awaitable<void> Serve(TlsStream stream) override {
        co_await serveHttp(stream);
    }

    template <class Stream>
    net::awaitable<void> serveHttp(Stream& stream) {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);

        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (IsProtocolError(ec)) {
                LOG_WARN("HTTPServer: unreadable request: {}", ec.message());
                auto res = JsonResponse(http::status::bad_request, 11,
                                        ErrorBody(makeError(ErrorKind::ParseError, "Unreadable request: " + ec.message())),
                                        false);
                co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
                co_await Shutdown(stream);
            } else {
                LOG_DEBUG("HTTPServer: read ended: {}", ec.message());
            }
            co_return;
        }

        // Tool execution is bounded by the handler's own timeout.
        beast::get_lowest_layer(stream).expires_never();
        StringResponse res = co_await handle(parser.release());
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);
        co_await http::async_write(stream, res, net::use_awaitable);
        co_await Shutdown(stream);
    }

    //==========================================================================================================
    // Routes one request. Authentication and signature checks apply to POST / only.
    //==========================================================================================================
    net::awaitable<StringResponse> handle(StringRequest req) {
        const unsigned version = req.version();
        // One request per connection.
        const bool keepAlive = false;
        const std::string path = TargetPath(req.target());

        if (path == kHealthPath) {
            if (req.method() != http::verb::get) {
                auto res = JsonResponse(http::status::method_not_allowed, version, "{\"error\":\"GET required\"}", keepAlive);
                res.set(http::field::allow, "GET");
                co_return res;
            }
            co_return JsonResponse(http::status::ok, version, HealthBody(), keepAlive);
        }

        if (path != kRpcPath) {
            co_return JsonResponse(http::status::not_found, version, "{\"error\":\"Not found\"}", keepAlive);
        }

        if (req.method() != http::verb::post) {
            auto res = JsonResponse(http::status::method_not_allowed, version, "{\"error\":\"POST required\"}", keepAlive);
            res.set(http::field::allow, "POST");
            co_return res;
        }

        auto auth = AuthenticateRequest(*authenticator, req);
        if (!auth.authenticated) {
            const std::string reason = auth.error.value_or("Authentication required");
            LOG_WARN("HTTPServer: rejected request: {}", reason);
            auto res = JsonResponse(http::status::unauthorized, version,
                                    ErrorBody(makeError(ErrorKind::AuthenticationRequired, reason)), keepAlive);
            res.set(http::field::www_authenticate, "Bearer");
            co_return res;
        }

        if (opts.requireSignature) {
            auto verified = authenticator->VerifySignature("POST", path, req.body(),
                                                           HeaderValue(req, "X-Timestamp").value_or(""),
                                                           HeaderValue(req, "X-Signature").value_or(""));
            if (!verified.ok()) {
                LOG_WARN("HTTPServer: signature check failed: {}", verified.error().message);
                co_return JsonResponse(http::status::unauthorized, version, ErrorBody(verified.error()), keepAlive);
            }
        }

        std::string clientId = auth.clientId.value_or(security::Authenticator::kAnonymousClient);
        auto reply = co_await processMessage(processor, std::move(req.body()), std::move(clientId));
        if (!reply) {
            co_return JsonResponse(http::status::no_content, version, std::string(), keepAlive);
        }
        co_return JsonResponse(http::status::ok, version, std::move(*reply), keepAlive);
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

HTTPServer::HTTPServer(const Options& opts,
                       std::shared_ptr<MessageProcessor> processor,
                       std::shared_ptr<const security::Authenticator> authenticator)
    : pImpl(std::make_unique<Impl>(opts, std::move(processor), std::move(authenticator))) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
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

std::future<void> HTTPServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->Stop();
    pImpl->fireClosed();
    done.set_value();
    return fut;
}

bool HTTPServer::IsRunning() const {
    return pImpl->IsRunning();
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->SetErrorHandler(std::move(handler));
}

void HTTPServer::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->closedMutex);
    pImpl->closedHandler = std::move(handler);
}

uint16_t HTTPServer::LocalPort() const {
    return pImpl->LocalPort();
}

} // namespace hostmcp
