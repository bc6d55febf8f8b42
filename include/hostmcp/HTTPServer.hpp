//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "hostmcp/Transport.h"

namespace hostmcp {

class MessageProcessor;
namespace config { struct Settings; }
namespace security { class Authenticator; }

//==========================================================================================================
// HTTPServer
// Purpose: POST / carries one JSON-RPC message (or batch) per request; GET /health reports liveness.
// Notes:
//   Status codes: 200 with a reply body, 204 when there is nothing to reply (notifications), 400 for an
//   unreadable request, 401 when authentication or the request signature fails, 404 for unknown paths,
//   405 for a wrong method. JSON-RPC level errors (including rate limiting) are returned with 200.
//   Each connection carries a single request.
//==========================================================================================================
class HTTPServer : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, TLS files and request limits.
    // Fields:
    //   host/port: Bind address; port 0 picks an ephemeral port (see LocalPort()).
    //   certFile/keyFile: PEM files; HTTPS is served when both are set.
    //   maxBodyBytes: Request bodies above this are answered with 400.
    //   requireSignature: Require X-Timestamp and X-Signature headers (HMAC-SHA256) on POST /.
    //==========================================================================================================
    struct Options {
        std::string host{"127.0.0.1"};
        uint16_t port{8765};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{4 * 1024 * 1024};
        bool requireSignature{false};

        static Options FromSettings(const config::Settings& settings);
    };

    HTTPServer(const Options& opts,
               std::shared_ptr<MessageProcessor> processor,
               std::shared_ptr<const security::Authenticator> authenticator);
    ~HTTPServer() override;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once the socket listens, or holds the bind error.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context and joins the background threads.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    std::string Name() const override { return "http"; }
    void SetErrorHandler(ErrorHandler handler) override;
    void SetClosedHandler(ClosedHandler handler) override;

    // Bound port (valid after Start()).
    uint16_t LocalPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hostmcp
