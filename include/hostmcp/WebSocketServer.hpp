//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: JSON-RPC over WebSocket (ws:// or wss:// with TLS 1.3) using Boost.Beast
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
// WebSocketServer
// Purpose: Upgrades GET /ws and treats every text frame as one JSON-RPC message (or batch); each reply is
//          sent as one text frame. GET /health answers over plain HTTP.
// Notes:
//   Frames on one connection are dispatched concurrently so a cancellation can overtake a running tool;
//   replies are written in completion order. When authentication is required the upgrade request must
//   carry X-API-Key or Authorization; otherwise each connection gets the identity "ws_<n>".
//==========================================================================================================
class WebSocketServer : public ITransport {
public:
    static constexpr const char* kUpgradePath = "/ws";

    struct Options {
        std::string host{"127.0.0.1"};
        uint16_t port{8765};
        std::string certFile;
        std::string keyFile;
        std::size_t maxMessageBytes{4 * 1024 * 1024};

        static Options FromSettings(const config::Settings& settings);
    };

    WebSocketServer(const Options& opts,
                    std::shared_ptr<MessageProcessor> processor,
                    std::shared_ptr<const security::Authenticator> authenticator);
    ~WebSocketServer() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;
    std::string Name() const override { return "websocket"; }
    void SetErrorHandler(ErrorHandler handler) override;
    void SetClosedHandler(ClosedHandler handler) override;

    uint16_t LocalPort() const;

    // Number of currently open WebSocket sessions.
    std::size_t ConnectionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hostmcp
