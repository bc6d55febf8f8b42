//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Composition root: security gate, tool registry, protocol handler and the selected transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "hostmcp/Transport.h"
#include "hostmcp/config/Settings.h"

namespace hostmcp {

class MessageProcessor;
class ProtocolHandler;
namespace security { class Authenticator; class RateLimiter; class Sandbox; }
namespace tools { class ToolRegistry; }

//==========================================================================================================
// Server
// Purpose: Builds every component from Settings and runs one transport.
// Notes:
//   Construction applies the logging settings; with the stdio transport all log output moves to stderr.
//   The transport is created by Start(), so a Server can also be driven directly through HandleMessage.
//==========================================================================================================
class Server {
public:
    explicit Server(config::Settings settings);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Creates and starts the configured transport.
    // Returns:
    //   Future that is ready once the transport accepts input (or holds the startup error).
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Cancels pending tool calls and stops the transport. Safe to call more than once.
    //==========================================================================================================
    void Stop();

    // Blocks until the transport closes (stdio EOF) or Stop() is called.
    void Wait();

    // Returns true if the server stopped within the timeout.
    bool WaitFor(std::chrono::milliseconds timeout);

    // Rate limit, parse and dispatch one raw message (see MessageProcessor::HandleMessage).
    std::optional<std::string> HandleMessage(const std::string& message,
                                             const std::string& clientId = "anonymous");

    const config::Settings& GetSettings() const;
    std::shared_ptr<security::Authenticator> GetAuthenticator() const;
    std::shared_ptr<tools::ToolRegistry> GetToolRegistry() const;
    std::shared_ptr<ProtocolHandler> GetProtocolHandler() const;
    std::shared_ptr<MessageProcessor> GetMessageProcessor() const;

    // Transport created by Start(); nullptr before.
    ITransport* GetTransport() const;

    //==========================================================================================================
    // CreateTransport
    // Purpose: Maps TransportType to StdioTransport, HTTPServer or WebSocketServer.
    //==========================================================================================================
    static std::unique_ptr<ITransport> CreateTransport(const config::Settings& settings,
                                                       std::shared_ptr<MessageProcessor> processor,
                                                       std::shared_ptr<const security::Authenticator> authenticator);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hostmcp
