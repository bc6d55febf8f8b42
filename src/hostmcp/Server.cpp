//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Composition root: security gate, tool registry, protocol handler and the selected transport
//==========================================================================================================

#include "hostmcp/Server.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "hostmcp/HTTPServer.hpp"
#include "hostmcp/MessageProcessor.h"
#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/StdioTransport.hpp"
#include "hostmcp/WebSocketServer.hpp"
#include "hostmcp/security/Authenticator.hpp"
#include "hostmcp/security/RateLimiter.hpp"
#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/version.h"
#include "logging/Logger.h"

namespace hostmcp {

namespace {

void applyLoggingSettings(const config::Settings& settings) {
    if (settings.server.transport == config::TransportType::Stdio) {
        Logger::setUseStderr(true);
    }
    Logger::setLogLevelFromString(settings.logging.level);
    if (!settings.logging.file.empty()) {
        Logger::setLogFile(settings.logging.file);
    }
}

} // namespace

class Server::Impl {
public:
    config::Settings settings;
    std::shared_ptr<security::Sandbox> sandbox;
    std::shared_ptr<security::Authenticator> authenticator;
    std::shared_ptr<security::RateLimiter> rateLimiter;
    std::shared_ptr<tools::ToolRegistry> registry;
    std::shared_ptr<ProtocolHandler> handler;
    std::shared_ptr<MessageProcessor> processor;
    std::unique_ptr<ITransport> transport;

    std::mutex stateMutex;
    std::condition_variable stoppedCv;
    bool stopped{false};
    bool started{false};

    explicit Impl(config::Settings s) : settings(std::move(s)) {
        applyLoggingSettings(settings);

        sandbox = std::make_shared<security::Sandbox>(security::SandboxPolicy::FromSettings(settings.security));

        authenticator = std::make_shared<security::Authenticator>(settings.security.requireAuth,
                                                                  settings.security.signingSecret);
        for (const auto& [key, client] : settings.security.apiKeys) {
            authenticator->AddApiKey(key, client);
        }
        if (settings.security.requireAuth && authenticator->KeyCount() == 0) {
            LOG_WARN("Authentication is required but no API keys are configured; every request will be rejected");
        }

        if (settings.security.rateLimitEnabled) {
            rateLimiter = std::make_shared<security::RateLimiter>(settings.security.rateLimitRequests,
                                                                  std::chrono::seconds(settings.security.rateLimitWindowSeconds));
        }

        registry = tools::ToolRegistry::CreateDefault(settings.tools, sandbox);
        handler = std::make_shared<ProtocolHandler>(registry, settings.tools.timeout);
        processor = std::make_shared<MessageProcessor>(handler, rateLimiter);
    }

    void markStopped() {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            stopped = true;
        }
        stoppedCv.notify_all();
    }
};

Server::Server(config::Settings settings)
    : pImpl(std::make_unique<Impl>(std::move(settings))) {
    LOG_INFO("hostmcp {} on {}: {} tools registered", getVersionString(), getPlatformName(), pImpl->registry->Size());
}

Server::~Server() {
    Stop();
}

std::unique_ptr<ITransport> Server::CreateTransport(const config::Settings& settings,
                                                    std::shared_ptr<MessageProcessor> processor,
                                                    std::shared_ptr<const security::Authenticator> authenticator) {
    switch (settings.server.transport) {
    case config::TransportType::Stdio:
        return std::make_unique<StdioTransport>(std::move(processor), settings.server.maxContentLength);
    case config::TransportType::Http:
        return std::make_unique<HTTPServer>(HTTPServer::Options::FromSettings(settings),
                                            std::move(processor), std::move(authenticator));
    case config::TransportType::WebSocket:
        return std::make_unique<WebSocketServer>(WebSocketServer::Options::FromSettings(settings),
                                                 std::move(processor), std::move(authenticator));
    }
    throw std::invalid_argument("Unknown transport type");
}

std::future<void> Server::Start() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        if (pImpl->started) {
            std::promise<void> p;
            p.set_exception(std::make_exception_ptr(std::runtime_error("Server already started")));
            return p.get_future();
        }
        pImpl->started = true;
        pImpl->stopped = false;
    }
    LOG_INFO("Starting server (transport={}, host={}, port={})",
             config::TransportTypeName(pImpl->settings.server.transport),
             pImpl->settings.server.host, pImpl->settings.server.port);

    pImpl->transport = CreateTransport(pImpl->settings, pImpl->processor, pImpl->authenticator);
    Impl* impl = pImpl.get();
    pImpl->transport->SetErrorHandler([](const std::string& err) {
        LOG_WARN("Transport error: {}", err);
    });
    pImpl->transport->SetClosedHandler([impl]() {
        LOG_INFO("Transport closed");
        impl->markStopped();
    });
    return pImpl->transport->Start();
}

void Server::Stop() {
    FUNC_SCOPE();
    if (!pImpl) {
        return;
    }
    pImpl->handler->CancelAll();
    if (pImpl->transport) {
        try {
            pImpl->transport->Stop().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Transport stop failed: {}", e.what());
        }
    }
    pImpl->markStopped();
}

void Server::Wait() {
    std::unique_lock<std::mutex> lk(pImpl->stateMutex);
    pImpl->stoppedCv.wait(lk, [this]{ return pImpl->stopped; });
}

bool Server::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->stateMutex);
    return pImpl->stoppedCv.wait_for(lk, timeout, [this]{ return pImpl->stopped; });
}

std::optional<std::string> Server::HandleMessage(const std::string& message, const std::string& clientId) {
    return pImpl->processor->HandleMessage(message, clientId);
}

const config::Settings& Server::GetSettings() const { return pImpl->settings; }
std::shared_ptr<security::Authenticator> Server::GetAuthenticator() const { return pImpl->authenticator; }
std::shared_ptr<tools::ToolRegistry> Server::GetToolRegistry() const { return pImpl->registry; }
std::shared_ptr<ProtocolHandler> Server::GetProtocolHandler() const { return pImpl->handler; }
std::shared_ptr<MessageProcessor> Server::GetMessageProcessor() const { return pImpl->processor; }
ITransport* Server::GetTransport() const { return pImpl->transport.get(); }

} // namespace hostmcp
