//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport driver interface (stdio, HTTP, WebSocket)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace hostmcp {

//==========================================================================================================
// ITransport
// Purpose: Accepts input, hands each message to MessageProcessor::HandleMessage and writes replies back.
// Notes:
//   Implementations are selected once at startup from the configured transport type.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport is accepting input (or holds the startup exception).
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops accepting input and releases resources. Partial frames are discarded.
    // Returns:
    //   A future that completes when the transport has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    // Short transport name for diagnostics ("stdio", "http", "websocket").
    virtual std::string Name() const = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Invoked once when the transport stops on its own (stdio EOF) or through Stop().
    using ClosedHandler = std::function<void()>;
    virtual void SetClosedHandler(ClosedHandler handler) = 0;
};

} // namespace hostmcp
