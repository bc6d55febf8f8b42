//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Content-Length framed JSON-RPC over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "hostmcp/Transport.h"

namespace hostmcp {

class MessageProcessor;

//==========================================================================================================
// StdioTransport
// Purpose: Reader loop decoding framed messages in arrival order; a worker per message so a
//          notifications/cancelled frame is read while a tool runs; replies serialized through one
//          writer queue.
// Notes:
//   The reader waits with poll() on the input descriptor and a wake pipe so Stop() interrupts a blocked
//   read. EOF ends the loop cleanly and fires the closed handler. Frames above maxContentLength are
//   skipped with a warning. The descriptors are not closed by the transport.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    static constexpr const char* kClientId = "stdio";

    StdioTransport(std::shared_ptr<MessageProcessor> processor,
                   std::size_t maxContentLength,
                   int inputFd = 0,
                   int outputFd = 1);
    ~StdioTransport() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;
    std::string Name() const override { return "stdio"; }
    void SetErrorHandler(ErrorHandler handler) override;
    void SetClosedHandler(ClosedHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace hostmcp
