//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.h
// Purpose: MCP method dispatch (initialize, initialized, tools/list, tools/call, cancellation, ping)
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "hostmcp/JSONRPCTypes.h"
#include "hostmcp/Protocol.h"

namespace hostmcp {

namespace tools { class ToolRegistry; }

//==========================================================================================================
// ProtocolHandler
// Purpose: Dispatcher over the closed MCP method table.
// State:
//   initialized: set by the initialized notification. No method is gated on it; out-of-order calls are
//   only logged.
//   clientCapabilities: stored by initialize.
// Notes:
//   tools/call runs the tool on its own thread with a stop_source registered in the pending table under
//   the request id. The call waits up to the tool timeout; notifications/cancelled and CancelAll request
//   stop on pending entries.
//==========================================================================================================
class ProtocolHandler {
public:
    ProtocolHandler(std::shared_ptr<tools::ToolRegistry> registry, std::chrono::milliseconds toolTimeout);
    ~ProtocolHandler();

    ProtocolHandler(const ProtocolHandler&) = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Dispatches one validated request.
    // Returns:
    //   The response, or nullptr for a notification (notifications never surface failures).
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);

    // Requests stop on every pending tool call (used by shutdown).
    void CancelAll();

    bool IsInitialized() const;
    JSONValue ClientCapabilities() const;
    std::size_t PendingCount() const;

    // Text content rendering for a tool outcome: { content:[{type:"text", text}], isError }.
    static JSONValue RenderToolResult(const ToolResult& result);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hostmcp
