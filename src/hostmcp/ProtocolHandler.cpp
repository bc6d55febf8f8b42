//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.cpp
// Purpose: MCP method dispatch and the tools/call execution path
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <format>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "hostmcp/ProtocolHandler.h"
#include "hostmcp/errors/Errors.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/version.h"
#include "logging/Logger.h"

namespace hostmcp {

using errors::ErrorKind;
using errors::McpError;
using errors::makeError;

namespace {

constexpr const char* kNoOutputText = "Operation completed successfully.";
constexpr const char* kUnknownErrorText = "Unknown error.";
constexpr std::chrono::milliseconds kWaitSlice{50};

JSONValue textContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(item);
}

ServerCapabilities defaultCapabilities() {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{};
    caps.resources = ResourcesCapability{};
    caps.prompts = PromptsCapability{};
    caps.logging = LoggingCapability{};
    return caps;
}

} // namespace

class ProtocolHandler::Impl {
public:
    using Handler = std::function<errors::Result<JSONValue>(const JSONRPCRequest&)>;

    Impl(std::shared_ptr<tools::ToolRegistry> registry, std::chrono::milliseconds toolTimeout)
        : registry(std::move(registry)), toolTimeout(toolTimeout) {
        handlers[Methods::Initialize] = [this](const JSONRPCRequest& r) { return handleInitialize(r); };
        handlers[Methods::Initialized] = [this](const JSONRPCRequest& r) { return handleInitialized(r); };
        handlers[Methods::NotificationsInitialized] = [this](const JSONRPCRequest& r) { return handleInitialized(r); };
        handlers[Methods::ListTools] = [this](const JSONRPCRequest& r) { return handleToolsList(r); };
        handlers[Methods::CallTool] = [this](const JSONRPCRequest& r) { return handleToolsCall(r); };
        handlers[Methods::Cancelled] = [this](const JSONRPCRequest& r) { return handleCancelled(r); };
        handlers[Methods::Ping] = [](const JSONRPCRequest&) -> errors::Result<JSONValue> { return JSONValue(JSONValue::Object{}); };
    }

    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCRequest& req) {
        const bool notification = req.IsNotification();
        auto it = handlers.find(req.method);
        if (it == handlers.end()) {
            if (notification) {
                LOG_WARN("Unknown notification method: {}", req.method);
                return nullptr;
            }
            return errors::makeErrorResponse(req.id, makeError(ErrorKind::MethodNotFound, "Method not found: " + req.method));
        }
        logIfOutOfOrder(req.method);

        std::optional<McpError> failure;
        std::optional<JSONValue> result;
        try {
            auto r = it->second(req);
            if (r.ok()) {
                result = std::move(r.value());
            } else {
                failure = r.error();
            }
        } catch (const errors::ToolError& e) {
            LOG_WARN("{} failed: {}", req.method, e.what());
            failure = makeError(e.kind(), e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Internal error handling {}: {}", req.method, e.what());
            failure = makeError(ErrorKind::Internal, "Internal error");
        }

        if (notification) {
            if (failure) {
                LOG_WARN("Notification {} dropped after failure: {}", req.method, failure->message);
            }
            return nullptr;
        }
        if (failure) {
            return errors::makeErrorResponse(req.id, failure.value());
        }
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result.value()));
    }

    void cancelAll() {
        std::lock_guard<std::mutex> lk(pendingMutex);
        std::size_t n = 0;
        for (auto& [id, sources] : pending) {
            for (auto& src : sources) {
                src->request_stop();
                ++n;
            }
        }
        if (n > 0) {
            LOG_INFO("Cancelled {} pending tool call(s)", n);
        }
    }

    std::shared_ptr<tools::ToolRegistry> registry;
    std::chrono::milliseconds toolTimeout;
    std::unordered_map<std::string, Handler> handlers;

    std::atomic<bool> initialized{false};
    std::atomic<bool> initializeSeen{false};
    mutable std::mutex stateMutex;
    JSONValue clientCapabilities{JSONValue::Object{}};

    // Pending tools/call stop sources by request id
    mutable std::mutex pendingMutex;
    std::unordered_map<std::string, std::vector<std::shared_ptr<std::stop_source>>> pending;
    std::atomic<uint64_t> anonymousCalls{0};

private:
    // RAII registration of a stop_source in the pending table
    struct PendingGuard {
        Impl* self;
        std::string key;
        std::shared_ptr<std::stop_source> src;
        PendingGuard(Impl* s, std::string k) : self(s), key(std::move(k)), src(std::make_shared<std::stop_source>()) {
            std::lock_guard<std::mutex> lk(self->pendingMutex);
            self->pending[key].push_back(src);
        }
        ~PendingGuard() {
            std::lock_guard<std::mutex> lk(self->pendingMutex);
            auto it = self->pending.find(key);
            if (it == self->pending.end()) return;
            auto& vec = it->second;
            vec.erase(std::remove(vec.begin(), vec.end(), src), vec.end());
            if (vec.empty()) self->pending.erase(it);
        }
    };

    void logIfOutOfOrder(const std::string& method) const {
        if (method == Methods::Initialize) {
            if (initializeSeen.load()) {
                LOG_WARN("Repeated initialize request");
            }
            return;
        }
        if (method == Methods::Initialized || method == Methods::NotificationsInitialized || method == Methods::Ping) {
            return;
        }
        if (!initialized.load()) {
            LOG_WARN("Received '{}' before initialization completed", method);
        }
    }

    errors::Result<JSONValue> handleInitialize(const JSONRPCRequest& req) {
        initializeSeen.store(true);
        JSONValue caps{JSONValue::Object{}};
        if (req.params) {
            if (const JSONValue* c = req.params->find("capabilities"); c && c->isObject()) {
                caps = *c;
            }
            if (const JSONValue* info = req.params->find("clientInfo"); info && info->isObject()) {
                const JSONValue* name = info->find("name");
                const JSONValue* version = info->find("version");
                LOG_INFO("Initialize from client {} {}",
                         name && name->isString() ? std::get<std::string>(name->value) : std::string("<unnamed>"),
                         version && version->isString() ? std::get<std::string>(version->value) : std::string(""));
            }
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            clientCapabilities = std::move(caps);
        }

        const JSONValue capabilities = SerializeServerCapabilities(defaultCapabilities());
        JSONValue::Object serverInfo;
        serverInfo["name"] = std::make_shared<JSONValue>(SERVER_NAME);
        serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());
        serverInfo["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        serverInfo["capabilities"] = std::make_shared<JSONValue>(capabilities);
        serverInfo["platform"] = std::make_shared<JSONValue>(getPlatformName());

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        result["capabilities"] = std::make_shared<JSONValue>(capabilities);
        result["serverInfo"] = std::make_shared<JSONValue>(serverInfo);
        return JSONValue(result);
    }

    errors::Result<JSONValue> handleInitialized(const JSONRPCRequest&) {
        if (!initializeSeen.load()) {
            LOG_WARN("initialized received before initialize");
        }
        initialized.store(true);
        LOG_INFO("MCP session initialized by client");
        return JSONValue(JSONValue::Object{});
    }

    errors::Result<JSONValue> handleToolsList(const JSONRPCRequest&) {
        JSONValue::Array list;
        for (const auto& def : registry->ListDefinitions()) {
            list.push_back(std::make_shared<JSONValue>(ToolDefinitionToJSON(def)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(list));
        return JSONValue(result);
    }

    errors::Result<JSONValue> handleToolsCall(const JSONRPCRequest& req) {
        if (!req.params) {
            return makeError(ErrorKind::InvalidParams, "Invalid params: missing name");
        }
        const JSONValue* nameValue = req.params->find("name");
        if (!nameValue || !nameValue->isString() || std::get<std::string>(nameValue->value).empty()) {
            return makeError(ErrorKind::InvalidParams, "Invalid params: name must be a non-empty string");
        }
        const std::string name = std::get<std::string>(nameValue->value);
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = req.params->find("arguments")) {
            if (!a->isObject()) {
                return makeError(ErrorKind::InvalidParams, "Invalid params: arguments must be an object");
            }
            arguments = *a;
        }

        const std::string key = req.IsNotification()
            ? "notification-" + std::to_string(anonymousCalls.fetch_add(1))
            : IdToString(req.id);
        PendingGuard guard(this, key);
        std::stop_token token = guard.src->get_token();

        auto promise = std::make_shared<std::promise<ToolResult>>();
        std::future<ToolResult> fut = promise->get_future();
        std::thread([reg = registry, name, arguments, token, promise]() {
            try {
                promise->set_value(reg->ExecuteTool(name, arguments, token));
            } catch (const std::exception& e) {
                LOG_ERROR("Tool '{}' raised past SafeExecute: {}", name, e.what());
                promise->set_value(ToolResult::Fail(e.what()));
            }
        }).detach();

        const auto deadline = std::chrono::steady_clock::now() + toolTimeout;
        while (true) {
            if (token.stop_requested()) {
                LOG_INFO("tools/call '{}' (id={}) cancelled", name, key);
                return makeError(ErrorKind::Cancelled, "Request cancelled");
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                guard.src->request_stop();
                LOG_WARN("tools/call '{}' timed out after {} ms", name, toolTimeout.count());
                return makeError(ErrorKind::Timeout, std::format("Tool execution timed out after {} ms", toolTimeout.count()));
            }
            const auto slice = std::min<std::chrono::steady_clock::duration>(kWaitSlice, deadline - now);
            if (fut.wait_for(slice) == std::future_status::ready) {
                break;
            }
        }
        ToolResult tr = fut.get();
        if (!tr.success) {
            LOG_DEBUG("tools/call '{}' failed: {}", name, tr.error.value_or(kUnknownErrorText));
        }
        return ProtocolHandler::RenderToolResult(tr);
    }

    errors::Result<JSONValue> handleCancelled(const JSONRPCRequest& req) {
        const JSONValue* rid = req.params ? req.params->find("requestId") : nullptr;
        std::string key;
        if (rid && rid->isString()) {
            key = std::get<std::string>(rid->value);
        } else if (rid && rid->isInt()) {
            key = std::to_string(std::get<int64_t>(rid->value));
        } else {
            LOG_WARN("Cancellation notification missing requestId");
            return JSONValue(JSONValue::Object{});
        }
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = pending.find(key);
        if (it == pending.end()) {
            LOG_DEBUG("Cancellation for id={} ignored: no pending call", key);
            return JSONValue(JSONValue::Object{});
        }
        for (auto& src : it->second) {
            src->request_stop();
        }
        LOG_INFO("Cancellation received for id={}", key);
        return JSONValue(JSONValue::Object{});
    }
};

ProtocolHandler::ProtocolHandler(std::shared_ptr<tools::ToolRegistry> registry, std::chrono::milliseconds toolTimeout)
    : pImpl(std::make_unique<Impl>(std::move(registry), toolTimeout)) {}

ProtocolHandler::~ProtocolHandler() {
    pImpl->cancelAll();
}

std::unique_ptr<JSONRPCResponse> ProtocolHandler::HandleRequest(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->dispatch(request);
}

void ProtocolHandler::CancelAll() {
    pImpl->cancelAll();
}

bool ProtocolHandler::IsInitialized() const {
    return pImpl->initialized.load();
}

JSONValue ProtocolHandler::ClientCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->clientCapabilities;
}

std::size_t ProtocolHandler::PendingCount() const {
    std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
    std::size_t n = 0;
    for (const auto& [id, sources] : pImpl->pending) n += sources.size();
    return n;
}

JSONValue ProtocolHandler::RenderToolResult(const ToolResult& result) {
    CallToolResult out;
    if (result.success) {
        std::string text;
        if (!result.data.has_value() || result.data->isNull()) {
            text = kNoOutputText;
        } else if (result.data->isString()) {
            text = std::get<std::string>(result.data->value);
        } else {
            text = SerializeJSONPretty(result.data.value());
        }
        out.content.push_back(textContent(text));
        out.isError = false;
    } else {
        out.content.push_back(textContent(result.error.value_or(kUnknownErrorText)));
        out.isError = true;
    }
    return SerializeCallToolResult(out);
}

} // namespace hostmcp
