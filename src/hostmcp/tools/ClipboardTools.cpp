//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClipboardTools.cpp
// Purpose: Clipboard text access (Windows only)
//==========================================================================================================

#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/ClipboardTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;

namespace {

#ifdef _WIN32
std::string readClipboardText() {
    if (!::OpenClipboard(nullptr)) {
        throw ToolError(ErrorKind::ToolExecution, "Cannot open clipboard");
    }
    std::string text;
    HANDLE h = ::GetClipboardData(CF_UNICODETEXT);
    if (h != nullptr) {
        if (const auto* w = static_cast<const wchar_t*>(::GlobalLock(h))) {
            int len = ::WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
            if (len > 1) {
                text.resize(static_cast<std::size_t>(len - 1));
                ::WideCharToMultiByte(CP_UTF8, 0, w, -1, text.data(), len, nullptr, nullptr);
            }
            ::GlobalUnlock(h);
        }
    }
    ::CloseClipboard();
    return text;
}
#endif

class GetClipboardTool : public ToolBase {
public:
    explicit GetClipboardTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "get_clipboard";
        definition.description = "Read the current text content of the clipboard";
        definition.category = "clipboard";
    }

    ToolResult Execute(const JSONValue&, std::stop_token) override {
        errors::throwIfError(sandbox->CheckClipboardAccess(security::ClipboardOperation::Read));
#ifdef _WIN32
        std::string text = readClipboardText();
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["length"] = JSONValue(static_cast<int64_t>(text.size()));
        return ToolResult::Ok(JSONValue(std::move(text)), std::move(metadata));
#else
        throw ToolError(ErrorKind::PlatformNotSupported, "Clipboard access is only available on Windows");
#endif
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

} // namespace

void RegisterClipboardTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox) {
    registry.Register(std::make_shared<GetClipboardTool>(std::move(sandbox)));
}

} // namespace hostmcp::tools
