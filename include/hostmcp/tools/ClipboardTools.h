//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClipboardTools.h
// Purpose: get_clipboard
//==========================================================================================================

#pragma once

#include <memory>

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class ToolRegistry;

void RegisterClipboardTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox);

} // namespace hostmcp::tools
