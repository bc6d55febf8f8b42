//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemTools.h
// Purpose: get_system_info, get_memory_info, get_disk_info
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class ToolRegistry;

void RegisterSystemTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox);

// "1.5 KB", "3.0 GB", ... (1024-based, one decimal)
std::string FormatBytes(uint64_t bytes);

} // namespace hostmcp::tools
