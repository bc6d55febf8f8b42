//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileSystemTools.h
// Purpose: read_file, write_file, list_directory, create_directory, delete_file, get_file_info
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "hostmcp/config/Settings.h"

namespace hostmcp::security { class Sandbox; }

namespace hostmcp::tools {

class ToolRegistry;

void RegisterFileSystemTools(ToolRegistry& registry,
                             std::shared_ptr<const security::Sandbox> sandbox,
                             const config::ToolSettings& settings);

// Shell-style name match supporting '*' and '?'.
bool GlobMatch(const std::string& pattern, const std::string& name);

} // namespace hostmcp::tools
