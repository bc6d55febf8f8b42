//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("HOSTMCP_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::atomic<bool> Logger::sUseStderr{false};
