//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, std::format messages, and stdio-safe output.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Defaults to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL" || s == "CRITICAL") return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {} (format: {})", e.what(), fmt);
        }
        log(level, buffer, file, line);
    }

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& level) {
        sLogLevel = levelFromString(level);
    }

    //==========================================================================================================
    // setUseStderr
    // Purpose: Route console output to stderr. Required whenever stdout carries framed JSON-RPC traffic.
    //==========================================================================================================
    static void setUseStderr(bool enabled) {
        sUseStderr.store(enabled);
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        if (filePath.empty()) {
            return;
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        auto now = std::chrono::system_clock::now();
        std::time_t now_time = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
#ifdef _WIN32
        ::localtime_s(&buf, &now_time);
#else
        ::localtime_r(&now_time, &buf);
#endif
        sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
        sLogFile.flush();
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        // Optional ANSI colorization for LABEL only controlled by HOSTMCP_LOG_COLOR
        static bool colorEnabled = [](){
            return ParseBoolFlag(GetEnvOrDefault("HOSTMCP_LOG_COLOR", "1")).value_or(true);
        }();
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
                labelColor = "\033[38;5;88m";
            } else if (::strncmp(level, "WARN", 4) == 0) {
                labelColor = "\033[33m";
            } else {
                labelColor = "\033[35m";
            }
        }
        if (*labelColor) {
            oss << "[" << labelColor << level << reset << "] " << basename(file) << ":" << line << ": " << msg << '\n';
        } else {
            oss << "[" << level << "] " << basename(file) << ":" << line << ": " << msg << '\n';
        }

        const std::string logMessage = oss.str();
        static bool envStderr = [](){
            return ParseBoolFlag(GetEnvOrDefault("HOSTMCP_STDIO_MODE", "0")).value_or(false);
        }();
        if (envStderr || sUseStderr.load()) {
            std::cerr << logMessage << std::flush;
        } else {
            std::cout << logMessage << std::flush;
        }

        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static const char* basename(const char* path) {
        const char* slash = std::strrchr(path, '/');
#ifdef _WIN32
        const char* bslash = std::strrchr(path, '\\');
        if (bslash && (!slash || bslash > slash)) slash = bslash;
#endif
        return slash ? slash + 1 : path;
    }

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static std::atomic<bool> sUseStderr;
};

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
