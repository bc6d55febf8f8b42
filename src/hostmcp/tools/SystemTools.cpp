//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemTools.cpp
// Purpose: Host description, memory and disk usage tools
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <thread>
#include <unordered_map>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/SystemTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/version.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;

namespace {

double percent(uint64_t part, uint64_t whole) {
    if (whole == 0) return 0.0;
    return std::round(static_cast<double>(part) * 1000.0 / static_cast<double>(whole)) / 10.0;
}

void putBytes(JSONValue::Object& obj, const std::string& key, uint64_t bytes) {
    obj[key] = MakeJSON(static_cast<int64_t>(bytes));
    obj[key + "_human"] = MakeJSON(FormatBytes(bytes));
}

#ifndef _WIN32
// /proc/meminfo values in bytes, keyed without the trailing ':'
std::unordered_map<std::string, uint64_t> readMeminfo() {
    std::unordered_map<std::string, uint64_t> out;
    std::ifstream in("/proc/meminfo");
    std::string key;
    uint64_t value = 0;
    std::string unit;
    std::string line;
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        key = line.substr(0, colon);
        try {
            value = std::stoull(line.substr(colon + 1));
        } catch (const std::exception& e) {
            LOG_DEBUG("Skipping meminfo line '{}': {}", line, e.what());
            continue;
        }
        unit = line.find("kB") != std::string::npos ? "kB" : "";
        out[key] = unit == "kB" ? value * 1024 : value;
    }
    return out;
}
#endif

//==========================================================================================================
// get_system_info
//==========================================================================================================
class SystemInfoTool : public ToolBase {
public:
    SystemInfoTool() {
        definition.name = "get_system_info";
        definition.description = "Get information about the host operating system and hardware";
        definition.category = "system";
    }

    ToolResult Execute(const JSONValue&, std::stop_token) override {
        JSONValue::Object info;
        info["platform"] = MakeJSON(getPlatformName());
        info["cpu_count"] = MakeJSON(static_cast<int64_t>(std::thread::hardware_concurrency()));
        info["server_version"] = MakeJSON(getVersionString());
#ifdef _WIN32
        char host[MAX_COMPUTERNAME_LENGTH + 1] = {0};
        DWORD hostLen = sizeof(host);
        if (::GetComputerNameA(host, &hostLen)) {
            info["hostname"] = MakeJSON(std::string(host, hostLen));
        }
        SYSTEM_INFO si{};
        ::GetNativeSystemInfo(&si);
        switch (si.wProcessorArchitecture) {
            case PROCESSOR_ARCHITECTURE_AMD64: info["architecture"] = MakeJSON("x86_64"); break;
            case PROCESSOR_ARCHITECTURE_ARM64: info["architecture"] = MakeJSON("arm64"); break;
            case PROCESSOR_ARCHITECTURE_INTEL: info["architecture"] = MakeJSON("x86"); break;
            default: info["architecture"] = MakeJSON("unknown"); break;
        }
        info["uptime_seconds"] = MakeJSON(static_cast<int64_t>(::GetTickCount64() / 1000));
#else
        struct utsname un{};
        if (::uname(&un) == 0) {
            info["hostname"] = MakeJSON(std::string(un.nodename));
            info["os"] = MakeJSON(std::string(un.sysname));
            info["os_release"] = MakeJSON(std::string(un.release));
            info["os_version"] = MakeJSON(std::string(un.version));
            info["architecture"] = MakeJSON(std::string(un.machine));
        } else {
            LOG_WARN("uname failed");
        }
        std::ifstream up("/proc/uptime");
        double uptime = 0.0;
        if (up >> uptime) {
            info["uptime_seconds"] = MakeJSON(static_cast<int64_t>(uptime));
        }
#endif
        return ToolResult::Ok(JSONValue(std::move(info)));
    }
};

//==========================================================================================================
// get_memory_info
//==========================================================================================================
class MemoryInfoTool : public ToolBase {
public:
    MemoryInfoTool() {
        definition.name = "get_memory_info";
        definition.description = "Get physical and swap memory usage";
        definition.category = "system";
    }

    ToolResult Execute(const JSONValue&, std::stop_token) override {
        uint64_t total = 0, available = 0, swapTotal = 0, swapFree = 0;
#if defined(_WIN32)
        MEMORYSTATUSEX ms{};
        ms.dwLength = sizeof(ms);
        if (!::GlobalMemoryStatusEx(&ms)) {
            throw ToolError(ErrorKind::ToolExecution, "GlobalMemoryStatusEx failed");
        }
        total = ms.ullTotalPhys;
        available = ms.ullAvailPhys;
        swapTotal = ms.ullTotalPageFile;
        swapFree = ms.ullAvailPageFile;
#elif defined(__linux__)
        const auto mem = readMeminfo();
        auto get = [&](const char* key) -> uint64_t {
            auto it = mem.find(key);
            return it == mem.end() ? 0 : it->second;
        };
        total = get("MemTotal");
        available = mem.count("MemAvailable") ? get("MemAvailable") : get("MemFree");
        swapTotal = get("SwapTotal");
        swapFree = get("SwapFree");
        if (total == 0) {
            throw ToolError(ErrorKind::ToolExecution, "Cannot read /proc/meminfo");
        }
#else
        throw ToolError(ErrorKind::PlatformNotSupported, "Memory statistics are not available on this platform");
#endif
        const uint64_t used = total - std::min(total, available);
        const uint64_t swapUsed = swapTotal - std::min(swapTotal, swapFree);

        JSONValue::Object virt;
        putBytes(virt, "total", total);
        putBytes(virt, "available", available);
        putBytes(virt, "used", used);
        virt["percent"] = MakeJSON(percent(used, total));

        JSONValue::Object swap;
        putBytes(swap, "total", swapTotal);
        putBytes(swap, "used", swapUsed);
        putBytes(swap, "free", swapFree);
        swap["percent"] = MakeJSON(percent(swapUsed, swapTotal));

        JSONValue::Object result;
        result["virtual"] = MakeJSON(std::move(virt));
        result["swap"] = MakeJSON(std::move(swap));
        return ToolResult::Ok(JSONValue(std::move(result)));
    }
};

//==========================================================================================================
// get_disk_info
//==========================================================================================================
class DiskInfoTool : public ToolBase {
public:
    explicit DiskInfoTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "get_disk_info";
        definition.description = "Get capacity and free space of the volume containing a path";
        definition.category = "system";
        definition.parameters = {
            Param("path", "Path on the volume to inspect", ParameterType::String, false, JSONValue(defaultPath())),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const std::string raw = args::GetString(a, "path", defaultPath());
        const auto resolved = errors::valueOrThrow(sandbox->CheckFileAccess(raw, security::FileOperation::List));
        const auto info = std::filesystem::space(resolved);
        const uint64_t used = info.capacity - std::min(info.capacity, info.free);

        JSONValue::Object result;
        result["path"] = MakeJSON(resolved.string());
        putBytes(result, "total", info.capacity);
        putBytes(result, "free", info.available);
        putBytes(result, "used", used);
        result["percent_used"] = MakeJSON(percent(used, info.capacity));
        return ToolResult::Ok(JSONValue(std::move(result)));
    }

private:
    static const char* defaultPath() {
#ifdef _WIN32
        return "C:\\";
#else
        return "/";
#endif
    }

    std::shared_ptr<const security::Sandbox> sandbox;
};

} // namespace

std::string FormatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return std::format("{:.1f} {}", size, unit);
        }
        size /= 1024.0;
    }
    return std::format("{:.1f} PB", size);
}

void RegisterSystemTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox) {
    registry.Register(std::make_shared<SystemInfoTool>());
    registry.Register(std::make_shared<MemoryInfoTool>());
    registry.Register(std::make_shared<DiskInfoTool>(std::move(sandbox)));
}

} // namespace hostmcp::tools
