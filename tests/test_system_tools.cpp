//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_system_tools.cpp
// Purpose: GoogleTests for system information, memory, disk and clipboard tools
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/ClipboardTools.h"
#include "hostmcp/tools/SystemTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "hostmcp/version.h"

using namespace hostmcp;
using namespace hostmcp::tools;

namespace {

std::unique_ptr<ToolRegistry> makeRegistry(security::SandboxPolicy policy = {}) {
    auto registry = std::make_unique<ToolRegistry>();
    auto sandbox = std::make_shared<const security::Sandbox>(std::move(policy));
    RegisterSystemTools(*registry, sandbox);
    RegisterClipboardTools(*registry, sandbox);
    return registry;
}

JSONValue noArgs() { return JSONValue(JSONValue::Object{}); }

} // namespace

TEST(FormatBytes, PicksLargestUnitBelow1024) {
    EXPECT_EQ(FormatBytes(0), "0.0 B");
    EXPECT_EQ(FormatBytes(1023), "1023.0 B");
    EXPECT_EQ(FormatBytes(1536), "1.5 KB");
    EXPECT_EQ(FormatBytes(5ull * 1024 * 1024 * 1024), "5.0 GB");
}

TEST(SystemTools, SystemInfoReportsPlatformAndVersion) {
    auto registry = makeRegistry();
    auto r = registry->ExecuteTool("get_system_info", noArgs());
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(std::get<std::string>(r.data->find("platform")->value), getPlatformName());
    EXPECT_EQ(std::get<std::string>(r.data->find("server_version")->value), getVersionString());
    EXPECT_NE(r.data->find("hostname"), nullptr);
    EXPECT_NE(r.data->find("architecture"), nullptr);
}

#if defined(__linux__) || defined(_WIN32)
TEST(SystemTools, MemoryInfoIsConsistent) {
    auto registry = makeRegistry();
    auto r = registry->ExecuteTool("get_memory_info", noArgs());
    ASSERT_TRUE(r.success) << r.error.value_or("");
    const JSONValue* virt = r.data->find("virtual");
    ASSERT_NE(virt, nullptr);
    const int64_t total = std::get<int64_t>(virt->find("total")->value);
    const int64_t used = std::get<int64_t>(virt->find("used")->value);
    EXPECT_GT(total, 0);
    EXPECT_LE(used, total);
    const double pct = std::get<double>(virt->find("percent")->value);
    EXPECT_GE(pct, 0.0);
    EXPECT_LE(pct, 100.0);
    EXPECT_NE(r.data->find("swap"), nullptr);
}
#endif

TEST(SystemTools, DiskInfoForTempDirectory) {
    auto registry = makeRegistry();
    JSONValue::Object a;
    a["path"] = MakeJSON(std::filesystem::temp_directory_path().string());
    auto r = registry->ExecuteTool("get_disk_info", JSONValue(a));
    ASSERT_TRUE(r.success) << r.error.value_or("");
    const int64_t total = std::get<int64_t>(r.data->find("total")->value);
    EXPECT_GT(total, 0);
    EXPECT_LE(std::get<int64_t>(r.data->find("free")->value), total);
    EXPECT_NE(r.data->find("total_human"), nullptr);
}

TEST(SystemTools, DiskInfoRespectsAllowList) {
    security::SandboxPolicy policy;
    policy.allowedPaths = {(std::filesystem::temp_directory_path() / "hostmcp_only_here").string()};
    auto registry = makeRegistry(policy);
    auto r = registry->ExecuteTool("get_disk_info", noArgs());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->rfind("Permission denied", 0), 0u);
}

TEST(ClipboardTools, DisabledByDefault) {
    auto registry = makeRegistry();
    auto r = registry->ExecuteTool("get_clipboard", noArgs());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.value(), "Permission denied: Clipboard read access is disabled");
}

#ifndef _WIN32
TEST(ClipboardTools, UnsupportedOffWindowsWhenAllowed) {
    security::SandboxPolicy policy;
    policy.allowClipboardAccess = true;
    auto registry = makeRegistry(policy);
    auto r = registry->ExecuteTool("get_clipboard", noArgs());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.value(), "Not supported: Clipboard access is only available on Windows");
}
#endif
