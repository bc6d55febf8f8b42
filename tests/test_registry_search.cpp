//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry_search.cpp
// Purpose: GoogleTests for registry search and the registry tools over an in-memory reader
//==========================================================================================================

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/RegistryTools.h"
#include "hostmcp/tools/ToolRegistry.h"

using namespace hostmcp;
using namespace hostmcp::tools;
using hostmcp::errors::ErrorKind;

namespace {

// Keys are full paths joined with '\'.
class FakeRegistry : public IRegistryReader {
public:
    void addKey(const std::string& path, std::vector<RegistryValue> values = {}) {
        keys[path] = std::move(values);
    }

    std::vector<std::string> ListSubKeys(const std::string& keyPath) override {
        requireKey(keyPath);
        std::vector<std::string> out;
        const std::string prefix = keyPath + "\\";
        for (const auto& [path, _] : keys) {
            if (path.rfind(prefix, 0) == 0 && path.find('\\', prefix.size()) == std::string::npos) {
                out.push_back(path.substr(prefix.size()));
            }
        }
        return out;
    }

    std::vector<RegistryValue> ListValues(const std::string& keyPath) override {
        requireKey(keyPath);
        return keys[keyPath];
    }

    RegistryValue ReadValue(const std::string& keyPath, const std::string& valueName) override {
        requireKey(keyPath);
        for (const auto& v : keys[keyPath]) {
            if (v.name == valueName) return v;
        }
        throw errors::ToolError(ErrorKind::ResourceNotFound, "Registry value not found: " + valueName);
    }

private:
    void requireKey(const std::string& keyPath) const {
        if (!keys.count(keyPath)) {
            throw errors::ToolError(ErrorKind::ResourceNotFound, "Registry key not found: " + keyPath);
        }
    }

    std::map<std::string, std::vector<RegistryValue>> keys;
};

RegistryValue sz(std::string name, std::string data) {
    return RegistryValue{std::move(name), "REG_SZ", JSONValue(std::move(data))};
}

std::shared_ptr<FakeRegistry> sampleRegistry() {
    auto reg = std::make_shared<FakeRegistry>();
    reg->addKey("HKCU\\Software", {sz("", "root default")});
    reg->addKey("HKCU\\Software\\Vendor", {sz("InstallDir", "C:\\Vendor"), sz("Edition", "vendor pro")});
    reg->addKey("HKCU\\Software\\Vendor\\Plugins");
    reg->addKey("HKCU\\Software\\Vendor\\Plugins\\VendorExtra", {{"Count", "REG_DWORD", JSONValue(int64_t{7})}});
    reg->addKey("HKCU\\Software\\alpha");
    return reg;
}

} // namespace

TEST(RegistrySearch, FindsKeysNamesAndDataDepthFirst) {
    auto reg = sampleRegistry();
    RegistrySearchOptions options;
    options.pattern = "VENDOR";
    options.searchData = true;
    auto found = SearchRegistry(*reg, "HKCU\\Software", options);
    ASSERT_EQ(found.hits.size(), 4u);
    EXPECT_FALSE(found.maxReached);

    EXPECT_EQ(found.hits[0].type, "key");
    EXPECT_EQ(found.hits[0].path, "HKCU\\Software\\Vendor");
    EXPECT_EQ(found.hits[1].type, "value_data");
    EXPECT_EQ(found.hits[1].name.value(), "InstallDir");
    EXPECT_EQ(found.hits[2].type, "value_data");
    EXPECT_EQ(found.hits[2].name.value(), "Edition");
    EXPECT_EQ(found.hits[3].type, "key");
    EXPECT_EQ(found.hits[3].path, "HKCU\\Software\\Vendor\\Plugins\\VendorExtra");
}

TEST(RegistrySearch, DepthAndResultLimits) {
    auto reg = sampleRegistry();
    RegistrySearchOptions options;
    options.pattern = "vendor";
    options.maxDepth = 0;
    auto shallow = SearchRegistry(*reg, "HKCU\\Software", options);
    ASSERT_EQ(shallow.hits.size(), 1u);

    options.maxDepth = 5;
    options.maxResults = 1;
    auto capped = SearchRegistry(*reg, "HKCU\\Software", options);
    ASSERT_EQ(capped.hits.size(), 1u);
    EXPECT_TRUE(capped.maxReached);
}

TEST(RegistrySearch, ValueNamesMatchAndDefaultIsNamed) {
    auto reg = sampleRegistry();
    RegistrySearchOptions options;
    options.pattern = "install";
    options.searchKeys = false;
    auto found = SearchRegistry(*reg, "HKCU\\Software", options);
    ASSERT_EQ(found.hits.size(), 1u);
    EXPECT_EQ(found.hits[0].type, "value_name");
    EXPECT_EQ(found.hits[0].path, "HKCU\\Software\\Vendor");

    options.pattern = "root default";
    options.searchValues = false;
    options.searchData = true;
    auto dflt = SearchRegistry(*reg, "HKCU\\Software", options);
    ASSERT_EQ(dflt.hits.size(), 1u);
    EXPECT_EQ(dflt.hits[0].name.value(), "(Default)");
}

TEST(RegistrySearch, MissingRootPropagates) {
    auto reg = sampleRegistry();
    RegistrySearchOptions options;
    options.pattern = "x";
    EXPECT_THROW(SearchRegistry(*reg, "HKCU\\Nope", options), errors::ToolError);
}

TEST(RegistrySearch, StopTokenCancels) {
    auto reg = sampleRegistry();
    RegistrySearchOptions options;
    options.pattern = "x";
    std::stop_source source;
    source.request_stop();
    EXPECT_THROW(SearchRegistry(*reg, "HKCU\\Software", options, source.get_token()), errors::ToolError);
}

class RegistryToolsTest : public ::testing::Test {
protected:
    void build(bool allowRegistry, std::shared_ptr<IRegistryReader> reader) {
        security::SandboxPolicy policy;
        policy.allowRegistryAccess = allowRegistry;
        registry = std::make_unique<ToolRegistry>();
        RegisterRegistryTools(*registry, std::make_shared<const security::Sandbox>(policy), std::move(reader));
    }

    ToolResult call(const std::string& tool, std::initializer_list<std::pair<const std::string, JSONValue>> members) {
        JSONValue::Object obj;
        for (const auto& [k, v] : members) obj[k] = std::make_shared<JSONValue>(v);
        return registry->ExecuteTool(tool, JSONValue(obj));
    }

    std::unique_ptr<ToolRegistry> registry;
};

TEST_F(RegistryToolsTest, PolicyIsCheckedBeforePlatform) {
    build(false, nullptr);
    auto denied = call("read_registry", {{"key_path", JSONValue("HKCU\\Software")}});
    ASSERT_FALSE(denied.success);
    EXPECT_EQ(denied.error.value(), "Permission denied: Registry access is disabled");

    build(true, nullptr);
    auto unsupported = call("read_registry", {{"key_path", JSONValue("HKCU\\Software")}});
    ASSERT_FALSE(unsupported.success);
    EXPECT_EQ(unsupported.error->rfind("Not supported", 0), 0u);

    auto sensitive = call("list_registry_keys", {{"key_path", JSONValue("HKLM\\SAM\\Domains")}});
    ASSERT_FALSE(sensitive.success);
    EXPECT_EQ(sensitive.error->rfind("Permission denied", 0), 0u);
}

TEST_F(RegistryToolsTest, ReadAndListUseReader) {
    build(true, sampleRegistry());
    auto read = call("read_registry", {{"key_path", JSONValue("HKCU\\Software\\Vendor")},
                                       {"value_name", JSONValue("Edition")}});
    ASSERT_TRUE(read.success) << read.error.value_or("");
    EXPECT_EQ(std::get<std::string>(read.data->find("value")->value), "vendor pro");
    EXPECT_EQ(std::get<std::string>(read.data->find("type")->value), "REG_SZ");

    auto dflt = call("read_registry", {{"key_path", JSONValue("HKCU\\Software")}});
    ASSERT_TRUE(dflt.success);
    EXPECT_EQ(std::get<std::string>(dflt.data->find("value_name")->value), "(Default)");

    auto list = call("list_registry_keys", {{"key_path", JSONValue("HKCU\\Software\\Vendor")}});
    ASSERT_TRUE(list.success);
    EXPECT_EQ(std::get<int64_t>(list.data->find("subkey_count")->value), 1);
    EXPECT_EQ(std::get<int64_t>(list.data->find("value_count")->value), 2);

    auto keysOnly = call("list_registry_keys", {{"key_path", JSONValue("HKCU\\Software\\Vendor")},
                                                {"include_values", JSONValue(false)}});
    ASSERT_TRUE(keysOnly.success);
    EXPECT_EQ(keysOnly.data->find("values"), nullptr);
}

TEST_F(RegistryToolsTest, SearchToolReportsMetadata) {
    build(true, sampleRegistry());
    auto r = call("search_registry", {{"key_path", JSONValue("HKCU\\Software")}, {"pattern", JSONValue("plugins")}});
    ASSERT_TRUE(r.success) << r.error.value_or("");
    const auto& hits = std::get<JSONValue::Array>(r.data->value);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(std::get<std::string>(hits[0]->find("match")->value), "Plugins");
    EXPECT_EQ(std::get<int64_t>(r.metadata.at("result_count").value), 1);
    EXPECT_FALSE(std::get<bool>(r.metadata.at("max_reached").value));

    auto bad = call("search_registry", {{"key_path", JSONValue("HKCU\\Software")}, {"pattern", JSONValue("x")},
                                        {"max_results", JSONValue(int64_t{0})}});
    ASSERT_FALSE(bad.success);
    EXPECT_EQ(bad.error->rfind("Invalid parameters", 0), 0u);
}
