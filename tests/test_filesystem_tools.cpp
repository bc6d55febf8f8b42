//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_filesystem_tools.cpp
// Purpose: GoogleTests for the filesystem tools running inside a sandboxed temp directory
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/FileSystemTools.h"
#include "hostmcp/tools/ToolRegistry.h"

namespace fs = std::filesystem;
using namespace hostmcp;
using namespace hostmcp::tools;

namespace {

class FileSystemToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::weakly_canonical(fs::temp_directory_path()) / (std::string("hostmcp_fs_") + info->name());
        fs::remove_all(root);
        fs::create_directories(root);

        security::SandboxPolicy policy;
        policy.allowedPaths = {root.string()};
        policy.blockedPaths = {(root / "blocked").string()};
        config::ToolSettings settings;
        settings.maxFileReadBytes = 16;
        registry = std::make_unique<ToolRegistry>();
        RegisterFileSystemTools(*registry, std::make_shared<const security::Sandbox>(policy), settings);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    ToolResult call(const std::string& tool, std::initializer_list<std::pair<const std::string, JSONValue>> members) {
        JSONValue::Object obj;
        for (const auto& [k, v] : members) obj[k] = std::make_shared<JSONValue>(v);
        return registry->ExecuteTool(tool, JSONValue(obj));
    }

    void writeRaw(const fs::path& p, const std::string& content) {
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
    }

    static std::string readRaw(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path root;
    std::unique_ptr<ToolRegistry> registry;
};

} // namespace

TEST_F(FileSystemToolsTest, WriteThenReadAndAppend) {
    const auto file = root / "nested" / "note.txt";
    auto w = call("write_file", {{"path", JSONValue(file.string())}, {"content", JSONValue("hello")}});
    ASSERT_TRUE(w.success) << w.error.value_or("");
    EXPECT_EQ(std::get<int64_t>(w.metadata.at("bytes_written").value), 5);
    EXPECT_EQ(std::get<std::string>(w.metadata.at("mode").value), "write");

    auto a = call("write_file", {{"path", JSONValue(file.string())}, {"content", JSONValue(" world")},
                                 {"append", JSONValue(true)}});
    ASSERT_TRUE(a.success);
    EXPECT_EQ(readRaw(file), "hello world");

    auto r = call("read_file", {{"path", JSONValue(file.string())}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(std::get<std::string>(r.data->value), "hello world");
    EXPECT_FALSE(std::get<bool>(r.metadata.at("truncated").value));
}

TEST_F(FileSystemToolsTest, ReadHonoursOffsetLimitAndCap) {
    writeRaw(root / "big.txt", "0123456789abcdefghijklmnop");
    auto slice = call("read_file", {{"path", JSONValue((root / "big.txt").string())},
                                    {"offset", JSONValue(int64_t{2})}, {"limit", JSONValue(int64_t{3})}});
    ASSERT_TRUE(slice.success);
    EXPECT_EQ(std::get<std::string>(slice.data->value), "234");

    auto capped = call("read_file", {{"path", JSONValue((root / "big.txt").string())}});
    ASSERT_TRUE(capped.success);
    EXPECT_EQ(std::get<std::string>(capped.data->value), "0123456789abcdef");
    EXPECT_TRUE(std::get<bool>(capped.metadata.at("truncated").value));
}

TEST_F(FileSystemToolsTest, BinaryContentIsSummarised) {
    writeRaw(root / "blob.bin", std::string("\xff\xfe\x00\x01", 4));
    auto r = call("read_file", {{"path", JSONValue((root / "blob.bin").string())}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(std::get<std::string>(r.data->value), "<binary file, 4 bytes>");
    EXPECT_TRUE(std::get<bool>(r.metadata.at("binary").value));
}

TEST_F(FileSystemToolsTest, ReadErrorsAreClassified) {
    auto missing = call("read_file", {{"path", JSONValue((root / "none.txt").string())}});
    ASSERT_FALSE(missing.success);
    EXPECT_EQ(missing.error->rfind("Not found: File not found", 0), 0u);

    auto dir = call("read_file", {{"path", JSONValue(root.string())}});
    ASSERT_FALSE(dir.success);
    EXPECT_EQ(dir.error->rfind("Invalid parameters: Path is not a file", 0), 0u);

    auto enc = call("read_file", {{"path", JSONValue((root / "x").string())}, {"encoding", JSONValue("latin-1")}});
    ASSERT_FALSE(enc.success);
    EXPECT_NE(enc.error->find("Unsupported encoding"), std::string::npos);
}

TEST_F(FileSystemToolsTest, SandboxRejectsOutsideBlockedAndTraversal) {
    auto outside = call("read_file", {{"path", JSONValue((root.parent_path() / "elsewhere.txt").string())}});
    ASSERT_FALSE(outside.success);
    EXPECT_EQ(outside.error->rfind("Permission denied", 0), 0u);

    auto blocked = call("write_file", {{"path", JSONValue((root / "blocked" / "f").string())}, {"content", JSONValue("x")}});
    ASSERT_FALSE(blocked.success);
    EXPECT_FALSE(fs::exists(root / "blocked" / "f"));

    auto traversal = call("read_file", {{"path", JSONValue(root.string() + "/a/../b")}});
    ASSERT_FALSE(traversal.success);
    EXPECT_NE(traversal.error->find("Path traversal detected"), std::string::npos);
}

TEST_F(FileSystemToolsTest, ListDirectoryOrdersAndFilters) {
    writeRaw(root / "b.txt", "b");
    writeRaw(root / "A.log", "a");
    writeRaw(root / ".hidden", "h");
    fs::create_directories(root / "zdir" / "inner");
    writeRaw(root / "zdir" / "inner" / "c.txt", "c");

    auto r = call("list_directory", {{"path", JSONValue(root.string())}});
    ASSERT_TRUE(r.success);
    const auto& entries = std::get<JSONValue::Array>(r.data->value);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(std::get<std::string>(entries[0]->find("name")->value), "zdir");
    EXPECT_EQ(std::get<std::string>(entries[0]->find("type")->value), "directory");
    EXPECT_EQ(std::get<std::string>(entries[1]->find("name")->value), "A.log");
    EXPECT_EQ(std::get<std::string>(entries[2]->find("name")->value), "b.txt");

    auto filtered = call("list_directory", {{"path", JSONValue(root.string())}, {"pattern", JSONValue("*.txt")},
                                            {"recursive", JSONValue(true)}});
    ASSERT_TRUE(filtered.success);
    EXPECT_EQ(std::get<int64_t>(filtered.metadata.at("count").value), 2);

    auto hidden = call("list_directory", {{"path", JSONValue(root.string())}, {"include_hidden", JSONValue(true)}});
    EXPECT_EQ(std::get<int64_t>(hidden.metadata.at("count").value), 4);
}

TEST_F(FileSystemToolsTest, RecursiveListingSkipsBlockedSubtree) {
    writeRaw(root / "open.txt", "o");
    writeRaw(root / "blocked" / "keys.txt", "k");
    writeRaw(root / "blocked" / "deeper" / "more.txt", "m");

    for (bool recursive : {false, true}) {
        auto r = call("list_directory", {{"path", JSONValue(root.string())}, {"recursive", JSONValue(recursive)}});
        ASSERT_TRUE(r.success) << r.error.value_or("");
        const auto& entries = std::get<JSONValue::Array>(r.data->value);
        ASSERT_EQ(entries.size(), 1u) << recursive;
        EXPECT_EQ(std::get<std::string>(entries[0]->find("name")->value), "open.txt");
    }

    auto direct = call("list_directory", {{"path", JSONValue((root / "blocked").string())}});
    ASSERT_FALSE(direct.success);
    EXPECT_EQ(direct.error->rfind("Permission denied", 0), 0u);
}

#ifndef _WIN32
TEST_F(FileSystemToolsTest, RecursiveListingSkipsSymlinkIntoBlockedSubtree) {
    writeRaw(root / "blocked" / "keys.txt", "k");
    fs::create_directories(root / "pub");
    fs::create_symlink(root / "blocked" / "keys.txt", root / "pub" / "alias.txt");
    writeRaw(root / "pub" / "plain.txt", "p");

    auto r = call("list_directory", {{"path", JSONValue(root.string())}, {"recursive", JSONValue(true)}});
    ASSERT_TRUE(r.success);
    for (const auto& e : std::get<JSONValue::Array>(r.data->value)) {
        EXPECT_NE(std::get<std::string>(e->find("name")->value), "alias.txt");
    }
    EXPECT_EQ(std::get<int64_t>(r.metadata.at("count").value), 2);
}
#endif

TEST_F(FileSystemToolsTest, RecursiveDeleteRefusesBlockedSubtree) {
    writeRaw(root / "tree" / "a.txt", "a");
    writeRaw(root / "blocked" / "keys.txt", "k");
    auto r = call("delete_file", {{"path", JSONValue(root.string())}, {"recursive", JSONValue(true)}});
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->rfind("Permission denied", 0), 0u);
    EXPECT_TRUE(fs::exists(root / "blocked" / "keys.txt"));
    EXPECT_TRUE(fs::exists(root / "tree" / "a.txt"));

    auto tree = call("delete_file", {{"path", JSONValue((root / "tree").string())}, {"recursive", JSONValue(true)}});
    ASSERT_TRUE(tree.success) << tree.error.value_or("");
    EXPECT_FALSE(fs::exists(root / "tree"));
}

TEST_F(FileSystemToolsTest, CopyFileAndDirectory) {
    writeRaw(root / "src.txt", "payload");
    auto file = call("copy_file", {{"source", JSONValue((root / "src.txt").string())},
                                   {"destination", JSONValue((root / "dst.txt").string())}});
    ASSERT_TRUE(file.success) << file.error.value_or("");
    EXPECT_EQ(readRaw(root / "dst.txt"), "payload");
    EXPECT_EQ(std::get<std::string>(file.data->value), "Copied " + (root / "src.txt").string() + " to " +
                                                         (root / "dst.txt").string());

    auto exists = call("copy_file", {{"source", JSONValue((root / "src.txt").string())},
                                     {"destination", JSONValue((root / "dst.txt").string())}});
    ASSERT_FALSE(exists.success);
    EXPECT_EQ(exists.error->rfind("Invalid parameters: Destination already exists", 0), 0u);

    writeRaw(root / "src.txt", "changed");
    auto overwrite = call("copy_file", {{"source", JSONValue((root / "src.txt").string())},
                                        {"destination", JSONValue((root / "dst.txt").string())},
                                        {"overwrite", JSONValue(true)}});
    ASSERT_TRUE(overwrite.success);
    EXPECT_EQ(readRaw(root / "dst.txt"), "changed");

    writeRaw(root / "dir" / "sub" / "x.txt", "x");
    auto tree = call("copy_file", {{"source", JSONValue((root / "dir").string())},
                                   {"destination", JSONValue((root / "dir2").string())}});
    ASSERT_TRUE(tree.success) << tree.error.value_or("");
    EXPECT_EQ(readRaw(root / "dir2" / "sub" / "x.txt"), "x");

    auto into = call("copy_file", {{"source", JSONValue((root / "dir").string())},
                                   {"destination", JSONValue((root / "dir" / "sub" / "copy").string())}});
    ASSERT_FALSE(into.success);

    auto missing = call("copy_file", {{"source", JSONValue((root / "none").string())},
                                      {"destination", JSONValue((root / "n2").string())}});
    ASSERT_FALSE(missing.success);
    EXPECT_EQ(missing.error->rfind("Not found: Source not found", 0), 0u);
}

TEST_F(FileSystemToolsTest, CopyChecksBothEnds) {
    writeRaw(root / "blocked" / "keys.txt", "k");
    writeRaw(root / "ok.txt", "ok");

    auto fromBlocked = call("copy_file", {{"source", JSONValue((root / "blocked" / "keys.txt").string())},
                                          {"destination", JSONValue((root / "stolen.txt").string())}});
    ASSERT_FALSE(fromBlocked.success);
    EXPECT_EQ(fromBlocked.error->rfind("Permission denied", 0), 0u);
    EXPECT_FALSE(fs::exists(root / "stolen.txt"));

    auto intoBlocked = call("copy_file", {{"source", JSONValue((root / "ok.txt").string())},
                                          {"destination", JSONValue((root / "blocked" / "planted.txt").string())}});
    ASSERT_FALSE(intoBlocked.success);
    EXPECT_FALSE(fs::exists(root / "blocked" / "planted.txt"));

    auto outside = call("copy_file", {{"source", JSONValue((root / "ok.txt").string())},
                                      {"destination", JSONValue((root.parent_path() / "hostmcp_escape.txt").string())}});
    ASSERT_FALSE(outside.success);
    EXPECT_FALSE(fs::exists(root.parent_path() / "hostmcp_escape.txt"));
}

TEST_F(FileSystemToolsTest, DirectoryCopyLeavesOutBlockedSubtree) {
    auto policy = security::SandboxPolicy{};
    policy.allowedPaths = {root.string()};
    policy.blockedPaths = {(root / "tree" / "secret").string()};
    registry = std::make_unique<ToolRegistry>();
    RegisterFileSystemTools(*registry, std::make_shared<const security::Sandbox>(policy), config::ToolSettings{});

    writeRaw(root / "tree" / "a.txt", "a");
    writeRaw(root / "tree" / "secret" / "keys.txt", "k");
    auto r = call("copy_file", {{"source", JSONValue((root / "tree").string())},
                                {"destination", JSONValue((root / "copy").string())}});
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_TRUE(fs::exists(root / "copy" / "a.txt"));
    EXPECT_FALSE(fs::exists(root / "copy" / "secret"));
    EXPECT_EQ(std::get<int64_t>(r.metadata.at("skipped").value), 1);

    auto move = call("move_file", {{"source", JSONValue((root / "tree").string())},
                                   {"destination", JSONValue((root / "moved").string())}});
    ASSERT_FALSE(move.success);
    EXPECT_EQ(move.error->rfind("Permission denied", 0), 0u);
    EXPECT_TRUE(fs::exists(root / "tree" / "secret" / "keys.txt"));
}

TEST_F(FileSystemToolsTest, MoveFileRenamesAndChecksBothEnds) {
    writeRaw(root / "a.txt", "a");
    auto moved = call("move_file", {{"source", JSONValue((root / "a.txt").string())},
                                    {"destination", JSONValue((root / "b.txt").string())}});
    ASSERT_TRUE(moved.success) << moved.error.value_or("");
    EXPECT_FALSE(fs::exists(root / "a.txt"));
    EXPECT_EQ(readRaw(root / "b.txt"), "a");

    writeRaw(root / "c.txt", "c");
    auto clash = call("move_file", {{"source", JSONValue((root / "c.txt").string())},
                                    {"destination", JSONValue((root / "b.txt").string())}});
    ASSERT_FALSE(clash.success);
    EXPECT_TRUE(fs::exists(root / "c.txt"));

    auto replace = call("move_file", {{"source", JSONValue((root / "c.txt").string())},
                                      {"destination", JSONValue((root / "b.txt").string())},
                                      {"overwrite", JSONValue(true)}});
    ASSERT_TRUE(replace.success);
    EXPECT_EQ(readRaw(root / "b.txt"), "c");

    writeRaw(root / "blocked" / "keys.txt", "k");
    auto outOfBlocked = call("move_file", {{"source", JSONValue((root / "blocked" / "keys.txt").string())},
                                           {"destination", JSONValue((root / "keys.txt").string())}});
    ASSERT_FALSE(outOfBlocked.success);
    EXPECT_TRUE(fs::exists(root / "blocked" / "keys.txt"));

    auto intoBlocked = call("move_file", {{"source", JSONValue((root / "b.txt").string())},
                                          {"destination", JSONValue((root / "blocked" / "b.txt").string())}});
    ASSERT_FALSE(intoBlocked.success);
    EXPECT_TRUE(fs::exists(root / "b.txt"));
}

TEST_F(FileSystemToolsTest, SearchFilesByNameAndContent) {
    writeRaw(root / "notes.txt", "alpha\nHello World\n");
    writeRaw(root / "sub" / "more.txt", "nothing\n  hello again  \n");
    writeRaw(root / "sub" / "skip.log", "hello\n");
    writeRaw(root / "blocked" / "secret.txt", "hello\n");
    writeRaw(root / "blob.txt", std::string("\xff\xfehello", 7));

    auto byName = call("search_files", {{"path", JSONValue(root.string())}, {"pattern", JSONValue("*.txt")}});
    ASSERT_TRUE(byName.success) << byName.error.value_or("");
    const auto& named = std::get<JSONValue::Array>(byName.data->value);
    EXPECT_EQ(named.size(), 3u);
    for (const auto& e : named) {
        EXPECT_NE(std::get<std::string>(e->find("name")->value), "secret.txt");
    }

    auto byContent = call("search_files", {{"path", JSONValue(root.string())}, {"pattern", JSONValue("*.txt")},
                                           {"content", JSONValue("HELLO")}});
    ASSERT_TRUE(byContent.success);
    EXPECT_EQ(std::get<int64_t>(byContent.metadata.at("result_count").value), 2);
    for (const auto& e : std::get<JSONValue::Array>(byContent.data->value)) {
        const auto& matches = std::get<JSONValue::Array>(e->find("matches")->value);
        ASSERT_EQ(matches.size(), 1u);
        if (std::get<std::string>(e->find("name")->value) == "more.txt") {
            EXPECT_EQ(std::get<int64_t>(matches[0]->find("line")->value), 2);
            EXPECT_EQ(std::get<std::string>(matches[0]->find("text")->value), "hello again");
        }
    }

    auto flat = call("search_files", {{"path", JSONValue(root.string())}, {"recursive", JSONValue(false)},
                                      {"content", JSONValue("hello")}});
    ASSERT_TRUE(flat.success);
    EXPECT_EQ(std::get<int64_t>(flat.metadata.at("result_count").value), 1);

    auto capped = call("search_files", {{"path", JSONValue(root.string())}, {"max_results", JSONValue(int64_t{1})}});
    ASSERT_TRUE(capped.success);
    EXPECT_EQ(std::get<JSONValue::Array>(capped.data->value).size(), 1u);

    auto bad = call("search_files", {{"path", JSONValue(root.string())}, {"max_results", JSONValue(int64_t{0})}});
    ASSERT_FALSE(bad.success);

    auto blocked = call("search_files", {{"path", JSONValue((root / "blocked").string())}});
    ASSERT_FALSE(blocked.success);
    EXPECT_EQ(blocked.error->rfind("Permission denied", 0), 0u);
}

TEST_F(FileSystemToolsTest, CreateAndDeleteDirectories) {
    const auto dir = root / "one" / "two";
    auto c = call("create_directory", {{"path", JSONValue(dir.string())}});
    ASSERT_TRUE(c.success);
    EXPECT_TRUE(fs::is_directory(dir));

    auto again = call("create_directory", {{"path", JSONValue(dir.string())}});
    ASSERT_TRUE(again.success);
    EXPECT_TRUE(std::get<bool>(again.metadata.at("already_existed").value));

    writeRaw(dir / "f.txt", "x");
    auto nonRecursive = call("delete_file", {{"path", JSONValue((root / "one").string())}});
    EXPECT_FALSE(nonRecursive.success);
    EXPECT_TRUE(fs::exists(root / "one"));

    auto recursive = call("delete_file", {{"path", JSONValue((root / "one").string())}, {"recursive", JSONValue(true)}});
    ASSERT_TRUE(recursive.success);
    EXPECT_FALSE(fs::exists(root / "one"));

    auto missing = call("delete_file", {{"path", JSONValue((root / "one").string())}});
    ASSERT_FALSE(missing.success);
    EXPECT_EQ(missing.error->rfind("Not found", 0), 0u);
}

TEST_F(FileSystemToolsTest, FileInfoDescribesEntry) {
    writeRaw(root / ".cfg.json", "{}");
    auto r = call("get_file_info", {{"path", JSONValue((root / ".cfg.json").string())}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(std::get<std::string>(r.data->find("type")->value), "file");
    EXPECT_EQ(std::get<int64_t>(r.data->find("size")->value), 2);
    EXPECT_EQ(std::get<std::string>(r.data->find("extension")->value), ".json");
    EXPECT_TRUE(std::get<bool>(r.data->find("is_hidden")->value));
    EXPECT_FALSE(std::get<bool>(r.data->find("is_symlink")->value));
}

TEST(GlobMatch, StarAndQuestionMark) {
    EXPECT_TRUE(GlobMatch("*.txt", "a.txt"));
    EXPECT_TRUE(GlobMatch("a?c", "abc"));
    EXPECT_TRUE(GlobMatch("*", ""));
    EXPECT_FALSE(GlobMatch("*.txt", "a.txt.bak"));
    EXPECT_FALSE(GlobMatch("a?c", "ac"));
}
