//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileSystemTools.cpp
// Purpose: Filesystem tools. Every path passes through Sandbox::CheckFileAccess before it is touched.
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <stop_token>
#include <system_error>
#include <vector>

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/FileSystemTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;
using security::FileOperation;

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

std::string formatFileTime(fs::file_time_type ftime) {
    const auto sys = std::chrono::file_clock::to_sys(ftime);
    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
    std::tm buf{};
#ifdef _WIN32
    ::gmtime_s(&buf, &t);
#else
    ::gmtime_r(&t, &buf);
#endif
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday, buf.tm_hour, buf.tm_min, buf.tm_sec);
}

bool isValidUtf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;
        if (i + extra >= s.size()) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

void requireUtf8Encoding(const std::string& encoding) {
    const std::string e = toLower(encoding);
    if (e != "utf-8" && e != "utf8") {
        throw ToolError(ErrorKind::InvalidParams, "Unsupported encoding: " + encoding);
    }
}

std::string permissionsString(fs::perms p) {
    return std::format("{:04o}", static_cast<unsigned int>(p & fs::perms::mask));
}

std::string typeName(const fs::file_status& st) {
    if (fs::is_directory(st)) return "directory";
    if (fs::is_regular_file(st)) return "file";
    if (fs::is_symlink(st)) return "symlink";
    return "other";
}

JSONValue describeEntry(const fs::directory_entry& entry) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(entry.path().filename().string());
    obj["path"] = std::make_shared<JSONValue>(entry.path().string());
    std::error_code ec;
    const auto st = entry.status(ec);
    if (ec) {
        obj["error"] = std::make_shared<JSONValue>(ec.message());
        return JSONValue(obj);
    }
    obj["type"] = std::make_shared<JSONValue>(fs::is_directory(st) ? "directory" : "file");
    const auto size = fs::is_regular_file(st) ? entry.file_size(ec) : 0;
    obj["size"] = std::make_shared<JSONValue>(static_cast<int64_t>(ec ? 0 : size));
    const auto mtime = entry.last_write_time(ec);
    if (!ec) {
        obj["modified"] = std::make_shared<JSONValue>(formatFileTime(mtime));
    }
    return JSONValue(obj);
}

const std::string& stringMember(const JSONValue& obj, const char* key) {
    static const std::string empty;
    const JSONValue* v = obj.find(key);
    return (v && v->isString()) ? std::get<std::string>(v->value) : empty;
}

constexpr std::uintmax_t kMaxSearchFileBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxMatchLineBytes = 200;

// Refuses when anything below dir is blocked or outside the allowed roots.
void requireWalkable(const security::Sandbox& sandbox, const fs::path& dir, const std::string& raw,
                     const std::stop_token& stop) {
    for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
        ThrowIfStopRequested(stop);
        if (!sandbox.PermitsEntry(it->path())) {
            throw ToolError(ErrorKind::PermissionDenied, "Directory contains protected entries: " + raw);
        }
    }
}

// Copies the permitted part of src into dst; returns the number of entries left out.
std::size_t copyTree(const security::Sandbox& sandbox, const fs::path& src, const fs::path& dst,
                     const std::stop_token& stop) {
    std::size_t skipped = 0;
    fs::create_directories(dst);
    for (auto it = fs::recursive_directory_iterator(src); it != fs::recursive_directory_iterator(); ++it) {
        ThrowIfStopRequested(stop);
        if (!sandbox.PermitsEntry(it->path())) {
            it.disable_recursion_pending();
            ++skipped;
            continue;
        }
        const fs::path target = dst / it->path().lexically_relative(src);
        const auto st = it->symlink_status();
        if (fs::is_symlink(st)) {
            fs::copy_symlink(it->path(), target);
        } else if (fs::is_directory(st)) {
            fs::create_directories(target);
        } else if (fs::is_regular_file(st)) {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing);
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        LOG_INFO("copy of {} left out {} entries", src.string(), skipped);
    }
    return skipped;
}

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Cuts at a UTF-8 character boundary.
std::string truncateUtf8(std::string s, std::size_t max) {
    if (s.size() <= max) return s;
    std::size_t cut = max;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    s.resize(cut);
    return s;
}

//==========================================================================================================
// read_file
//==========================================================================================================
class ReadFileTool : public ToolBase {
public:
    ReadFileTool(std::shared_ptr<const security::Sandbox> sandbox, uint64_t maxBytes)
        : sandbox(std::move(sandbox)), maxBytes(maxBytes) {
        definition.name = "read_file";
        definition.description = "Read the contents of a file at the specified path";
        definition.category = "filesystem";
        definition.parameters = {
            Param("path", "Path to the file to read", ParameterType::String, true),
            Param("encoding", "File encoding (default: utf-8)", ParameterType::String, false, JSONValue("utf-8")),
            Param("offset", "Byte offset to start reading from", ParameterType::Number, false, JSONValue(int64_t{0})),
            Param("limit", "Maximum bytes to read (0 for unlimited)", ParameterType::Number, false, JSONValue(int64_t{0})),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Read));
        const std::string encoding = args::GetString(a, "encoding", "utf-8");
        requireUtf8Encoding(encoding);
        const int64_t offset = args::GetInt(a, "offset", 0);
        const int64_t limit = args::GetInt(a, "limit", 0);
        if (offset < 0 || limit < 0) {
            throw ToolError(ErrorKind::InvalidParams, "offset and limit must be non-negative");
        }
        if (!fs::exists(path)) {
            throw ToolError(ErrorKind::ResourceNotFound, "File not found: " + raw);
        }
        if (!fs::is_regular_file(path)) {
            throw ToolError(ErrorKind::InvalidParams, "Path is not a file: " + raw);
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw ToolError(ErrorKind::PermissionDenied, "Cannot open file: " + raw);
        }
        in.seekg(offset, std::ios::beg);

        const uint64_t budget = (limit > 0) ? std::min<uint64_t>(static_cast<uint64_t>(limit), maxBytes) : maxBytes;
        std::string content;
        std::vector<char> chunk(kReadChunk);
        while (content.size() < budget && in) {
            ThrowIfStopRequested(stop);
            const std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(kReadChunk, budget - content.size()));
            in.read(chunk.data(), static_cast<std::streamsize>(want));
            content.append(chunk.data(), static_cast<std::size_t>(in.gcount()));
        }
        const bool truncated = (limit == 0 || static_cast<uint64_t>(limit) > maxBytes) &&
                               in && in.peek() != std::ifstream::traits_type::eof();

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["path"] = JSONValue(path.string());
        metadata["size"] = JSONValue(static_cast<int64_t>(content.size()));
        metadata["encoding"] = JSONValue(encoding);
        metadata["truncated"] = JSONValue(truncated);
        if (!isValidUtf8(content)) {
            metadata["binary"] = JSONValue(true);
            return ToolResult::Ok(JSONValue(std::format("<binary file, {} bytes>", content.size())), std::move(metadata));
        }
        return ToolResult::Ok(JSONValue(std::move(content)), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
    uint64_t maxBytes;
};

//==========================================================================================================
// write_file
//==========================================================================================================
class WriteFileTool : public ToolBase {
public:
    explicit WriteFileTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "write_file";
        definition.description = "Write content to a file, creating it if it doesn't exist";
        definition.category = "filesystem";
        definition.isDestructive = true;
        definition.parameters = {
            Param("path", "Path to the file to write", ParameterType::String, true),
            Param("content", "Content to write to the file", ParameterType::String, true),
            Param("encoding", "File encoding (default: utf-8)", ParameterType::String, false, JSONValue("utf-8")),
            Param("append", "Append to file instead of overwriting", ParameterType::Boolean, false, JSONValue(false)),
            Param("create_dirs", "Create parent directories if they don't exist", ParameterType::Boolean, false, JSONValue(true)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Write));
        const std::string content = args::RequireString(a, "content");
        requireUtf8Encoding(args::GetString(a, "encoding", "utf-8"));
        const bool append = args::GetBool(a, "append", false);
        ThrowIfStopRequested(stop);

        if (args::GetBool(a, "create_dirs", true) && path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }
        if (fs::is_directory(path)) {
            throw ToolError(ErrorKind::InvalidParams, "Path is a directory: " + raw);
        }
        std::ofstream out(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out) {
            throw ToolError(ErrorKind::PermissionDenied, "Cannot open file for writing: " + raw);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw ToolError(ErrorKind::ToolExecution, "Write failed: " + raw);
        }

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["path"] = JSONValue(path.string());
        metadata["bytes_written"] = JSONValue(static_cast<int64_t>(content.size()));
        metadata["mode"] = JSONValue(append ? "append" : "write");
        LOG_INFO("write_file: {} bytes to {}", content.size(), path.string());
        return ToolResult::Ok(JSONValue(std::format("Successfully wrote {} bytes to {}", content.size(), raw)),
                              std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// list_directory
//==========================================================================================================
class ListDirectoryTool : public ToolBase {
public:
    explicit ListDirectoryTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "list_directory";
        definition.description = "List files and subdirectories in a directory";
        definition.category = "filesystem";
        definition.parameters = {
            Param("path", "Path to the directory to list", ParameterType::String, true),
            Param("pattern", "Glob pattern to filter entries (e.g., '*.txt')", ParameterType::String, false),
            Param("recursive", "List contents recursively", ParameterType::Boolean, false, JSONValue(false)),
            Param("include_hidden", "Include hidden files (starting with .)", ParameterType::Boolean, false, JSONValue(false)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::List));
        const auto pattern = args::OptString(a, "pattern");
        const bool recursive = args::GetBool(a, "recursive", false);
        const bool includeHidden = args::GetBool(a, "include_hidden", false);

        if (!fs::exists(path)) {
            throw ToolError(ErrorKind::ResourceNotFound, "Directory not found: " + raw);
        }
        if (!fs::is_directory(path)) {
            throw ToolError(ErrorKind::InvalidParams, "Path is not a directory: " + raw);
        }

        std::vector<JSONValue> entries;
        auto consider = [&](const fs::directory_entry& entry) {
            ThrowIfStopRequested(stop);
            const std::string name = entry.path().filename().string();
            if (!includeHidden && !name.empty() && name[0] == '.') return;
            if (pattern.has_value() && !GlobMatch(pattern.value(), name)) return;
            entries.push_back(describeEntry(entry));
        };

        if (recursive) {
            auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied);
            for (; it != fs::recursive_directory_iterator(); ++it) {
                if (!sandbox->PermitsEntry(it->path())) {
                    it.disable_recursion_pending();
                    continue;
                }
                consider(*it);
            }
        } else {
            for (const auto& entry : fs::directory_iterator(path)) {
                if (sandbox->PermitsEntry(entry.path())) {
                    consider(entry);
                }
            }
        }

        std::sort(entries.begin(), entries.end(), [](const JSONValue& x, const JSONValue& y) {
            const bool xd = stringMember(x, "type") == "directory";
            const bool yd = stringMember(y, "type") == "directory";
            if (xd != yd) return xd;
            return toLower(stringMember(x, "name")) < toLower(stringMember(y, "name"));
        });

        JSONValue::Array arr;
        arr.reserve(entries.size());
        for (auto& e : entries) arr.push_back(std::make_shared<JSONValue>(std::move(e)));

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["path"] = JSONValue(path.string());
        metadata["count"] = JSONValue(static_cast<int64_t>(arr.size()));
        return ToolResult::Ok(JSONValue(std::move(arr)), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// create_directory
//==========================================================================================================
class CreateDirectoryTool : public ToolBase {
public:
    explicit CreateDirectoryTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "create_directory";
        definition.description = "Create a new directory at the specified path";
        definition.category = "filesystem";
        definition.isDestructive = true;
        definition.parameters = {
            Param("path", "Path of the directory to create", ParameterType::String, true),
            Param("parents", "Create parent directories if they don't exist", ParameterType::Boolean, false, JSONValue(true)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Write));
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["path"] = JSONValue(path.string());

        if (fs::exists(path)) {
            if (!fs::is_directory(path)) {
                throw ToolError(ErrorKind::InvalidParams, "Path exists but is not a directory: " + raw);
            }
            metadata["already_existed"] = JSONValue(true);
            return ToolResult::Ok(JSONValue("Directory already exists: " + raw), std::move(metadata));
        }
        if (args::GetBool(a, "parents", true)) {
            fs::create_directories(path);
        } else {
            fs::create_directory(path);
        }
        return ToolResult::Ok(JSONValue("Created directory: " + raw), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// delete_file
//==========================================================================================================
class DeleteFileTool : public ToolBase {
public:
    explicit DeleteFileTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "delete_file";
        definition.description = "Delete a file or directory at the specified path";
        definition.category = "filesystem";
        definition.isDestructive = true;
        definition.parameters = {
            Param("path", "Path to delete", ParameterType::String, true),
            Param("recursive", "Delete directories recursively", ParameterType::Boolean, false, JSONValue(false)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Delete));
        if (!fs::exists(path)) {
            throw ToolError(ErrorKind::ResourceNotFound, "Path not found: " + raw);
        }
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["path"] = JSONValue(path.string());

        if (fs::is_directory(path)) {
            if (args::GetBool(a, "recursive", false)) {
                requireWalkable(*sandbox, path, raw, stop);
                fs::remove_all(path);
            } else {
                fs::remove(path);
            }
            metadata["type"] = JSONValue("directory");
            LOG_INFO("delete_file: removed directory {}", path.string());
            return ToolResult::Ok(JSONValue("Deleted directory: " + raw), std::move(metadata));
        }
        fs::remove(path);
        metadata["type"] = JSONValue("file");
        LOG_INFO("delete_file: removed {}", path.string());
        return ToolResult::Ok(JSONValue("Deleted file: " + raw), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// get_file_info
//==========================================================================================================
class FileInfoTool : public ToolBase {
public:
    explicit FileInfoTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "get_file_info";
        definition.description = "Get detailed information about a file or directory";
        definition.category = "filesystem";
        definition.parameters = {
            Param("path", "Path to the file or directory", ParameterType::String, true),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Read));
        if (!fs::exists(path)) {
            throw ToolError(ErrorKind::ResourceNotFound, "Path not found: " + raw);
        }
        const auto st = fs::status(path);
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(path.filename().string());
        info["path"] = std::make_shared<JSONValue>(path.string());
        info["type"] = std::make_shared<JSONValue>(typeName(st));
        info["size"] = std::make_shared<JSONValue>(static_cast<int64_t>(fs::is_regular_file(st) ? fs::file_size(path) : 0));
        info["modified"] = std::make_shared<JSONValue>(formatFileTime(fs::last_write_time(path)));
        info["permissions"] = std::make_shared<JSONValue>(permissionsString(st.permissions()));
        info["extension"] = std::make_shared<JSONValue>(path.extension().string());
        const std::string name = path.filename().string();
        info["is_hidden"] = std::make_shared<JSONValue>(!name.empty() && name[0] == '.');
        info["is_symlink"] = std::make_shared<JSONValue>(fs::is_symlink(fs::symlink_status(raw)));
        return ToolResult::Ok(JSONValue(info));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// copy_file
//==========================================================================================================
class CopyFileTool : public ToolBase {
public:
    explicit CopyFileTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "copy_file";
        definition.description = "Copy a file or directory to a new location";
        definition.category = "filesystem";
        definition.isDestructive = true;
        definition.parameters = {
            Param("source", "Source path to copy from", ParameterType::String, true),
            Param("destination", "Destination path to copy to", ParameterType::String, true),
            Param("overwrite", "Overwrite if destination exists", ParameterType::Boolean, false, JSONValue(false)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string source = args::RequireString(a, "source");
        const std::string destination = args::RequireString(a, "destination");
        const fs::path src = errors::valueOrThrow(sandbox->CheckFileAccess(source, FileOperation::Read));
        const fs::path dst = errors::valueOrThrow(sandbox->CheckFileAccess(destination, FileOperation::Write));
        const bool overwrite = args::GetBool(a, "overwrite", false);

        if (!fs::exists(src)) {
            throw ToolError(ErrorKind::ResourceNotFound, "Source not found: " + source);
        }
        if (src == dst) {
            throw ToolError(ErrorKind::InvalidParams, "Source and destination are the same path");
        }
        if (fs::exists(dst) && !overwrite) {
            throw ToolError(ErrorKind::InvalidParams, "Destination already exists: " + destination);
        }
        if (!fs::is_directory(dst.parent_path())) {
            throw ToolError(ErrorKind::ResourceNotFound, "Destination directory not found: " + dst.parent_path().string());
        }

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["source"] = JSONValue(src.string());
        metadata["destination"] = JSONValue(dst.string());
        if (fs::is_directory(src)) {
            if (security::PathValidator::IsDescendantOf(dst, src)) {
                throw ToolError(ErrorKind::InvalidParams, "Cannot copy a directory into itself");
            }
            if (fs::exists(dst)) {
                requireWalkable(*sandbox, dst, destination, stop);
                fs::remove_all(dst);
            }
            const std::size_t skipped = copyTree(*sandbox, src, dst, stop);
            metadata["skipped"] = JSONValue(static_cast<int64_t>(skipped));
        } else {
            if (fs::is_directory(dst)) {
                requireWalkable(*sandbox, dst, destination, stop);
                fs::remove_all(dst);
            }
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
        }
        LOG_INFO("copy_file: {} -> {}", src.string(), dst.string());
        return ToolResult::Ok(JSONValue("Copied " + source + " to " + destination), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// move_file
// Source needs delete permission, destination write permission. A directory holding any entry the
// sandbox refuses is not moved at all.
//==========================================================================================================
class MoveFileTool : public ToolBase {
public:
    explicit MoveFileTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "move_file";
        definition.description = "Move a file or directory to a new location";
        definition.category = "filesystem";
        definition.isDestructive = true;
        definition.parameters = {
            Param("source", "Source path to move from", ParameterType::String, true),
            Param("destination", "Destination path to move to", ParameterType::String, true),
            Param("overwrite", "Overwrite if destination exists", ParameterType::Boolean, false, JSONValue(false)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string source = args::RequireString(a, "source");
        const std::string destination = args::RequireString(a, "destination");
        const fs::path src = errors::valueOrThrow(sandbox->CheckFileAccess(source, FileOperation::Delete));
        const fs::path dst = errors::valueOrThrow(sandbox->CheckFileAccess(destination, FileOperation::Write));
        const bool overwrite = args::GetBool(a, "overwrite", false);

        if (!fs::exists(fs::symlink_status(src))) {
            throw ToolError(ErrorKind::ResourceNotFound, "Source not found: " + source);
        }
        if (src == dst) {
            throw ToolError(ErrorKind::InvalidParams, "Source and destination are the same path");
        }
        const bool isDirectory = fs::is_directory(fs::symlink_status(src));
        if (isDirectory) {
            if (security::PathValidator::IsDescendantOf(dst, src)) {
                throw ToolError(ErrorKind::InvalidParams, "Cannot move a directory into itself");
            }
            requireWalkable(*sandbox, src, source, stop);
        }
        if (fs::exists(dst)) {
            if (!overwrite) {
                throw ToolError(ErrorKind::InvalidParams, "Destination already exists: " + destination);
            }
            if (fs::is_directory(dst)) {
                requireWalkable(*sandbox, dst, destination, stop);
            }
            fs::remove_all(dst);
        }

        std::error_code ec;
        fs::rename(src, dst, ec);
        if (ec == std::errc::cross_device_link) {
            LOG_DEBUG("move_file: {} crosses devices, copying", src.string());
            if (isDirectory) {
                copyTree(*sandbox, src, dst, stop);
            } else {
                fs::copy(src, dst, fs::copy_options::copy_symlinks);
            }
            fs::remove_all(src);
        } else if (ec) {
            throw fs::filesystem_error("move_file", src, dst, ec);
        }

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["source"] = JSONValue(src.string());
        metadata["destination"] = JSONValue(dst.string());
        LOG_INFO("move_file: {} -> {}", src.string(), dst.string());
        return ToolResult::Ok(JSONValue("Moved " + source + " to " + destination), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// search_files
//==========================================================================================================
class SearchFilesTool : public ToolBase {
public:
    explicit SearchFilesTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "search_files";
        definition.description = "Search for files matching a pattern or containing text";
        definition.category = "filesystem";
        definition.parameters = {
            Param("path", "Directory to search in", ParameterType::String, true),
            Param("pattern", "Glob pattern to match file names (e.g., '*.txt')", ParameterType::String, false),
            Param("content", "Text to search for in file contents", ParameterType::String, false),
            Param("max_results", "Maximum number of results to return", ParameterType::Number, false, JSONValue(int64_t{100})),
            Param("recursive", "Search recursively in subdirectories", ParameterType::Boolean, false, JSONValue(true)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string raw = args::RequireString(a, "path");
        const fs::path path = errors::valueOrThrow(sandbox->CheckFileAccess(raw, FileOperation::Read));
        const auto pattern = args::OptString(a, "pattern");
        const auto content = args::OptString(a, "content");
        const int64_t maxResults = args::GetInt(a, "max_results", 100);
        const bool recursive = args::GetBool(a, "recursive", true);
        if (maxResults <= 0) {
            throw ToolError(ErrorKind::InvalidParams, "max_results must be positive");
        }
        if (!fs::exists(path)) {
            throw ToolError(ErrorKind::ResourceNotFound, "Directory not found: " + raw);
        }
        if (!fs::is_directory(path)) {
            throw ToolError(ErrorKind::InvalidParams, "Path is not a directory: " + raw);
        }

        // Content filtering discards candidates, so look at more of them than we return.
        const std::size_t limit = static_cast<std::size_t>(maxResults);
        const std::size_t candidateLimit = content ? limit * 10 : limit;
        const std::string needle = content ? toLower(content.value()) : std::string();

        std::vector<fs::path> candidates;
        auto consider = [&](const fs::directory_entry& entry) {
            std::error_code ec;
            if (!entry.is_regular_file(ec) || ec) return;
            if (pattern.has_value() && !GlobMatch(pattern.value(), entry.path().filename().string())) return;
            candidates.push_back(entry.path());
        };
        if (recursive) {
            auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied);
            for (; it != fs::recursive_directory_iterator() && candidates.size() < candidateLimit; ++it) {
                ThrowIfStopRequested(stop);
                if (!sandbox->PermitsEntry(it->path())) {
                    it.disable_recursion_pending();
                    continue;
                }
                consider(*it);
            }
        } else {
            for (const auto& entry : fs::directory_iterator(path)) {
                if (candidates.size() >= candidateLimit) break;
                ThrowIfStopRequested(stop);
                if (sandbox->PermitsEntry(entry.path())) {
                    consider(entry);
                }
            }
        }

        JSONValue::Array results;
        for (const auto& file : candidates) {
            if (results.size() >= limit) break;
            ThrowIfStopRequested(stop);
            JSONValue::Object item;
            item["path"] = std::make_shared<JSONValue>(file.string());
            item["name"] = std::make_shared<JSONValue>(file.filename().string());
            if (content) {
                JSONValue::Array matches = findMatches(file, needle, stop);
                if (matches.empty()) continue;
                item["matches"] = std::make_shared<JSONValue>(std::move(matches));
            }
            results.push_back(std::make_shared<JSONValue>(JSONValue(std::move(item))));
        }

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["search_path"] = JSONValue(path.string());
        metadata["pattern"] = pattern ? JSONValue(pattern.value()) : JSONValue(nullptr);
        metadata["content_search"] = content ? JSONValue(content.value()) : JSONValue(nullptr);
        metadata["result_count"] = JSONValue(static_cast<int64_t>(results.size()));
        return ToolResult::Ok(JSONValue(std::move(results)), std::move(metadata));
    }

private:
    // Case-insensitive line matches; files that are too large or not UTF-8 text yield what was found so far.
    static JSONValue::Array findMatches(const fs::path& file, const std::string& needle, const std::stop_token& stop) {
        JSONValue::Array matches;
        std::error_code ec;
        const auto size = fs::file_size(file, ec);
        if (ec || size > kMaxSearchFileBytes) {
            return matches;
        }
        std::ifstream in(file, std::ios::binary);
        std::string line;
        int64_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (!isValidUtf8(line)) break;
            if (toLower(line).find(needle) == std::string::npos) continue;
            ThrowIfStopRequested(stop);
            JSONValue::Object match;
            match["line"] = std::make_shared<JSONValue>(lineNo);
            match["text"] = std::make_shared<JSONValue>(truncateUtf8(trimmed(line), kMaxMatchLineBytes));
            matches.push_back(std::make_shared<JSONValue>(JSONValue(std::move(match))));
        }
        return matches;
    }

    std::shared_ptr<const security::Sandbox> sandbox;
};

} // namespace

bool GlobMatch(const std::string& pattern, const std::string& name) {
    std::size_t p = 0, n = 0;
    std::size_t star = std::string::npos, mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p; ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

void RegisterFileSystemTools(ToolRegistry& registry,
                             std::shared_ptr<const security::Sandbox> sandbox,
                             const config::ToolSettings& settings) {
    registry.Register(std::make_shared<ReadFileTool>(sandbox, settings.maxFileReadBytes));
    registry.Register(std::make_shared<WriteFileTool>(sandbox));
    registry.Register(std::make_shared<ListDirectoryTool>(sandbox));
    registry.Register(std::make_shared<CreateDirectoryTool>(sandbox));
    registry.Register(std::make_shared<DeleteFileTool>(sandbox));
    registry.Register(std::make_shared<FileInfoTool>(sandbox));
    registry.Register(std::make_shared<CopyFileTool>(sandbox));
    registry.Register(std::make_shared<MoveFileTool>(sandbox));
    registry.Register(std::make_shared<SearchFilesTool>(sandbox));
}

} // namespace hostmcp::tools
