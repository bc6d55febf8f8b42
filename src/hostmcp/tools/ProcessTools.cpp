//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTools.cpp
// Purpose: Process enumeration, termination and command execution tools
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <thread>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <psapi.h>
#include <tlhelp32.h>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

#include "hostmcp/security/Sandbox.hpp"
#include "hostmcp/tools/ProcessTools.h"
#include "hostmcp/tools/SystemTools.h"
#include "hostmcp/tools/ToolRegistry.h"
#include "logging/Logger.h"

namespace hostmcp::tools {

using errors::ErrorKind;
using errors::ToolError;
using security::ProcessOperation;

namespace {

constexpr std::size_t kMaxStdout = 50000;
constexpr std::size_t kMaxStderr = 10000;
constexpr std::chrono::seconds kStopGrace{5};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

JSONValue entryToJSON(const ProcessEntry& p) {
    JSONValue::Object obj;
    obj["pid"] = std::make_shared<JSONValue>(p.pid);
    obj["name"] = std::make_shared<JSONValue>(p.name);
    obj["status"] = std::make_shared<JSONValue>(p.status);
    obj["memory_rss"] = std::make_shared<JSONValue>(static_cast<int64_t>(p.rssBytes));
    return JSONValue(obj);
}

#ifdef _WIN32

std::string narrow(const wchar_t* w) {
    if (w == nullptr || *w == L'\0') return std::string();
    int len = ::WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1) return std::string();
    std::string out(static_cast<std::size_t>(len - 1), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, w, -1, out.data(), len, nullptr, nullptr);
    return out;
}

uint64_t processRss(DWORD pid) {
    HANDLE h = ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (h == nullptr) return 0;
    PROCESS_MEMORY_COUNTERS pmc{};
    uint64_t rss = 0;
    if (::K32GetProcessMemoryInfo(h, &pmc, sizeof(pmc))) {
        rss = static_cast<uint64_t>(pmc.WorkingSetSize);
    }
    ::CloseHandle(h);
    return rss;
}

#else

struct ProcStat {
    std::string name;
    char state{'?'};
    int64_t ppid{0};
};

std::optional<ProcStat> readStat(int64_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in) return std::nullopt;
    std::string line;
    std::getline(in, line);
    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) return std::nullopt;
    ProcStat st;
    st.name = line.substr(open + 1, close - open - 1);
    std::istringstream rest(line.substr(close + 1));
    rest >> st.state >> st.ppid;
    return st;
}

std::string stateName(char state) {
    switch (state) {
        case 'R': return "running";
        case 'S': return "sleeping";
        case 'D': return "disk-sleep";
        case 'Z': return "zombie";
        case 'T': case 't': return "stopped";
        case 'I': return "idle";
        case 'X': return "dead";
        default: return "unknown";
    }
}

void readStatus(int64_t pid, ProcessEntry& e) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/status");
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line.substr(6));
            uint64_t kb = 0;
            iss >> kb;
            e.rssBytes = kb * 1024;
        } else if (line.rfind("Threads:", 0) == 0) {
            std::istringstream iss(line.substr(8));
            iss >> e.threads;
        }
    }
}

std::optional<std::string> readLink(const std::string& path) {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

uint64_t totalMemoryBytes() {
    std::ifstream in("/proc/meminfo");
    std::string key;
    uint64_t value = 0;
    std::string unit;
    while (in >> key >> value >> unit) {
        if (key == "MemTotal:") return value * 1024;
    }
    return 0;
}

bool processGone(int64_t pid) {
    if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) {
        return true;
    }
    auto st = readStat(pid);
    return !st.has_value() || st->state == 'Z' || st->state == 'X';
}

bool waitForExit(int64_t pid, std::chrono::steady_clock::duration grace, const std::stop_token& stop) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (processGone(pid)) return true;
        if (stop.stop_requested()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return processGone(pid);
}

#endif

// Terminates the process; returns false when it had already exited.
bool terminateProcess(const ProcessEntry& target, bool force, const std::stop_token& stop) {
#ifdef _WIN32
    (void)force;
    (void)stop;
    HANDLE h = ::OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, static_cast<DWORD>(target.pid));
    if (h == nullptr) {
        if (::GetLastError() == ERROR_INVALID_PARAMETER) return false;
        throw ToolError(ErrorKind::PermissionDenied, "Access denied to stop process " + target.name);
    }
    const BOOL ok = ::TerminateProcess(h, 1);
    if (ok) {
        ::WaitForSingleObject(h, static_cast<DWORD>(std::chrono::milliseconds(kStopGrace).count()));
    }
    ::CloseHandle(h);
    if (!ok) {
        throw ToolError(ErrorKind::PermissionDenied, "Access denied to stop process " + target.name);
    }
    return true;
#else
    const pid_t pid = static_cast<pid_t>(target.pid);
    if (::kill(pid, force ? SIGKILL : SIGTERM) != 0) {
        if (errno == ESRCH) return false;
        if (errno == EPERM) throw ToolError(ErrorKind::PermissionDenied, "Access denied to stop process " + target.name);
        throw ToolError(ErrorKind::ToolExecution, std::string("kill failed: ") + std::strerror(errno));
    }
    if (waitForExit(target.pid, kStopGrace, stop)) return true;
    ThrowIfStopRequested(stop);
    if (!force) {
        LOG_WARN("Process {} did not terminate, forcing kill", target.pid);
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            throw ToolError(ErrorKind::ToolExecution, std::string("kill failed: ") + std::strerror(errno));
        }
        waitForExit(target.pid, kStopGrace, stop);
    }
    return true;
#endif
}

std::string firstToken(const std::string& command) {
    std::istringstream iss(command);
    std::string tok;
    iss >> tok;
    return tok;
}

//==========================================================================================================
// list_processes
//==========================================================================================================
class ListProcessesTool : public ToolBase {
public:
    explicit ListProcessesTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "list_processes";
        definition.description = "List all running processes on the system";
        definition.category = "process";
        definition.parameters = {
            Param("filter_name", "Filter processes by name (case-insensitive)", ParameterType::String, false),
            Param("sort_by", "Sort by: name, memory, pid", ParameterType::String, false, JSONValue("name"),
                  {"name", "memory", "pid"}),
            Param("limit", "Maximum number of processes to return", ParameterType::Number, false, JSONValue(int64_t{50})),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::List));
        const auto filter = args::OptString(a, "filter_name");
        const std::string sortBy = args::GetString(a, "sort_by", "name");
        const int64_t limit = args::GetInt(a, "limit", 50);
        if (limit < 0) {
            throw ToolError(ErrorKind::InvalidParams, "limit must be non-negative");
        }

        auto procs = SnapshotProcesses();
        ThrowIfStopRequested(stop);
        if (filter.has_value()) {
            const std::string needle = toLower(filter.value());
            procs.erase(std::remove_if(procs.begin(), procs.end(), [&](const ProcessEntry& p) {
                return toLower(p.name).find(needle) == std::string::npos;
            }), procs.end());
        }
        if (sortBy == "pid") {
            std::sort(procs.begin(), procs.end(), [](const ProcessEntry& x, const ProcessEntry& y) { return x.pid < y.pid; });
        } else if (sortBy == "memory") {
            std::sort(procs.begin(), procs.end(), [](const ProcessEntry& x, const ProcessEntry& y) { return x.rssBytes > y.rssBytes; });
        } else {
            std::sort(procs.begin(), procs.end(), [](const ProcessEntry& x, const ProcessEntry& y) { return toLower(x.name) < toLower(y.name); });
        }
        if (static_cast<int64_t>(procs.size()) > limit) {
            procs.resize(static_cast<std::size_t>(limit));
        }

        JSONValue::Array arr;
        for (const auto& p : procs) arr.push_back(std::make_shared<JSONValue>(entryToJSON(p)));
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["total_count"] = JSONValue(static_cast<int64_t>(arr.size()));
        metadata["sort_by"] = JSONValue(sortBy);
        return ToolResult::Ok(JSONValue(std::move(arr)), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// get_process_info
//==========================================================================================================
class ProcessInfoTool : public ToolBase {
public:
    explicit ProcessInfoTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "get_process_info";
        definition.description = "Get detailed information about a running process";
        definition.category = "process";
        definition.parameters = {
            Param("pid", "Process ID to get info for", ParameterType::Number, true),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token) override {
        const int64_t pid = args::OptInt(a, "pid").value_or(-1);
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::Info, std::nullopt, pid));
        auto proc = FindProcess(pid);
        if (!proc.has_value()) {
            throw ToolError(ErrorKind::ResourceNotFound, std::format("Process with PID {} not found", pid));
        }
        JSONValue::Object info = std::get<JSONValue::Object>(entryToJSON(proc.value()).value);
        info["parent_pid"] = std::make_shared<JSONValue>(proc->parentPid);
        info["num_threads"] = std::make_shared<JSONValue>(proc->threads);
        info["memory_rss_human"] = std::make_shared<JSONValue>(FormatBytes(proc->rssBytes));
#ifndef _WIN32
        const std::string base = "/proc/" + std::to_string(pid);
        auto exe = readLink(base + "/exe");
        info["exe"] = exe ? std::make_shared<JSONValue>(exe.value()) : std::make_shared<JSONValue>(nullptr);
        auto cwd = readLink(base + "/cwd");
        info["cwd"] = cwd ? std::make_shared<JSONValue>(cwd.value()) : std::make_shared<JSONValue>(nullptr);
        std::ifstream cmdIn(base + "/cmdline", std::ios::binary);
        if (cmdIn) {
            JSONValue::Array cmdline;
            std::string part;
            while (std::getline(cmdIn, part, '\0')) {
                cmdline.push_back(std::make_shared<JSONValue>(part));
            }
            info["cmdline"] = std::make_shared<JSONValue>(cmdline);
        } else {
            info["cmdline"] = std::make_shared<JSONValue>(nullptr);
        }
        const uint64_t total = totalMemoryBytes();
        if (total > 0) {
            const double pct = static_cast<double>(proc->rssBytes) * 100.0 / static_cast<double>(total);
            info["memory_percent"] = std::make_shared<JSONValue>(std::round(pct * 100.0) / 100.0);
        }
#endif
        JSONValue::Array children;
        for (const auto& p : SnapshotProcesses()) {
            if (p.parentPid == pid && p.pid != pid) {
                JSONValue::Object c;
                c["pid"] = std::make_shared<JSONValue>(p.pid);
                c["name"] = std::make_shared<JSONValue>(p.name);
                children.push_back(std::make_shared<JSONValue>(c));
            }
        }
        info["children"] = std::make_shared<JSONValue>(children);
        return ToolResult::Ok(JSONValue(info));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// stop_process
//==========================================================================================================
class StopProcessTool : public ToolBase {
public:
    explicit StopProcessTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "stop_process";
        definition.description = "Stop a running process by PID or name";
        definition.category = "process";
        definition.isDestructive = true;
        definition.parameters = {
            Param("pid", "Process ID to stop", ParameterType::Number, false),
            Param("name", "Process name to stop (stops first match)", ParameterType::String, false),
            Param("force", "Force kill the process", ParameterType::Boolean, false, JSONValue(false)),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const auto pid = args::OptInt(a, "pid");
        const auto name = args::OptString(a, "name");
        const bool force = args::GetBool(a, "force", false);
        if (!pid.has_value() && !name.has_value()) {
            throw ToolError(ErrorKind::InvalidParams, "Either pid or name must be provided");
        }
        // Requested identity first, then the resolved process
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::Stop, name, pid));

        std::optional<ProcessEntry> target;
        if (pid.has_value()) {
            target = FindProcess(pid.value());
            if (!target.has_value()) {
                throw ToolError(ErrorKind::ResourceNotFound, std::format("Process with PID {} not found", pid.value()));
            }
        } else {
            const std::string needle = toLower(name.value());
            for (const auto& p : SnapshotProcesses()) {
                if (!p.name.empty() && toLower(p.name).find(needle) != std::string::npos) {
                    target = p;
                    break;
                }
            }
            if (!target.has_value()) {
                throw ToolError(ErrorKind::ResourceNotFound, "Process with name '" + name.value() + "' not found");
            }
        }
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::Stop, target->name, target->pid));

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["pid"] = JSONValue(target->pid);
        metadata["name"] = JSONValue(target->name);
        if (!terminateProcess(target.value(), force, stop)) {
            return ToolResult::Ok(JSONValue("Process already terminated"), std::move(metadata));
        }
        metadata["forced"] = JSONValue(force);
        LOG_INFO("stop_process: stopped {} (PID {})", target->name, target->pid);
        return ToolResult::Ok(JSONValue(std::format("Stopped process {} (PID: {})", target->name, target->pid)),
                              std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

//==========================================================================================================
// execute_command
//==========================================================================================================
class ExecuteCommandTool : public ToolBase {
public:
    explicit ExecuteCommandTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "execute_command";
        definition.description = "Execute a shell command and return its output";
        definition.category = "process";
        definition.isDestructive = true;
        definition.parameters = {
            Param("command", "Command to execute", ParameterType::String, true),
            Param("working_dir", "Working directory for the command", ParameterType::String, false),
            Param("timeout", "Timeout in seconds", ParameterType::Number, false, JSONValue(int64_t{60})),
            Param("env", "Additional environment variables", ParameterType::Object, false),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string command = args::RequireString(a, "command");
        if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ToolError(ErrorKind::InvalidParams, "command must not be empty");
        }
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::Execute, firstToken(command)));

        std::optional<std::string> workingDir;
        if (auto wd = args::OptString(a, "working_dir")) {
            auto resolved = errors::valueOrThrow(sandbox->CheckFileAccess(wd.value(), security::FileOperation::Read));
            if (!std::filesystem::is_directory(resolved)) {
                throw ToolError(ErrorKind::InvalidParams, "Working directory not found: " + wd.value());
            }
            workingDir = resolved.string();
        }
        const int64_t timeoutSeconds = args::GetInt(a, "timeout", 60);
        if (timeoutSeconds <= 0) {
            throw ToolError(ErrorKind::InvalidParams, "timeout must be positive");
        }
        std::unordered_map<std::string, std::string> env;
        if (const JSONValue* envValue = args::Get(a, "env")) {
            for (const auto& [k, v] : std::get<JSONValue::Object>(envValue->value)) {
                if (!v || !v->isString()) {
                    throw ToolError(ErrorKind::InvalidParams, "env values must be strings");
                }
                env[k] = std::get<std::string>(v->value);
            }
        }

        LOG_INFO("execute_command: {}", command);
        CommandOutput out = RunCommand(command, workingDir, env, std::chrono::seconds(timeoutSeconds), stop);

        JSONValue::Object result;
        result["return_code"] = std::make_shared<JSONValue>(static_cast<int64_t>(out.exitCode));
        result["stdout"] = std::make_shared<JSONValue>(out.stdoutText);
        result["stderr"] = std::make_shared<JSONValue>(out.stderrText);
        std::unordered_map<std::string, JSONValue> metadata;
        metadata["command"] = JSONValue(command);
        if (out.exitCode != 0) {
            metadata["warning"] = JSONValue("Non-zero exit code");
        }
        return ToolResult::Ok(JSONValue(result), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

// Quotes one argument so the platform shell passes it through unchanged.
std::string quoteArgument(const std::string& arg) {
#ifdef _WIN32
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    return out + "\"";
#else
    if (!arg.empty() && arg.find_first_not_of(
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-./=:,+@%") == std::string::npos) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
#endif
}

//==========================================================================================================
// start_process
// Purpose: Launches a program. With wait=false the child is detached and only its pid is returned;
//          with wait=true it behaves like execute_command for the assembled command line.
// Notes:
//   shell=false runs the program directly with args passed verbatim; shell=true hands
//   "command args..." to the platform shell.
//==========================================================================================================
class StartProcessTool : public ToolBase {
public:
    explicit StartProcessTool(std::shared_ptr<const security::Sandbox> sandbox) : sandbox(std::move(sandbox)) {
        definition.name = "start_process";
        definition.description = "Start a new process with the specified command";
        definition.category = "process";
        definition.isDestructive = true;
        definition.parameters = {
            Param("command", "Command to execute", ParameterType::String, true),
            Param("args", "Command arguments as a list", ParameterType::Array, false),
            Param("working_dir", "Working directory for the process", ParameterType::String, false),
            Param("shell", "Run command through shell", ParameterType::Boolean, false, JSONValue(false)),
            Param("wait", "Wait for process to complete", ParameterType::Boolean, false, JSONValue(false)),
            Param("timeout", "Timeout in seconds if waiting", ParameterType::Number, false, JSONValue(int64_t{60})),
        };
    }

    ToolResult Execute(const JSONValue& a, std::stop_token stop) override {
        const std::string command = args::RequireString(a, "command");
        if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ToolError(ErrorKind::InvalidParams, "command must not be empty");
        }
        const bool shell = args::GetBool(a, "shell", false);
        errors::throwIfError(sandbox->CheckProcessOperation(ProcessOperation::Start,
                                                            shell ? firstToken(command) : command));

        std::vector<std::string> arguments;
        if (const JSONValue* list = args::Get(a, "args")) {
            for (const auto& item : std::get<JSONValue::Array>(list->value)) {
                if (!item || !item->isString()) {
                    throw ToolError(ErrorKind::InvalidParams, "args must be a list of strings");
                }
                arguments.push_back(std::get<std::string>(item->value));
            }
        }
        std::optional<std::string> workingDir;
        if (auto wd = args::OptString(a, "working_dir")) {
            auto resolved = errors::valueOrThrow(sandbox->CheckFileAccess(wd.value(), security::FileOperation::Read));
            if (!std::filesystem::is_directory(resolved)) {
                throw ToolError(ErrorKind::InvalidParams, "Working directory not found: " + wd.value());
            }
            workingDir = resolved.string();
        }

        std::unordered_map<std::string, JSONValue> metadata;
        metadata["command"] = JSONValue(command);

        if (args::GetBool(a, "wait", false)) {
            const int64_t timeoutSeconds = args::GetInt(a, "timeout", 60);
            if (timeoutSeconds <= 0) {
                throw ToolError(ErrorKind::InvalidParams, "timeout must be positive");
            }
            std::string line = shell ? command : quoteArgument(command);
            for (const auto& arg : arguments) {
                line += ' ';
                line += shell ? arg : quoteArgument(arg);
            }
            LOG_INFO("start_process (wait): {}", line);
            CommandOutput out = RunCommand(line, workingDir, {}, std::chrono::seconds(timeoutSeconds), stop);
            // The shell reports an unresolvable program as 127
            if (!shell && out.exitCode == 127 && out.stdoutText.empty()) {
                throw ToolError(ErrorKind::ResourceNotFound, "Command not found: " + command);
            }
            JSONValue::Object result;
            result["pid"] = std::make_shared<JSONValue>(out.pid);
            result["return_code"] = std::make_shared<JSONValue>(static_cast<int64_t>(out.exitCode));
            result["stdout"] = std::make_shared<JSONValue>(out.stdoutText);
            result["stderr"] = std::make_shared<JSONValue>(out.stderrText);
            metadata["completed"] = JSONValue(true);
            return ToolResult::Ok(JSONValue(result), std::move(metadata));
        }

        const int64_t pid = StartDetached(command, arguments, shell, workingDir);
        LOG_INFO("start_process: {} started as pid {}", command, pid);
        JSONValue::Object result;
        result["pid"] = std::make_shared<JSONValue>(pid);
        metadata["started"] = JSONValue(true);
        return ToolResult::Ok(JSONValue(result), std::move(metadata));
    }

private:
    std::shared_ptr<const security::Sandbox> sandbox;
};

#ifndef _WIN32
// Close-on-exec pipe, so concurrent children never hold each other's ends open.
int openPipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0) {
        return -1;
    }
    for (int i = 0; i < 2; ++i) {
        if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            return -1;
        }
    }
    return 0;
#endif
}
#endif

} // namespace

//==========================================================================================================
// Platform process table
//==========================================================================================================
std::vector<ProcessEntry> SnapshotProcesses() {
    std::vector<ProcessEntry> out;
#if defined(_WIN32)
    HANDLE snap = ::CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snap == INVALID_HANDLE_VALUE) {
        throw ToolError(ErrorKind::ToolExecution, "CreateToolhelp32Snapshot failed");
    }
    PROCESSENTRY32W pe{};
    pe.dwSize = sizeof(pe);
    if (::Process32FirstW(snap, &pe)) {
        do {
            ProcessEntry e;
            e.pid = static_cast<int64_t>(pe.th32ProcessID);
            e.parentPid = static_cast<int64_t>(pe.th32ParentProcessID);
            e.name = narrow(pe.szExeFile);
            e.status = "running";
            e.threads = static_cast<int64_t>(pe.cntThreads);
            e.rssBytes = processRss(pe.th32ProcessID);
            out.push_back(std::move(e));
        } while (::Process32NextW(snap, &pe));
    }
    ::CloseHandle(snap);
#elif defined(__linux__)
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isdigit(c); })) {
            continue;
        }
        if (auto p = FindProcess(std::stoll(name))) {
            out.push_back(std::move(p.value()));
        }
    }
    if (ec) {
        throw ToolError(ErrorKind::ToolExecution, "Cannot enumerate /proc: " + ec.message());
    }
#else
    throw ToolError(ErrorKind::PlatformNotSupported, "Process enumeration is not available on this platform");
#endif
    return out;
}

std::optional<ProcessEntry> FindProcess(int64_t pid) {
    if (pid < 0) {
        return std::nullopt;
    }
#if defined(_WIN32)
    for (auto& p : SnapshotProcesses()) {
        if (p.pid == pid) return p;
    }
    return std::nullopt;
#elif defined(__linux__)
    auto st = readStat(pid);
    if (!st.has_value()) {
        return std::nullopt;
    }
    ProcessEntry e;
    e.pid = pid;
    e.parentPid = st->ppid;
    e.name = st->name;
    e.status = stateName(st->state);
    readStatus(pid, e);
    return e;
#else
    throw ToolError(ErrorKind::PlatformNotSupported, "Process lookup is not available on this platform");
#endif
}

CommandOutput RunCommand(const std::string& command,
                         const std::optional<std::string>& workingDir,
                         const std::unordered_map<std::string, std::string>& extraEnv,
                         std::chrono::milliseconds timeout,
                         std::stop_token stop) {
    CommandOutput out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto appendCapped = [](std::string& dst, const char* data, std::size_t n, std::size_t cap) {
        if (dst.size() < cap) dst.append(data, std::min(n, cap - dst.size()));
    };
#ifdef _WIN32
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
    if (!::CreatePipe(&outRead, &outWrite, &sa, 0) || !::CreatePipe(&errRead, &errWrite, &sa, 0)) {
        throw ToolError(ErrorKind::ToolExecution, "CreatePipe failed");
    }
    ::SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    ::SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    // Environment block: current environment overlaid with extraEnv
    std::string envBlock;
    if (!extraEnv.empty()) {
        LPCH current = ::GetEnvironmentStringsA();
        for (LPCH p = current; p && *p; p += std::strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);
            if (eq != std::string::npos && extraEnv.count(entry.substr(0, eq))) continue;
            envBlock += entry;
            envBlock.push_back('\0');
        }
        if (current) ::FreeEnvironmentStringsA(current);
        for (const auto& [k, v] : extraEnv) {
            envBlock += k + "=" + v;
            envBlock.push_back('\0');
        }
        envBlock.push_back('\0');
    }

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;
    si.hStdInput = nullptr;
    PROCESS_INFORMATION pi{};
    std::string cmdline = "cmd.exe /c " + command;
    const BOOL created = ::CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                                          envBlock.empty() ? nullptr : envBlock.data(),
                                          workingDir ? workingDir->c_str() : nullptr, &si, &pi);
    ::CloseHandle(outWrite);
    ::CloseHandle(errWrite);
    if (!created) {
        ::CloseHandle(outRead);
        ::CloseHandle(errRead);
        throw ToolError(ErrorKind::ResourceNotFound, "Command not found: " + command);
    }
    out.pid = static_cast<int64_t>(pi.dwProcessId);
    char buf[4096];
    auto drain = [&](HANDLE h, std::string& dst, std::size_t cap) {
        DWORD avail = 0;
        while (::PeekNamedPipe(h, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
            DWORD got = 0;
            if (!::ReadFile(h, buf, std::min<DWORD>(avail, sizeof(buf)), &got, nullptr) || got == 0) break;
            appendCapped(dst, buf, got, cap);
        }
    };
    std::optional<ErrorKind> aborted;
    while (true) {
        drain(outRead, out.stdoutText, kMaxStdout);
        drain(errRead, out.stderrText, kMaxStderr);
        if (::WaitForSingleObject(pi.hProcess, 50) == WAIT_OBJECT_0) break;
        if (stop.stop_requested()) { aborted = ErrorKind::Cancelled; break; }
        if (std::chrono::steady_clock::now() >= deadline) { aborted = ErrorKind::Timeout; break; }
    }
    if (aborted) {
        ::TerminateProcess(pi.hProcess, 1);
        ::WaitForSingleObject(pi.hProcess, 5000);
    } else {
        drain(outRead, out.stdoutText, kMaxStdout);
        drain(errRead, out.stderrText, kMaxStderr);
        DWORD code = 0;
        ::GetExitCodeProcess(pi.hProcess, &code);
        out.exitCode = static_cast<int>(code);
    }
    ::CloseHandle(pi.hThread);
    ::CloseHandle(pi.hProcess);
    ::CloseHandle(outRead);
    ::CloseHandle(errRead);
#else
    int outPipe[2];
    int errPipe[2];
    if (openPipe(outPipe) != 0) {
        throw ToolError(ErrorKind::ToolExecution, std::string("pipe failed: ") + std::strerror(errno));
    }
    if (openPipe(errPipe) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        throw ToolError(ErrorKind::ToolExecution, std::string("pipe failed: ") + std::strerror(errno));
    }

    // Build argv/envp before fork; only async-signal-safe calls run in the child
    std::vector<std::string> envStrings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && extraEnv.count(entry.substr(0, eq))) continue;
        envStrings.push_back(std::move(entry));
    }
    for (const auto& [k, v] : extraEnv) envStrings.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : envStrings) envp.push_back(s.data());
    envp.push_back(nullptr);
    std::string shell = "/bin/sh", dashC = "-c", cmd = command;
    char* argv[] = {shell.data(), dashC.data(), cmd.data(), nullptr};
    const char* cwd = workingDir ? workingDir->c_str() : nullptr;

    const pid_t child = ::fork();
    if (child < 0) {
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
        throw ToolError(ErrorKind::ToolExecution, std::string("fork failed: ") + std::strerror(errno));
    }
    if (child == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        if (cwd && ::chdir(cwd) != 0) ::_exit(126);
        ::execve(shell.c_str(), argv, envp.data());
        ::_exit(127);
    }
    out.pid = static_cast<int64_t>(child);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    struct pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    bool outOpen = true, errOpen = true;
    std::optional<ErrorKind> aborted;
    char buf[4096];
    while (outOpen || errOpen) {
        if (stop.stop_requested()) { aborted = ErrorKind::Cancelled; break; }
        if (std::chrono::steady_clock::now() >= deadline) { aborted = ErrorKind::Timeout; break; }
        fds[0].fd = outOpen ? outPipe[0] : -1;
        fds[1].fd = errOpen ? errPipe[0] : -1;
        int rc = ::poll(fds, 2, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                if (i == 0) appendCapped(out.stdoutText, buf, static_cast<std::size_t>(n), kMaxStdout);
                else appendCapped(out.stderrText, buf, static_cast<std::size_t>(n), kMaxStderr);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                (i == 0 ? outOpen : errOpen) = false;
            }
        }
    }
    ::close(outPipe[0]);
    ::close(errPipe[0]);

    int status = 0;
    if (aborted) {
        ::kill(-child, SIGKILL);
        ::kill(child, SIGKILL);
        ::waitpid(child, &status, 0);
    } else {
        // Pipes closed; the shell may still be exiting
        while (true) {
            pid_t r = ::waitpid(child, &status, WNOHANG);
            if (r == child || (r < 0 && errno != EINTR)) break;
            if (stop.stop_requested()) { aborted = ErrorKind::Cancelled; }
            else if (std::chrono::steady_clock::now() >= deadline) { aborted = ErrorKind::Timeout; }
            if (aborted) {
                ::kill(-child, SIGKILL);
                ::kill(child, SIGKILL);
                ::waitpid(child, &status, 0);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    if (!aborted) {
        if (WIFEXITED(status)) out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) out.exitCode = 128 + WTERMSIG(status);
    }
#endif
    if (aborted == ErrorKind::Timeout) {
        throw ToolError(ErrorKind::Timeout, std::format("Command timed out after {} seconds",
                        std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
    }
    if (aborted == ErrorKind::Cancelled) {
        throw ToolError(ErrorKind::Cancelled, "Command cancelled");
    }
    return out;
}

int64_t StartDetached(const std::string& command,
                      const std::vector<std::string>& arguments,
                      bool shell,
                      const std::optional<std::string>& workingDir) {
    std::string line = command;
    for (const auto& arg : arguments) {
        line += ' ';
        line += shell ? arg : quoteArgument(arg);
    }
#ifdef _WIN32
    std::string cmdline = shell ? "cmd.exe /c " + line : quoteArgument(command) + line.substr(command.size());
    STARTUPINFOA si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    if (!::CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, FALSE,
                          DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr,
                          workingDir ? workingDir->c_str() : nullptr, &si, &pi)) {
        const DWORD err = ::GetLastError();
        if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) {
            throw ToolError(ErrorKind::ResourceNotFound, "Command not found: " + command);
        }
        if (err == ERROR_ACCESS_DENIED) {
            throw ToolError(ErrorKind::PermissionDenied, "Permission denied to execute: " + command);
        }
        throw ToolError(ErrorKind::ToolExecution, std::format("CreateProcess failed with error {}", err));
    }
    ::CloseHandle(pi.hThread);
    ::CloseHandle(pi.hProcess);
    return static_cast<int64_t>(pi.dwProcessId);
#else
    std::vector<std::string> argvStrings;
    if (shell) {
        argvStrings = {"/bin/sh", "-c", line};
    } else {
        argvStrings.push_back(command);
        argvStrings.insert(argvStrings.end(), arguments.begin(), arguments.end());
    }
    std::vector<char*> argv;
    for (auto& a : argvStrings) argv.push_back(a.data());
    argv.push_back(nullptr);
    const char* cwd = workingDir ? workingDir->c_str() : nullptr;

    // The child writes {stage, errno} here when chdir or exec fails; a successful exec closes it.
    int report[2];
    if (openPipe(report) != 0) {
        throw ToolError(ErrorKind::ToolExecution, std::string("pipe failed: ") + std::strerror(errno));
    }
    const pid_t child = ::fork();
    if (child < 0) {
        ::close(report[0]); ::close(report[1]);
        throw ToolError(ErrorKind::ToolExecution, std::string("fork failed: ") + std::strerror(errno));
    }
    if (child == 0) {
        ::setsid();
        int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        int failure[2] = {0, 0};
        if (cwd && ::chdir(cwd) != 0) {
            failure[1] = errno;
        } else {
            ::execvp(argv[0], argv.data());
            failure[0] = 1;
            failure[1] = errno;
        }
        const ssize_t written = ::write(report[1], failure, sizeof(failure));
        ::_exit(written == static_cast<ssize_t>(sizeof(failure)) ? 127 : 126);
    }
    ::close(report[1]);
    int failure[2] = {0, 0};
    ssize_t n = 0;
    do {
        n = ::read(report[0], failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(report[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(child, &status, 0);
        if (failure[0] == 0) {
            throw ToolError(ErrorKind::InvalidParams, "Cannot enter working directory: " + std::string(std::strerror(failure[1])));
        }
        if (failure[1] == ENOENT) {
            throw ToolError(ErrorKind::ResourceNotFound, "Command not found: " + command);
        }
        if (failure[1] == EACCES) {
            throw ToolError(ErrorKind::PermissionDenied, "Permission denied to execute: " + command);
        }
        throw ToolError(ErrorKind::ToolExecution, "Failed to start " + command + ": " + std::strerror(failure[1]));
    }

    // Reaped in the background so a detached child never lingers as a zombie
    std::thread([child]() {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
    }).detach();
    return static_cast<int64_t>(child);
#endif
}

void RegisterProcessTools(ToolRegistry& registry, std::shared_ptr<const security::Sandbox> sandbox) {
    registry.Register(std::make_shared<ListProcessesTool>(sandbox));
    registry.Register(std::make_shared<ProcessInfoTool>(sandbox));
    registry.Register(std::make_shared<StopProcessTool>(sandbox));
    registry.Register(std::make_shared<ExecuteCommandTool>(sandbox));
    registry.Register(std::make_shared<StartProcessTool>(sandbox));
}

} // namespace hostmcp::tools
