#pragma once
#include "tool.hpp"
#include "sandbox/command_policy.hpp"
#include "sandbox/path_guard.hpp"
#include "tools/docker.hpp"
#include "tools/file_read.hpp"
#include "tools/file_write.hpp"
#include "tools/git.hpp"
#include "tools/http_request.hpp"
#include "tools/list_directory.hpp"
#include "tools/shell.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace toolcage {

struct Config;
class HttpClient;
class ProcessRunner;

// Executes model tool-calls inside a workspace. Stateless between calls;
// execute() is const and may be called from several threads at once.
class ToolExecutor {
public:
    // Throws std::runtime_error if the workspace is not a directory.
    ToolExecutor(const Config& config, ProcessRunner& runner, HttpClient& http);

    // The tools hold references to guard_ and policy_
    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    // Never throws; every failure becomes an error result.
    ToolResult execute(const std::string& name, const nlohmann::json& arguments) const;
    ToolResult execute(const ToolCall& call) const;

    const PathGuard& path_guard() const { return guard_; }

    // Function-calling schemas of every tool, in dispatch order
    static nlohmann::json tool_specs();

private:
    PathGuard guard_;
    CommandPolicy policy_;

    ShellTool shell_;
    FileReadTool read_file_;
    FileWriteTool write_file_;
    ListDirectoryTool list_directory_;
    HttpRequestTool http_request_;
    GitTool git_;
    DockerTool docker_;
};

} // namespace toolcage
