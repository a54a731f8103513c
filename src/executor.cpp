#include "executor.hpp"
#include "config.hpp"
#include <chrono>
#include <iostream>

namespace toolcage {

ToolExecutor::ToolExecutor(const Config& config, ProcessRunner& runner, HttpClient& http)
    : guard_(config.workspace_root()),
      policy_(config.security),
      shell_(policy_, runner, guard_.root(), std::chrono::seconds(config.timeouts.shell)),
      read_file_(guard_, config.security.max_file_size),
      write_file_(guard_),
      list_directory_(guard_),
      http_request_(http, std::chrono::seconds(config.timeouts.http)),
      git_(runner, guard_.root(), std::chrono::seconds(config.timeouts.git)),
      docker_(runner, guard_.root(), std::chrono::seconds(config.timeouts.docker)) {}

namespace {

struct Dispatch {
    const ShellTool& shell;
    const FileReadTool& read_file;
    const FileWriteTool& write_file;
    const ListDirectoryTool& list_directory;
    const HttpRequestTool& http_request;
    const GitTool& git;
    const DockerTool& docker;

    ToolResult operator()(const ShellCall& c) const { return shell.execute(c); }
    ToolResult operator()(const ReadFileCall& c) const { return read_file.execute(c); }
    ToolResult operator()(const WriteFileCall& c) const { return write_file.execute(c); }
    ToolResult operator()(const ListDirectoryCall& c) const { return list_directory.execute(c); }
    ToolResult operator()(const HttpRequestCall& c) const { return http_request.execute(c); }
    ToolResult operator()(const GitCall& c) const { return git.execute(c); }
    ToolResult operator()(const DockerCall& c) const { return docker.execute(c); }
    ToolResult operator()(const UnknownToolCall& c) const {
        return ToolResult::fail(ErrorKind::UnknownTool, "Unknown tool: " + c.name);
    }
};

} // namespace

ToolResult ToolExecutor::execute(const ToolCall& call) const {
    try {
        return std::visit(Dispatch{shell_, read_file_, write_file_, list_directory_,
                                   http_request_, git_, docker_},
                          call);
    } catch (const std::exception& e) {
        std::cerr << "[tool] " << tool_call_name(call) << " failed: " << e.what() << "\n";
        return ToolResult::fail(ErrorKind::Io,
                                "Tool " + tool_call_name(call) + " failed: " + e.what());
    }
}

ToolResult ToolExecutor::execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    ToolCall call;
    if (auto err = parse_tool_call(name, arguments, call)) return ToolResult::fail(*err);
    return execute(call);
}

nlohmann::json ToolExecutor::tool_specs() {
    return nlohmann::json::array({
        make_tool_spec("shell", ShellTool::description(), ShellTool::parameters_json()),
        make_tool_spec("read_file", FileReadTool::description(),
                       FileReadTool::parameters_json()),
        make_tool_spec("write_file", FileWriteTool::description(),
                       FileWriteTool::parameters_json()),
        make_tool_spec("list_directory", ListDirectoryTool::description(),
                       ListDirectoryTool::parameters_json()),
        make_tool_spec("http_request", HttpRequestTool::description(),
                       HttpRequestTool::parameters_json()),
        make_tool_spec("git", GitTool::description(), GitTool::parameters_json()),
        make_tool_spec("docker", DockerTool::description(), DockerTool::parameters_json()),
    });
}

} // namespace toolcage
