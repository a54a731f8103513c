#include "docker.hpp"
#include "argv_tool.hpp"
#include "tool_util.hpp"
#include "../sandbox/command_builder.hpp"

namespace toolcage {

ToolResult DockerTool::execute(const DockerCall& call) const {
    if (call.action.empty()) return ToolResult::fail(missing_parameter("action"));

    std::vector<std::string> argv;
    if (auto err = CommandBuilder::build_docker(call, argv)) return ToolResult::fail(*err);
    return run_argv_tool(runner_, std::move(argv), workspace_, timeout_);
}

std::string DockerTool::description() {
    return "Execute docker and docker-compose operations: ps, logs, images, compose_up, "
           "compose_down, compose_ps, compose_logs.";
}

std::string DockerTool::parameters_json() {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["ps","logs","images","compose_up","compose_down","compose_ps","compose_logs"],"description":"Docker operation to perform"},"service":{"type":"string","description":"Service or container name (for logs)"},"detach":{"type":"boolean","description":"Run in background (for compose_up, default=true)"}},"required":["action"]})json";
}

} // namespace toolcage
