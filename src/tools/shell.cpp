#include "shell.hpp"
#include "tool_util.hpp"
#include "../sandbox/command_policy.hpp"
#include "../sandbox/process_runner.hpp"

namespace toolcage {

ToolResult ShellTool::execute(const ShellCall& call) const {
    if (call.cmd.empty()) return ToolResult::fail(missing_parameter("cmd"));

    std::string leading;
    if (auto err = policy_.validate(call.cmd, leading)) return ToolResult::fail(*err);

    ProcessOutput out;
    if (auto err = runner_.run(ShellCommand{trim(call.cmd)}, workspace_, timeout_, out)) {
        return ToolResult::fail(*err);
    }

    return ToolResult::ok({
        {"stdout", sanitize_utf8(out.stdout_data)},
        {"stderr", sanitize_utf8(out.stderr_data)},
        {"exitCode", out.exit_code},
        {"success", out.success},
    });
}

std::string ShellTool::description() {
    return "Execute a safe shell command in the workspace. Only allowlisted commands are "
           "permitted (ls, cat, grep, find, python, npm, git, docker, curl, etc). "
           "Destructive commands (rm, sudo, kill, shutdown) are blocked.";
}

std::string ShellTool::parameters_json() {
    return R"json({"type":"object","properties":{"cmd":{"type":"string","description":"The command to execute (e.g. 'ls -la', 'python3 script.py')"}},"required":["cmd"]})json";
}

} // namespace toolcage
