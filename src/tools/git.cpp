#include "git.hpp"
#include "argv_tool.hpp"
#include "tool_util.hpp"
#include "../sandbox/command_builder.hpp"

namespace toolcage {

ToolResult GitTool::execute(const GitCall& call) const {
    if (call.action.empty()) return ToolResult::fail(missing_parameter("action"));

    std::vector<std::string> argv;
    if (auto err = CommandBuilder::build_git(call, argv)) return ToolResult::fail(*err);
    return run_argv_tool(runner_, std::move(argv), workspace_, timeout_);
}

std::string GitTool::description() {
    return "Execute git operations: status, log, diff, branch, add, commit, push, pull, "
           "checkout, stash, fetch, remote, tag.";
}

std::string GitTool::parameters_json() {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["status","log","diff","branch","add","commit","push","pull","checkout","stash","fetch","remote","tag"],"description":"Git operation to perform"},"message":{"type":"string","description":"Commit message (required for action='commit')"},"branch":{"type":"string","description":"Branch name (for push, pull, checkout)"},"files":{"type":"string","description":"Files to add (for action='add', default='.')"}},"required":["action"]})json";
}

} // namespace toolcage
