#pragma once
#include "../tool.hpp"
#include "../sandbox/process_runner.hpp"
#include "../util.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace toolcage {

// Run a built argument vector and shape the git/docker payload:
// stdout followed by stderr as `output` (malformed UTF-8 replaced), plus
// exit code and success flag.
inline ToolResult run_argv_tool(ProcessRunner& runner,
                                std::vector<std::string> argv,
                                const std::filesystem::path& workspace,
                                std::chrono::seconds timeout) {
    ProcessOutput out;
    if (auto err = runner.run(ArgvCommand{std::move(argv)}, workspace, timeout, out)) {
        return ToolResult::fail(*err);
    }
    return ToolResult::ok({
        {"output", sanitize_utf8(out.stdout_data + out.stderr_data)},
        {"exitCode", out.exit_code},
        {"success", out.success},
    });
}

} // namespace toolcage
