#pragma once
#include "../tool.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace toolcage {

class CommandPolicy;
class ProcessRunner;

class ShellTool {
public:
    ShellTool(const CommandPolicy& policy, ProcessRunner& runner,
              std::filesystem::path workspace, std::chrono::seconds timeout)
        : policy_(policy), runner_(runner),
          workspace_(std::move(workspace)), timeout_(timeout) {}

    ToolResult execute(const ShellCall& call) const;

    static std::string description();
    static std::string parameters_json();

private:
    const CommandPolicy& policy_;
    ProcessRunner& runner_;
    std::filesystem::path workspace_;
    std::chrono::seconds timeout_;
};

} // namespace toolcage
