#pragma once
#include "../tool.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace toolcage {

class ProcessRunner;

class GitTool {
public:
    GitTool(ProcessRunner& runner, std::filesystem::path workspace,
            std::chrono::seconds timeout)
        : runner_(runner), workspace_(std::move(workspace)), timeout_(timeout) {}

    ToolResult execute(const GitCall& call) const;

    static std::string description();
    static std::string parameters_json();

private:
    ProcessRunner& runner_;
    std::filesystem::path workspace_;
    std::chrono::seconds timeout_;
};

} // namespace toolcage
