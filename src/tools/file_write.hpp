#pragma once
#include "../tool.hpp"
#include <string>

namespace toolcage {

class PathGuard;

class FileWriteTool {
public:
    explicit FileWriteTool(const PathGuard& guard) : guard_(guard) {}

    ToolResult execute(const WriteFileCall& call) const;

    static std::string description();
    static std::string parameters_json();

private:
    const PathGuard& guard_;
};

} // namespace toolcage
