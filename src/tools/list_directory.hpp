#pragma once
#include "../tool.hpp"
#include <string>

namespace toolcage {

class PathGuard;

class ListDirectoryTool {
public:
    explicit ListDirectoryTool(const PathGuard& guard) : guard_(guard) {}

    ToolResult execute(const ListDirectoryCall& call) const;

    static std::string description();
    static std::string parameters_json();

private:
    const PathGuard& guard_;
};

} // namespace toolcage
