#pragma once
#include "../tool.hpp"
#include <cstdint>
#include <string>

namespace toolcage {

class PathGuard;

class FileReadTool {
public:
    FileReadTool(const PathGuard& guard, uint64_t max_file_size)
        : guard_(guard), max_file_size_(max_file_size) {}

    ToolResult execute(const ReadFileCall& call) const;

    static std::string description();
    static std::string parameters_json();

private:
    const PathGuard& guard_;
    uint64_t max_file_size_;
};

} // namespace toolcage
