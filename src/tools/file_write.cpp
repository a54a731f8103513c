#include "file_write.hpp"
#include "tool_util.hpp"
#include "../sandbox/path_guard.hpp"
#include <filesystem>

namespace toolcage {

ToolResult FileWriteTool::execute(const WriteFileCall& call) const {
    std::filesystem::path target;
    if (auto err = guard_.resolve(call.path, target)) return ToolResult::fail(*err);
    if (!call.content) return ToolResult::fail(missing_parameter("content"));

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return ToolResult::fail(ErrorKind::Io, "Path is a directory: " + call.path);
    }

    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return ToolResult::fail(ErrorKind::Io,
                                    "Failed to create directories: " + ec.message());
        }
    }

    if (!atomic_write_file(target.string(), *call.content)) {
        return ToolResult::fail(ErrorKind::Io, "Failed to write file: " + call.path);
    }

    return ToolResult::ok({
        {"success", true},
        {"path", call.path},
        {"bytesWritten", call.content->size()},
    });
}

std::string FileWriteTool::description() {
    return "Write content to a file (creates or overwrites). Path must be relative to "
           "the workspace.";
}

std::string FileWriteTool::parameters_json() {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Relative path to the file (e.g. 'output.txt')"},"content":{"type":"string","description":"Content to write to the file"}},"required":["path","content"]})json";
}

} // namespace toolcage
