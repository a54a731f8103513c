#include "file_read.hpp"
#include "tool_util.hpp"
#include "../sandbox/path_guard.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace toolcage {

ToolResult FileReadTool::execute(const ReadFileCall& call) const {
    std::filesystem::path target;
    if (auto err = guard_.resolve(call.path, target)) return ToolResult::fail(*err);

    std::error_code ec;
    auto status = std::filesystem::status(target, ec);
    if (ec || !std::filesystem::exists(status)) {
        return ToolResult::fail(ErrorKind::Io, "File not found: " + call.path);
    }
    if (!std::filesystem::is_regular_file(status)) {
        return ToolResult::fail(ErrorKind::Io, "Not a file: " + call.path);
    }

    auto size = std::filesystem::file_size(target, ec);
    if (ec) {
        return ToolResult::fail(ErrorKind::Io, "Cannot stat " + call.path + ": " + ec.message());
    }
    if (size > max_file_size_) {
        return ToolResult::fail(ErrorKind::Validation,
                                "File too large: " + std::to_string(size) +
                                    " bytes (limit " + std::to_string(max_file_size_) + ")");
    }

    std::ifstream file(target, std::ios::binary);
    if (!file.is_open()) {
        return ToolResult::fail(ErrorKind::Io, "Failed to open file: " + call.path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string contents = ss.str();

    if (!is_valid_utf8(contents)) {
        return ToolResult::fail(ErrorKind::Parse, "File is not valid UTF-8 text (binary?)");
    }

    return ToolResult::ok({
        {"content", contents},
        {"size", contents.size()},
        {"lineCount", count_lines(contents)},
    });
}

std::string FileReadTool::description() {
    return "Read the contents of a text file. Path must be relative to the workspace.";
}

std::string FileReadTool::parameters_json() {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Relative path to the file (e.g. 'src/main.py')"}},"required":["path"]})json";
}

} // namespace toolcage
