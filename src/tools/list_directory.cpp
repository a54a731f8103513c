#include "list_directory.hpp"
#include "../sandbox/path_guard.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>

namespace toolcage {

ToolResult ListDirectoryTool::execute(const ListDirectoryCall& call) const {
    const std::string requested = call.path.empty() ? "." : call.path;

    std::filesystem::path dir;
    if (auto err = guard_.resolve(requested, dir)) return ToolResult::fail(*err);

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return ToolResult::fail(ErrorKind::Io, "Directory not found: " + requested);
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        return ToolResult::fail(ErrorKind::Io, "Not a directory: " + requested);
    }

    std::vector<std::filesystem::directory_entry> entries;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return ToolResult::fail(ErrorKind::Io,
                                "Cannot list " + requested + ": " + ec.message());
    }
    for (const auto& entry : it) entries.push_back(entry);
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    nlohmann::json items = nlohmann::json::array();
    for (const auto& entry : entries) {
        std::error_code entry_ec;
        bool is_dir = entry.is_directory(entry_ec);
        nlohmann::json item = {
            {"name", sanitize_utf8(entry.path().filename().string())},
            {"type", is_dir ? "dir" : "file"},
            {"size", nullptr},
        };
        if (!is_dir && entry.is_regular_file(entry_ec)) {
            auto size = entry.file_size(entry_ec);
            if (!entry_ec) item["size"] = size;
        }
        items.push_back(std::move(item));
    }

    return ToolResult::ok({
        {"path", requested},
        {"items", items},
        {"count", items.size()},
    });
}

std::string ListDirectoryTool::description() {
    return "List files and directories at a given path within the workspace.";
}

std::string ListDirectoryTool::parameters_json() {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Relative directory path (use '.' for the workspace root)"}},"required":["path"]})json";
}

} // namespace toolcage
