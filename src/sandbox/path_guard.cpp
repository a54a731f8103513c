#include "path_guard.hpp"

#include <deque>
#include <stdexcept>
#include <system_error>

namespace toolcage {

namespace fs = std::filesystem;

PathGuard::PathGuard(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec) || ec) {
        throw std::runtime_error("Workspace root is not a directory: " + root.string());
    }
    root_ = fs::canonical(root, ec);
    if (ec) {
        throw std::runtime_error("Unable to resolve workspace root " + root.string() +
                                 ": " + ec.message());
    }
}

bool PathGuard::is_within_root(const fs::path& root, const fs::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty()) break;  // trailing separator
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() || root_it->empty();
}

static void push_front_components(std::deque<fs::path>& pending, const fs::path& p) {
    std::deque<fs::path> parts;
    for (const auto& part : p.relative_path()) parts.push_back(part);
    pending.insert(pending.begin(), parts.begin(), parts.end());
}

std::optional<ToolError> PathGuard::resolve(const std::string& relative,
                                            fs::path& out) const {
    if (relative.empty()) {
        return ToolError{ErrorKind::Validation, "Missing required parameter: path"};
    }

    fs::path input(relative);
    fs::path current = input.is_absolute() ? input.root_path() : root_;
    std::deque<fs::path> pending;
    push_front_components(pending, input);

    // Walk component by component like realpath(3), following every
    // symlink (dangling ones included) but tolerating a missing tail.
    int hops = 0;
    while (!pending.empty()) {
        fs::path part = pending.front();
        pending.pop_front();

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            current = current.parent_path();
            continue;
        }

        fs::path next = current / part;
        std::error_code ec;
        auto status = fs::symlink_status(next, ec);
        if (ec || !fs::is_symlink(status)) {
            current = next;
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            return ToolError{ErrorKind::Confinement,
                             "Too many levels of symbolic links: " + relative};
        }
        fs::path target = fs::read_symlink(next, ec);
        if (ec) {
            return ToolError{ErrorKind::Io,
                             "Unable to read symbolic link " + relative + ": " + ec.message()};
        }
        if (target.is_absolute()) current = target.root_path();
        push_front_components(pending, target);
    }

    fs::path resolved = current.lexically_normal();
    if (!is_within_root(root_, resolved)) {
        return ToolError{ErrorKind::Confinement,
                         "Path traversal blocked: '" + relative +
                             "' resolves outside the workspace"};
    }

    out = resolved;
    return std::nullopt;
}

} // namespace toolcage
