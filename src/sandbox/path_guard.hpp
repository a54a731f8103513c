#pragma once
#include "../tool.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace toolcage {

// Confines request paths to a workspace root. Symlinks are resolved before
// the containment check, so a link pointing outside the root is rejected.
class PathGuard {
public:
    // Throws std::runtime_error if root is not an existing directory.
    explicit PathGuard(const std::filesystem::path& root);

    // Resolve `relative` under the root into `out`.
    std::optional<ToolError> resolve(const std::string& relative,
                                     std::filesystem::path& out) const;

    const std::filesystem::path& root() const { return root_; }

    // Component-wise prefix test on already canonical paths
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

private:
    static constexpr int kMaxSymlinkHops = 40;

    std::filesystem::path root_;  // canonical
};

} // namespace toolcage
