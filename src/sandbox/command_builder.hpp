#pragma once
#include "../tool.hpp"
#include <optional>
#include <string>
#include <vector>

namespace toolcage {

enum class GitAction {
    Status, Log, Diff, Branch, Add, Commit, Push, Pull, Checkout,
    Stash, Fetch, Remote, Tag,
};

enum class DockerAction {
    Ps, Logs, Images, ComposeUp, ComposeDown, ComposePs, ComposeLogs,
};

std::optional<GitAction> parse_git_action(const std::string& name);
std::optional<DockerAction> parse_docker_action(const std::string& name);

// Sorted, comma-separated action names for error messages
std::string git_action_names();
std::string docker_action_names();

// Builds argument vectors for version-control and container actions.
// User-supplied values always occupy exactly one vector element and are
// never re-parsed by a shell.
class CommandBuilder {
public:
    static constexpr const char* kLogTail = "100";

    static std::optional<ToolError> build_git(const GitCall& call,
                                              std::vector<std::string>& argv);

    static std::optional<ToolError> build_docker(const DockerCall& call,
                                                 std::vector<std::string>& argv);
};

} // namespace toolcage
