#include "command_builder.hpp"

#include <map>

namespace toolcage {

static const std::map<std::string, GitAction>& git_actions() {
    static const std::map<std::string, GitAction> actions = {
        {"status", GitAction::Status},     {"log", GitAction::Log},
        {"diff", GitAction::Diff},         {"branch", GitAction::Branch},
        {"add", GitAction::Add},           {"commit", GitAction::Commit},
        {"push", GitAction::Push},         {"pull", GitAction::Pull},
        {"checkout", GitAction::Checkout}, {"stash", GitAction::Stash},
        {"fetch", GitAction::Fetch},       {"remote", GitAction::Remote},
        {"tag", GitAction::Tag},
    };
    return actions;
}

static const std::map<std::string, DockerAction>& docker_actions() {
    static const std::map<std::string, DockerAction> actions = {
        {"ps", DockerAction::Ps},
        {"logs", DockerAction::Logs},
        {"images", DockerAction::Images},
        {"compose_up", DockerAction::ComposeUp},
        {"compose_down", DockerAction::ComposeDown},
        {"compose_ps", DockerAction::ComposePs},
        {"compose_logs", DockerAction::ComposeLogs},
    };
    return actions;
}

template <typename Map>
static std::string join_keys(const Map& map) {
    std::string out;
    for (const auto& entry : map) {
        if (!out.empty()) out += ", ";
        out += entry.first;
    }
    return out;
}

std::optional<GitAction> parse_git_action(const std::string& name) {
    auto it = git_actions().find(name);
    if (it == git_actions().end()) return std::nullopt;
    return it->second;
}

std::optional<DockerAction> parse_docker_action(const std::string& name) {
    auto it = docker_actions().find(name);
    if (it == docker_actions().end()) return std::nullopt;
    return it->second;
}

std::string git_action_names() { return join_keys(git_actions()); }
std::string docker_action_names() { return join_keys(docker_actions()); }

// Values that start with '-' would be parsed as options by git/docker
static std::optional<ToolError> reject_option_like(const char* field,
                                                   const std::string& value) {
    if (!value.empty() && value[0] == '-') {
        return ToolError{ErrorKind::Validation,
                         std::string("Parameter '") + field +
                             "' must not start with '-': " + value};
    }
    return std::nullopt;
}

std::optional<ToolError> CommandBuilder::build_git(const GitCall& call,
                                                   std::vector<std::string>& argv) {
    auto action = parse_git_action(call.action);
    if (!action) {
        return ToolError{ErrorKind::Policy,
                         "Git action not allowed: " + call.action +
                             ". Allowed: " + git_action_names()};
    }
    if (auto err = reject_option_like("branch", call.branch)) return err;

    std::vector<std::string> cmd{"git"};
    switch (*action) {
        case GitAction::Status:
            cmd.emplace_back("status");
            break;
        case GitAction::Log:
            cmd.insert(cmd.end(), {"log", "--oneline", "-10"});
            break;
        case GitAction::Diff:
            cmd.emplace_back("diff");
            break;
        case GitAction::Branch:
            cmd.emplace_back("branch");
            break;
        case GitAction::Add:
            cmd.insert(cmd.end(), {"add", "--"});
            if (call.files.empty()) {
                cmd.emplace_back(".");
            } else {
                for (const auto& file : call.files) {
                    if (auto err = reject_option_like("files", file)) return err;
                    cmd.push_back(file);
                }
            }
            break;
        case GitAction::Commit:
            if (call.message.empty()) {
                return ToolError{ErrorKind::Validation,
                                 "Git action 'commit' requires 'message'"};
            }
            cmd.insert(cmd.end(), {"commit", "-m", call.message});
            break;
        case GitAction::Push:
        case GitAction::Pull:
            cmd.emplace_back(*action == GitAction::Push ? "push" : "pull");
            if (!call.branch.empty()) {
                cmd.insert(cmd.end(), {"origin", call.branch});
            }
            break;
        case GitAction::Checkout:
            if (call.branch.empty()) {
                return ToolError{ErrorKind::Validation,
                                 "Git action 'checkout' requires 'branch'"};
            }
            cmd.insert(cmd.end(), {"checkout", call.branch});
            break;
        case GitAction::Stash:
            cmd.emplace_back("stash");
            break;
        case GitAction::Fetch:
            cmd.emplace_back("fetch");
            break;
        case GitAction::Remote:
            cmd.insert(cmd.end(), {"remote", "-v"});
            break;
        case GitAction::Tag:
            cmd.emplace_back("tag");
            break;
    }

    argv = std::move(cmd);
    return std::nullopt;
}

std::optional<ToolError> CommandBuilder::build_docker(const DockerCall& call,
                                                      std::vector<std::string>& argv) {
    auto action = parse_docker_action(call.action);
    if (!action) {
        return ToolError{ErrorKind::Policy,
                         "Docker action not allowed: " + call.action +
                             ". Allowed: " + docker_action_names()};
    }
    if (auto err = reject_option_like("service", call.service)) return err;

    std::vector<std::string> cmd;
    switch (*action) {
        case DockerAction::Ps:
            cmd = {"docker", "ps"};
            break;
        case DockerAction::Logs:
            if (call.service.empty()) {
                return ToolError{ErrorKind::Validation,
                                 "Docker action 'logs' requires 'service'"};
            }
            cmd = {"docker", "logs", "--tail", kLogTail, call.service};
            break;
        case DockerAction::Images:
            cmd = {"docker", "images"};
            break;
        case DockerAction::ComposeUp:
            cmd = {"docker-compose", "up"};
            if (call.detach) cmd.emplace_back("-d");
            break;
        case DockerAction::ComposeDown:
            cmd = {"docker-compose", "down"};
            break;
        case DockerAction::ComposePs:
            cmd = {"docker-compose", "ps"};
            break;
        case DockerAction::ComposeLogs:
            cmd = {"docker-compose", "logs", "--tail", kLogTail};
            if (!call.service.empty()) cmd.push_back(call.service);
            break;
    }

    argv = std::move(cmd);
    return std::nullopt;
}

} // namespace toolcage
