#include "command_policy.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <iostream>

namespace toolcage {

CommandPolicy::CommandPolicy(std::set<std::string> allowed_commands,
                             std::vector<std::string> forbidden_patterns,
                             bool reject_command_chaining)
    : allowed_(std::move(allowed_commands)),
      reject_chaining_(reject_command_chaining) {
    forbidden_.reserve(forbidden_patterns.size());
    for (auto& pattern : forbidden_patterns) {
        if (!pattern.empty()) forbidden_.push_back(to_lower(pattern));
    }
}

CommandPolicy::CommandPolicy(const SecurityConfig& security)
    : CommandPolicy(security.allowed_commands, security.forbidden_patterns,
                    security.reject_command_chaining) {}

std::string CommandPolicy::leading_token_of(const std::string& command) {
    auto words = split_whitespace(command);
    if (words.empty()) return {};
    const std::string& first = words.front();
    return trim(first.substr(0, first.find('|')));
}

std::optional<ToolError> CommandPolicy::check_allowed(const std::string& token) const {
    if (allowed_.find(token) != allowed_.end()) return std::nullopt;

    std::string allowed;
    for (const auto& name : allowed_) {
        if (!allowed.empty()) allowed += ", ";
        allowed += name;
    }
    return ToolError{ErrorKind::Policy,
                     "Command not in allowlist: " + token + ". Allowed: " + allowed};
}

std::string CommandPolicy::find_chaining_operator(const std::string& command) {
    // "&&" before "&" so the longer operator is reported
    static const char* const kOperators[] = {"&&", "||", "&", ";", "`", "$(", "\n", "\r", ">"};
    for (const char* op : kOperators) {
        if (command.find(op) != std::string::npos) return op;
    }
    return {};
}

std::vector<std::string> CommandPolicy::pipeline_tokens_of(const std::string& command) {
    std::vector<std::string> tokens;
    for (const auto& segment : split(command, '|')) {
        auto words = split_whitespace(segment);
        tokens.push_back(words.empty() ? std::string() : words.front());
    }
    if (!command.empty() && command.back() == '|') tokens.emplace_back();
    return tokens;
}

std::optional<ToolError> CommandPolicy::validate(const std::string& raw_command,
                                                 std::string& leading_token) const {
    std::string cmd = trim(raw_command);
    if (cmd.empty()) {
        return ToolError{ErrorKind::Validation, "Empty command"};
    }

    // Trailing space lets patterns such as "dd " match at end of input
    std::string lowered = to_lower(cmd) + " ";
    for (const auto& pattern : forbidden_) {
        if (lowered.find(pattern) != std::string::npos) {
            std::cerr << "[policy] Rejected forbidden pattern '" << trim(pattern)
                      << "' in: " << cmd << "\n";
            return ToolError{ErrorKind::Policy,
                             "Forbidden pattern detected: '" + trim(pattern) + "' in: " + cmd};
        }
    }

    if (reject_chaining_) {
        std::string op = find_chaining_operator(cmd);
        if (!op.empty()) {
            if (op == ">") {
                std::cerr << "[policy] Rejected output redirection: " << cmd << "\n";
                return ToolError{ErrorKind::Policy,
                                 "Forbidden output redirection '>'; use write_file instead"};
            }
            std::string shown = (op == "\n" || op == "\r") ? "newline" : op;
            std::cerr << "[policy] Rejected command chaining (" << shown << "): " << cmd << "\n";
            return ToolError{ErrorKind::Policy,
                             "Forbidden command chaining operator '" + shown +
                                 "'; run one command per call"};
        }
    }

    std::string token = leading_token_of(cmd);
    if (auto err = check_allowed(token)) return err;

    // Every stage of a pipeline runs, so every stage must be allowlisted
    if (reject_chaining_) {
        for (const auto& stage : pipeline_tokens_of(cmd)) {
            if (auto err = check_allowed(stage)) {
                std::cerr << "[policy] Rejected pipeline stage '" << stage << "': " << cmd << "\n";
                return err;
            }
        }
    }

    leading_token = token;
    return std::nullopt;
}

} // namespace toolcage
