#pragma once
#include "../tool.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace toolcage {

struct SecurityConfig;

// Allowlist/denylist classification of free-text shell commands.
// Immutable after construction; safe to share across threads.
class CommandPolicy {
public:
    CommandPolicy(std::set<std::string> allowed_commands,
                  std::vector<std::string> forbidden_patterns,
                  bool reject_command_chaining);
    explicit CommandPolicy(const SecurityConfig& security);

    // On success stores the leading command token in `leading_token`.
    // Forbidden patterns are checked before the allowlist, so an allowed
    // leading token cannot carry a forbidden tail.
    std::optional<ToolError> validate(const std::string& raw_command,
                                      std::string& leading_token) const;

    // First whitespace segment, then the part before the first '|'
    static std::string leading_token_of(const std::string& command);

    // First chaining operator (or '>' redirection) in the command, or empty
    static std::string find_chaining_operator(const std::string& command);

    // Leading token of every '|' stage; an empty stage yields ""
    static std::vector<std::string> pipeline_tokens_of(const std::string& command);

    const std::set<std::string>& allowed_commands() const { return allowed_; }

private:
    std::optional<ToolError> check_allowed(const std::string& token) const;

    std::set<std::string> allowed_;
    std::vector<std::string> forbidden_;  // lower-cased
    bool reject_chaining_;
};

} // namespace toolcage
