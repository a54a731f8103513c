#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace toolcage {

enum class NextAction { Retry, Finalize };

const char* next_action_name(NextAction action);

// Auditor verdict on one tool call
struct Reflection {
    bool success = false;
    std::string analysis;
    int peanuts_earned = 0;  // 1 on success, 0 otherwise
    NextAction next_action = NextAction::Retry;
    std::optional<std::string> improved_input;

    nlohmann::json to_json() const;
};

// Strictly validate and normalise an auditor reply. Returns nullopt when no
// object can be recovered or it does not match the reflection schema.
std::optional<Reflection> parse_reflection(const std::string& text);

// Verdict derived from the tool output alone
Reflection heuristic_reflection(const nlohmann::json& tool_output);

// parse_reflection, falling back to heuristic_reflection
Reflection audit_response(const std::string& text, const nlohmann::json& tool_output);

// System prompt describing the exact reply schema
std::string audit_system_prompt();

// User message for the auditor; tool output is cut at max_chars bytes.
std::string build_audit_prompt(const std::string& tool_name,
                               const std::string& task,
                               const nlohmann::json& tool_output,
                               size_t max_chars = 6000);

} // namespace toolcage
