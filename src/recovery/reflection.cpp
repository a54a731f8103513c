#include "reflection.hpp"
#include "json_recovery.hpp"
#include "../util.hpp"

namespace toolcage {

const char* next_action_name(NextAction action) {
    switch (action) {
        case NextAction::Retry:    return "retry";
        case NextAction::Finalize: return "finalize";
    }
    return "retry";
}

nlohmann::json Reflection::to_json() const {
    return {
        {"success", success},
        {"analysis", analysis},
        {"peanuts_earned", peanuts_earned},
        {"next_action", next_action_name(next_action)},
        {"improved_input", improved_input ? nlohmann::json(*improved_input) : nullptr},
    };
}

static std::string dump_lenient(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<Reflection> parse_reflection(const std::string& text) {
    auto obj = extract_json_object(text);
    if (!obj) return std::nullopt;
    const auto& j = *obj;

    auto success = j.find("success");
    auto analysis = j.find("analysis");
    auto peanuts = j.find("peanuts_earned");
    auto next = j.find("next_action");
    if (success == j.end() || !success->is_boolean()) return std::nullopt;
    if (analysis == j.end() || !analysis->is_string() ||
        analysis->get<std::string>().empty()) return std::nullopt;
    if (peanuts == j.end() || !peanuts->is_number_integer()) return std::nullopt;
    if (next == j.end() || !next->is_string()) return std::nullopt;

    Reflection r;
    r.success = success->get<bool>();
    r.analysis = analysis->get<std::string>();

    auto earned = peanuts->get<int64_t>();
    if (earned < 0 || earned > 1) return std::nullopt;
    r.peanuts_earned = static_cast<int>(earned);

    std::string action = next->get<std::string>();
    if (action == "retry") {
        r.next_action = NextAction::Retry;
    } else if (action == "finalize") {
        r.next_action = NextAction::Finalize;
    } else {
        return std::nullopt;
    }

    auto improved = j.find("improved_input");
    if (improved != j.end() && !improved->is_null()) {
        if (!improved->is_string()) return std::nullopt;
        r.improved_input = improved->get<std::string>();
    }

    // The verdict decides the rest
    if (r.success) {
        r.peanuts_earned = 1;
        r.next_action = NextAction::Finalize;
        r.improved_input.reset();
    } else {
        r.peanuts_earned = 0;
        r.next_action = NextAction::Retry;
        if (r.improved_input && trim(*r.improved_input).empty()) r.improved_input.reset();
    }
    return r;
}

Reflection heuristic_reflection(const nlohmann::json& tool_output) {
    std::string lowered = to_lower(dump_lenient(tool_output));
    bool looks_error = lowered.find("error") != std::string::npos ||
                       lowered.find("exception") != std::string::npos ||
                       lowered.find("traceback") != std::string::npos;

    if (tool_output.is_object()) {
        auto success = tool_output.find("success");
        if (success != tool_output.end() && success->is_boolean() && !success->get<bool>()) {
            looks_error = true;
        }
        auto exit_code = tool_output.find("exitCode");
        if (exit_code != tool_output.end() && exit_code->is_number_integer() &&
            exit_code->get<int64_t>() != 0) {
            looks_error = true;
        }
    }

    Reflection r;
    if (looks_error) {
        r.success = false;
        r.analysis = "The output looks like an error or a failed execution. "
                     "Adjust the arguments or simplify the call.";
        r.peanuts_earned = 0;
        r.next_action = NextAction::Retry;
    } else {
        r.success = true;
        r.analysis = "The output looks valid and useful for the task.";
        r.peanuts_earned = 1;
        r.next_action = NextAction::Finalize;
    }
    return r;
}

Reflection audit_response(const std::string& text, const nlohmann::json& tool_output) {
    if (auto parsed = parse_reflection(text)) return *parsed;
    return heuristic_reflection(tool_output);
}

std::string audit_system_prompt() {
    return "You are an extremely strict quality auditor.\n"
           "Rules:\n"
           "- Reply ONLY with one valid JSON object (no markdown, no extra text).\n"
           "- If the output is an error, is empty or does not complete the task: success=false.\n"
           "- If success=false: next_action=\"retry\" and suggest improved_input (ideally JSON).\n"
           "- If success=true: next_action=\"finalize\" and peanuts_earned=1.\n"
           "- peanuts_earned: 1 if success=true, 0 if success=false.\n"
           "EXACT schema:\n"
           "{\"success\": bool, \"analysis\": str, \"peanuts_earned\": 0|1, "
           "\"next_action\": \"retry\"|\"finalize\", \"improved_input\": str|null}";
}

// Largest prefix of at most max_bytes that does not split a UTF-8 sequence
static size_t utf8_prefix_length(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s.size();
    size_t len = max_bytes;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) --len;
    return len;
}

std::string build_audit_prompt(const std::string& tool_name,
                               const std::string& task,
                               const nlohmann::json& tool_output,
                               size_t max_chars) {
    std::string output = dump_lenient(tool_output);
    if (output.size() > max_chars) {
        output = output.substr(0, utf8_prefix_length(output, max_chars)) + "...(truncated)";
    }

    return "TOOL: " + tool_name + "\n"
           "USER_TASK: " + task + "\n"
           "TOOL_OUTPUT: " + output + "\n\n"
           "Evaluate whether it completed the user's task. Reply with JSON only.";
}

} // namespace toolcage
