#include "json_recovery.hpp"
#include "../util.hpp"

namespace toolcage {

std::string normalize_smart_quotes(const std::string& text) {
    std::string out = replace_all(text, "\xE2\x80\x9C", "\"");
    out = replace_all(out, "\xE2\x80\x9D", "\"");
    return replace_all(out, "\xE2\x80\x99", "'");
}

static std::string strip_code_fence(const std::string& text) {
    if (text.rfind("```", 0) != 0) return text;

    std::vector<std::string> lines = split(text, '\n');
    if (!lines.empty()) lines.erase(lines.begin());
    if (!lines.empty() && trim(lines.back()).rfind("```", 0) == 0) lines.pop_back();

    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += lines[i];
    }
    return trim(joined);
}

// Index of the brace closing the object opened at `start`, or npos
static size_t find_closing_brace(const std::string& s, size_t start) {
    bool in_string = false;
    bool escape = false;
    int depth = 0;
    for (size_t i = start; i < s.size(); ++i) {
        char ch = s[i];
        if (in_string) {
            if (escape) {
                escape = false;
            } else if (ch == '\\') {
                escape = true;
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }
        if (ch == '"') {
            in_string = true;
        } else if (ch == '{') {
            ++depth;
        } else if (ch == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

static std::optional<nlohmann::json> parse_object(const std::string& candidate) {
    auto parsed = nlohmann::json::parse(candidate, nullptr, false);
    if (parsed.is_discarded()) {
        parsed = nlohmann::json::parse(normalize_smart_quotes(candidate), nullptr, false);
    }
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

std::optional<nlohmann::json> extract_json_object(const std::string& text) {
    std::string s = strip_code_fence(trim(text));

    size_t start = s.find('{');
    while (start != std::string::npos) {
        size_t end = find_closing_brace(s, start);
        if (end != std::string::npos) {
            if (auto obj = parse_object(s.substr(start, end - start + 1))) return obj;
        }
        // Broken or unclosed candidate: rescan from the next opening brace
        start = s.find('{', start + 1);
    }
    return std::nullopt;
}

} // namespace toolcage
