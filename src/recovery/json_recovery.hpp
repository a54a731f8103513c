#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolcage {

// Find the first JSON object embedded in free-form model output. Handles
// surrounding prose, ``` fences and typographic quotes. Returns nullopt
// when no balanced candidate parses to an object.
std::optional<nlohmann::json> extract_json_object(const std::string& text);

// Replace U+201C/U+201D with '"' and U+2019 with '\''
std::string normalize_smart_quotes(const std::string& text);

} // namespace toolcage
