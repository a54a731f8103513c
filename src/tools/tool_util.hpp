#pragma once
#include "../tool.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolcage {

// Read an optional string field. Absent or null leaves `out` untouched;
// any other non-string type is a validation error.
inline std::optional<ToolError> optional_string(const nlohmann::json& args,
                                                const char* field,
                                                std::string& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        return ToolError{ErrorKind::Validation,
                         std::string("Parameter '") + field + "' must be a string"};
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

inline std::optional<ToolError> optional_bool(const nlohmann::json& args,
                                              const char* field,
                                              bool& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_boolean()) {
        return ToolError{ErrorKind::Validation,
                         std::string("Parameter '") + field + "' must be a boolean"};
    }
    out = args[field].get<bool>();
    return std::nullopt;
}

// A file list may be a whitespace-separated string or an array of strings.
inline std::optional<ToolError> optional_string_list(const nlohmann::json& args,
                                                     const char* field,
                                                     std::vector<std::string>& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    const auto& value = args[field];
    if (value.is_string()) {
        out = split_whitespace(value.get<std::string>());
        return std::nullopt;
    }
    if (value.is_array()) {
        out.clear();
        for (const auto& item : value) {
            if (!item.is_string()) {
                return ToolError{ErrorKind::Validation,
                                 std::string("Parameter '") + field +
                                     "' must contain only strings"};
            }
            out.push_back(item.get<std::string>());
        }
        return std::nullopt;
    }
    return ToolError{ErrorKind::Validation,
                     std::string("Parameter '") + field +
                         "' must be a string or an array of strings"};
}

// Error for a required field that is absent or empty
inline ToolError missing_parameter(const char* field) {
    return ToolError{ErrorKind::Validation,
                     std::string("Missing required parameter: ") + field};
}

} // namespace toolcage
