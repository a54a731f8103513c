#include "tool.hpp"
#include "tools/tool_util.hpp"

namespace toolcage {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::Policy:      return "policy";
        case ErrorKind::Confinement: return "confinement";
        case ErrorKind::Timeout:     return "timeout";
        case ErrorKind::Transport:   return "transport";
        case ErrorKind::Spawn:       return "spawn";
        case ErrorKind::UnknownTool: return "unknown_tool";
        case ErrorKind::Parse:       return "parse";
        case ErrorKind::Io:          return "io";
    }
    return "unknown";
}

ToolResult ToolResult::ok(nlohmann::json payload) {
    return ToolResult(std::variant<nlohmann::json, ToolError>(
        std::in_place_index<0>, std::move(payload)));
}

ToolResult ToolResult::fail(ErrorKind kind, std::string message) {
    return fail(ToolError{kind, std::move(message)});
}

ToolResult ToolResult::fail(ToolError error) {
    return ToolResult(std::variant<nlohmann::json, ToolError>(
        std::in_place_index<1>, std::move(error)));
}

nlohmann::json ToolResult::to_json() const {
    if (is_error()) {
        return {{"error", error().message}};
    }
    return payload();
}

// ── Parsing ─────────────────────────────────────────────────────

static std::optional<ToolError> parse_http_call(const nlohmann::json& args,
                                                HttpRequestCall& call) {
    if (auto err = optional_string(args, "method", call.method)) return err;
    if (auto err = optional_string(args, "url", call.url)) return err;

    if (args.contains("headers") && !args["headers"].is_null()) {
        const auto& headers = args["headers"];
        if (!headers.is_object()) {
            return ToolError{ErrorKind::Validation, "Parameter 'headers' must be an object"};
        }
        for (auto& [name, value] : headers.items()) {
            if (!value.is_string()) {
                return ToolError{ErrorKind::Validation,
                                 "Header '" + name + "' must be a string"};
            }
        }
        call.headers = headers;
    }

    if (args.contains("body")) call.body = args["body"];
    return std::nullopt;
}

std::optional<ToolError> parse_tool_call(const std::string& name,
                                         const nlohmann::json& arguments,
                                         ToolCall& out) {
    // A null argument set is treated as an empty one
    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return ToolError{ErrorKind::Validation, "Tool arguments must be a JSON object"};
    }

    if (name == "shell") {
        ShellCall call;
        if (auto err = optional_string(args, "cmd", call.cmd)) return err;
        out = std::move(call);
    } else if (name == "read_file") {
        ReadFileCall call;
        if (auto err = optional_string(args, "path", call.path)) return err;
        out = std::move(call);
    } else if (name == "write_file") {
        WriteFileCall call;
        if (auto err = optional_string(args, "path", call.path)) return err;
        std::string content;
        if (args.contains("content") && !args["content"].is_null()) {
            if (auto err = optional_string(args, "content", content)) return err;
            call.content = std::move(content);
        }
        out = std::move(call);
    } else if (name == "list_directory") {
        ListDirectoryCall call;
        if (auto err = optional_string(args, "path", call.path)) return err;
        out = std::move(call);
    } else if (name == "http_request") {
        HttpRequestCall call;
        if (auto err = parse_http_call(args, call)) return err;
        out = std::move(call);
    } else if (name == "git") {
        GitCall call;
        if (auto err = optional_string(args, "action", call.action)) return err;
        if (auto err = optional_string(args, "message", call.message)) return err;
        if (auto err = optional_string(args, "branch", call.branch)) return err;
        if (auto err = optional_string_list(args, "files", call.files)) return err;
        out = std::move(call);
    } else if (name == "docker") {
        DockerCall call;
        if (auto err = optional_string(args, "action", call.action)) return err;
        if (auto err = optional_string(args, "service", call.service)) return err;
        if (auto err = optional_bool(args, "detach", call.detach)) return err;
        out = std::move(call);
    } else {
        out = UnknownToolCall{name};
    }
    return std::nullopt;
}

namespace {

struct CallNamer {
    std::string operator()(const ShellCall&) const { return "shell"; }
    std::string operator()(const ReadFileCall&) const { return "read_file"; }
    std::string operator()(const WriteFileCall&) const { return "write_file"; }
    std::string operator()(const ListDirectoryCall&) const { return "list_directory"; }
    std::string operator()(const HttpRequestCall&) const { return "http_request"; }
    std::string operator()(const GitCall&) const { return "git"; }
    std::string operator()(const DockerCall&) const { return "docker"; }
    std::string operator()(const UnknownToolCall& c) const { return c.name; }
};

} // namespace

std::string tool_call_name(const ToolCall& call) {
    return std::visit(CallNamer{}, call);
}

nlohmann::json make_tool_spec(const std::string& name,
                              const std::string& description,
                              const std::string& parameters_json) {
    return {
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", nlohmann::json::parse(parameters_json)}
        }}
    };
}

} // namespace toolcage
