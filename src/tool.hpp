#pragma once
#include <string>
#include <optional>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolcage {

enum class ErrorKind {
    Validation,   // missing or malformed arguments
    Policy,       // forbidden pattern, not allowlisted, action not allowed
    Confinement,  // path escapes the workspace
    Timeout,
    Transport,    // network failure
    Spawn,        // subprocess could not be started
    UnknownTool,
    Parse,        // undecodable content or unrecoverable JSON
    Io,           // filesystem failure
};

const char* error_kind_name(ErrorKind kind);

struct ToolError {
    ErrorKind kind;
    std::string message;
};

// Either a success payload or a single error; never both.
class ToolResult {
public:
    static ToolResult ok(nlohmann::json payload);
    static ToolResult fail(ErrorKind kind, std::string message);
    static ToolResult fail(ToolError error);

    bool is_error() const { return std::holds_alternative<ToolError>(value_); }
    const nlohmann::json& payload() const { return std::get<nlohmann::json>(value_); }
    const ToolError& error() const { return std::get<ToolError>(value_); }

    // Payload as-is, or {"error": message}
    nlohmann::json to_json() const;

private:
    explicit ToolResult(std::variant<nlohmann::json, ToolError> value)
        : value_(std::move(value)) {}

    std::variant<nlohmann::json, ToolError> value_;
};

// ── Tool calls ──────────────────────────────────────────────────

struct ShellCall {
    std::string cmd;
};

struct ReadFileCall {
    std::string path;
};

struct WriteFileCall {
    std::string path;
    std::optional<std::string> content;
};

struct ListDirectoryCall {
    std::string path;
};

struct HttpRequestCall {
    std::string method;
    std::string url;
    nlohmann::json headers;  // object or null
    nlohmann::json body;     // object/array = JSON body, string = raw, null = none
};

struct GitCall {
    std::string action;
    std::string message;
    std::string branch;
    std::vector<std::string> files;
};

struct DockerCall {
    std::string action;
    std::string service;
    bool detach = true;
};

struct UnknownToolCall {
    std::string name;
};

using ToolCall = std::variant<ShellCall, ReadFileCall, WriteFileCall,
                              ListDirectoryCall, HttpRequestCall, GitCall,
                              DockerCall, UnknownToolCall>;

// Build a typed call from a model tool-call. Unrecognised names become
// UnknownToolCall. Returns an error for non-object arguments or fields of
// the wrong JSON type.
std::optional<ToolError> parse_tool_call(const std::string& name,
                                         const nlohmann::json& arguments,
                                         ToolCall& out);

// Name a call dispatches under ("shell", "read_file", ...)
std::string tool_call_name(const ToolCall& call);

// One function-calling schema entry in the {"type":"function",...} format
nlohmann::json make_tool_spec(const std::string& name,
                              const std::string& description,
                              const std::string& parameters_json);

} // namespace toolcage
