#pragma once
#include "../tool.hpp"
#include <chrono>
#include <string>

namespace toolcage {

class HttpClient;

class HttpRequestTool {
public:
    HttpRequestTool(HttpClient& client, std::chrono::seconds timeout)
        : client_(client), timeout_(timeout) {}

    ToolResult execute(const HttpRequestCall& call) const;

    static std::string description();
    static std::string parameters_json();

    // GET, POST, PUT, DELETE, PATCH, HEAD
    static bool is_supported_method(const std::string& upper_method);

private:
    HttpClient& client_;
    std::chrono::seconds timeout_;
};

} // namespace toolcage
