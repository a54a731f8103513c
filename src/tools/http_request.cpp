#include "http_request.hpp"
#include "tool_util.hpp"
#include "../http.hpp"
#include <algorithm>
#include <cctype>

namespace toolcage {

bool HttpRequestTool::is_supported_method(const std::string& upper_method) {
    static const char* const kMethods[] = {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD"};
    return std::any_of(std::begin(kMethods), std::end(kMethods),
                       [&](const char* m) { return upper_method == m; });
}

static std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static bool has_header(const std::vector<Header>& headers, const std::string& name) {
    std::string wanted = to_lower(name);
    return std::any_of(headers.begin(), headers.end(),
                       [&](const Header& h) { return to_lower(h.first) == wanted; });
}

ToolResult HttpRequestTool::execute(const HttpRequestCall& call) const {
    if (call.method.empty()) return ToolResult::fail(missing_parameter("method"));
    if (call.url.empty()) return ToolResult::fail(missing_parameter("url"));

    std::string method = to_upper(call.method);
    if (!is_supported_method(method)) {
        return ToolResult::fail(ErrorKind::Validation, "Unsupported method: " + call.method);
    }

    std::string scheme = to_lower(call.url.substr(0, call.url.find("://")));
    if (call.url.find("://") == std::string::npos || (scheme != "http" && scheme != "https")) {
        return ToolResult::fail(ErrorKind::Validation,
                                "URL must use http or https: " + call.url);
    }

    if (!call.body.is_null() && !call.body.is_string() && !call.body.is_structured()) {
        return ToolResult::fail(ErrorKind::Validation,
                                "Parameter 'body' must be an object, array or string");
    }

    std::vector<Header> headers;
    if (call.headers.is_object()) {
        for (auto& [name, value] : call.headers.items()) {
            headers.emplace_back(name, value.get<std::string>());
        }
    }

    std::string body;
    if (call.body.is_string()) {
        body = call.body.get<std::string>();
    } else if (call.body.is_structured()) {
        body = call.body.dump();
        if (!has_header(headers, "Content-Type")) {
            headers.emplace_back("Content-Type", "application/json");
        }
    }

    HttpResponse resp = client_.request(method, call.url, body, headers,
                                        static_cast<long>(timeout_.count()));
    switch (resp.error) {
        case HttpError::None:
            break;
        case HttpError::Timeout:
            return ToolResult::fail(ErrorKind::Timeout, resp.error_message);
        case HttpError::Transport:
            return ToolResult::fail(ErrorKind::Transport,
                                    "Request failed: " + resp.error_message);
    }

    nlohmann::json response_headers = nlohmann::json::object();
    for (const auto& h : resp.headers) {
        auto it = response_headers.find(h.first);
        if (it != response_headers.end()) {
            *it = it->get<std::string>() + ", " + sanitize_utf8(h.second);
        } else {
            response_headers[sanitize_utf8(h.first)] = sanitize_utf8(h.second);
        }
    }

    // JSON when the body parses, raw text otherwise (binary bodies are lossy)
    nlohmann::json parsed = nlohmann::json::parse(resp.body, nullptr, false);
    nlohmann::json response_body =
        parsed.is_discarded() ? nlohmann::json(sanitize_utf8(resp.body)) : parsed;

    return ToolResult::ok({
        {"statusCode", resp.status_code},
        {"headers", response_headers},
        {"body", response_body},
        {"success", resp.status_code >= 200 && resp.status_code < 300},
    });
}

std::string HttpRequestTool::description() {
    return "Make an HTTP request to a URL.";
}

std::string HttpRequestTool::parameters_json() {
    return R"json({"type":"object","properties":{"method":{"type":"string","enum":["GET","POST","PUT","DELETE","PATCH","HEAD"],"description":"HTTP method"},"url":{"type":"string","description":"Full URL (e.g. 'https://api.example.com/data')"},"headers":{"type":"object","description":"Optional HTTP headers"},"body":{"description":"Request body: an object or array is sent as JSON, a string as raw text"}},"required":["method","url"]})json";
}

} // namespace toolcage
