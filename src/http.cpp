#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace toolcage {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Collects "Name: value" lines; a new status line resets the list so only
// the final response's headers survive redirects and 100-continue.
static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* headers = static_cast<std::vector<Header>*>(userdata);
    std::string line(ptr, total);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string value = line.substr(colon + 1);
    while (!value.empty() && (value[0] == ' ' || value[0] == '\t')) value.erase(0, 1);
    headers->emplace_back(line.substr(0, colon), value);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::request(const std::string& method,
                                     const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = HttpError::Transport;
        response.error_message = "Failed to initialise HTTP client";
        return response;
    }

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_PROTOCOLS_STR, "http,https");

    if (method == "HEAD") {
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
    } else if (method == "GET") {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (!body.empty()) {
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
        response.error = HttpError::Timeout;
        response.error_message =
            "Request timed out after " + std::to_string(timeout_seconds) + " seconds";
    } else {
        response.error = HttpError::Transport;
        response.error_message = curl_easy_strerror(res);
    }
    return response;
}

} // namespace toolcage
