#pragma once
#include <string>
#include <vector>
#include <utility>

namespace toolcage {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

enum class HttpError {
    None,
    Timeout,
    Transport,  // DNS, connect, TLS, malformed response
};

struct HttpResponse {
    long status_code = 0;
    std::vector<Header> headers;  // names as sent by the server
    std::string body;
    HttpError error = HttpError::None;
    std::string error_message;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Performs one request. A response with any status code is a success at
    // this level; only failures to obtain a response set `error`.
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds = 30) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace toolcage
