// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl): http_init/cleanup
// are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <string>

namespace toolcage {

void http_init() {}
void http_cleanup() {}

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& result) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return !result.host.empty();
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;
    bool     timed_out = false;

    explicit Connection(Clock::time_point until) : deadline(until) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long seconds_left() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - Clock::now());
        return std::max<long>(1, static_cast<long>(left.count()));
    }

    bool expired() {
        if (Clock::now() >= deadline) timed_out = true;
        return timed_out;
    }

    bool connect(const ParsedUrl& url, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "Cannot resolve host " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour the deadline.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{seconds_left(), 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                } else if (rc == 0) {
                    timed_out = true;
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "Cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        if (url.tls) {
            set_socket_timeout(seconds_left());

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS context setup failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS session setup failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                if (expired()) return false;
                unsigned long code = ERR_get_error();
                char buf[256];
                ERR_error_string_n(code, buf, sizeof(buf));
                error = "TLS handshake with " + url.host + " failed: " + buf;
                return false;
            }
        }

        // 1-second slices so the deadline is checked between reads.
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (expired()) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        std::string name = lowercase(h.first);
        if (name == "host" || name == "connection") continue;
        req += h.first + ": " + h.second + "\r\n";
        if (name == "content-length") has_content_length = true;
    }
    if (!body.empty() && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    std::vector<Header> headers;
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers.
static bool parse_response_head(Connection& conn, std::string& leftover,
                                ResponseHead& head) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK": extract the three-digit code
    if (status_line.rfind("HTTP/", 0) != 0) return false;
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return false;
    head.status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (head.status < 100 || head.status > 999) return false;

    std::string line;
    while (true) {
        if (!read_line(conn, leftover, line)) return false;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            value.pop_back();
        head.headers.emplace_back(name, value);

        std::string lname = lowercase(name);
        if (lname == "transfer-encoding") {
            head.chunked = (lowercase(value).find("chunked") != std::string::npos);
        } else if (lname == "content-length") {
            char* end = nullptr;
            unsigned long long len = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                head.has_length = true;
                head.content_length = static_cast<size_t>(len);
            }
        }
    }
    return true;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

static bool read_until_eof(Connection& conn, std::string& leftover,
                           std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
static bool read_body(Connection& conn, std::string& leftover,
                      const ResponseHead& head, std::string& body) {
    if (head.chunked) {
        std::string size_line;
        for (;;) {
            if (!read_line(conn, leftover, size_line)) return false;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false; // trailing \r\n
        }
    }
    if (head.has_length) {
        return read_exactly(conn, leftover, head.content_length, body);
    }
    return read_until_eof(conn, leftover, body);
}

static bool has_no_body(const std::string& method, long status) {
    return method == "HEAD" || status == 204 || status == 304 ||
           (status >= 100 && status < 200);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::request(const std::string& method,
                                       const std::string& url_str,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    HttpResponse resp;
    auto fail = [&resp](HttpError kind, std::string message) {
        resp.error = kind;
        resp.error_message = std::move(message);
        return resp;
    };

    ParsedUrl url;
    if (!parse_url(url_str, url)) return fail(HttpError::Transport, "Invalid URL: " + url_str);

    Connection conn(Clock::now() + std::chrono::seconds(timeout_seconds));
    const std::string timeout_message =
        "Request timed out after " + std::to_string(timeout_seconds) + " seconds";

    std::string connect_error;
    if (!conn.connect(url, connect_error)) {
        if (conn.timed_out) return fail(HttpError::Timeout, timeout_message);
        return fail(HttpError::Transport, connect_error);
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        if (conn.timed_out) return fail(HttpError::Timeout, timeout_message);
        return fail(HttpError::Transport, "Failed to send request to " + url.host);
    }

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) {
        if (conn.timed_out) return fail(HttpError::Timeout, timeout_message);
        return fail(HttpError::Transport, "Malformed or missing response from " + url.host);
    }

    resp.status_code = head.status;
    resp.headers = std::move(head.headers);
    if (has_no_body(method, head.status)) return resp;

    if (!read_body(conn, leftover, head, resp.body)) {
        if (conn.timed_out) return fail(HttpError::Timeout, timeout_message);
        return fail(HttpError::Transport, "Connection closed while reading response body");
    }
    return resp;
}

} // namespace toolcage

#endif // __linux__
