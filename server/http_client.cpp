// server/http_client.cpp
#include "http_client.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

using Clock = std::chrono::steady_clock;

namespace {

std::string tls_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Socket + optional TLS session for a single request.
class Connection {
private:
    int fd{-1};
    std::unique_ptr<SSL, decltype(&SSL_free)> ssl{nullptr, SSL_free};
    Clock::time_point deadline;

    void wait(short events, const char* what) {
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                throw WriteError(WriteErrorKind::Timeout, std::string("Timed out while ") + what);
            }
            pollfd pfd{fd, events, 0};
            int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc > 0) return;
            if (rc == 0) {
                throw WriteError(WriteErrorKind::Timeout, std::string("Timed out while ") + what);
            }
            if (errno != EINTR) {
                throw WriteError(WriteErrorKind::BackendUnreachable,
                                 std::string("poll() failed: ") + std::strerror(errno));
            }
        }
    }

    // Waits for whatever the TLS engine asked for; throws on fatal errors.
    void wait_tls(int ret, const char* what) {
        int err = SSL_get_error(ssl.get(), ret);
        if (err == SSL_ERROR_WANT_READ) {
            wait(POLLIN, what);
        } else if (err == SSL_ERROR_WANT_WRITE) {
            wait(POLLOUT, what);
        } else {
            throw WriteError(WriteErrorKind::BackendUnreachable,
                             std::string("TLS failure while ") + what + ": " + tls_error_string());
        }
    }

public:
    explicit Connection(Clock::time_point d) : deadline(d) {}

    ~Connection() {
        if (ssl) {
            SSL_shutdown(ssl.get());
            ERR_clear_error();
        }
        if (fd != -1) close(fd);
    }

    void open(const Url& url) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* result = nullptr;
        int rc = getaddrinfo(url.host.c_str(), std::to_string(url.port).c_str(), &hints, &result);
        if (rc != 0) {
            throw WriteError(WriteErrorKind::BackendUnreachable,
                             "Cannot resolve " + url.host + ": " + gai_strerror(rc));
        }
        std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(result, freeaddrinfo);
        // getaddrinfo cannot be interrupted; a slow lookup still counts against the deadline.
        if (Clock::now() >= deadline) {
            throw WriteError(WriteErrorKind::Timeout, "Timed out while resolving " + url.host);
        }

        std::string last_error = "no address";
        for (struct addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
            fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
            if (fd < 0) {
                last_error = std::strerror(errno);
                continue;
            }

            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return;
            if (errno == EINPROGRESS) {
                wait(POLLOUT, "connecting");
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error == 0) return;
                last_error = std::strerror(so_error);
            } else {
                last_error = std::strerror(errno);
            }
            close(fd);
            fd = -1;
        }
        throw WriteError(WriteErrorKind::BackendUnreachable,
                         "Cannot connect to " + url.host + ":" + std::to_string(url.port) + " (" + last_error + ")");
    }

    void start_tls(SSL_CTX* context, const std::string& host, bool verify) {
        ssl.reset(SSL_new(context));
        if (!ssl) {
            throw WriteError(WriteErrorKind::BackendUnreachable, "SSL_new failed: " + tls_error_string());
        }
        SSL_set_fd(ssl.get(), fd);
        SSL_set_tlsext_host_name(ssl.get(), host.c_str());
        if (verify) {
            SSL_set1_host(ssl.get(), host.c_str());
        }

        while (true) {
            int ret = SSL_connect(ssl.get());
            if (ret == 1) break;
            wait_tls(ret, "negotiating TLS");
        }
    }

    void send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            if (ssl) {
                int ret = SSL_write(ssl.get(), data.data() + sent, static_cast<int>(data.size() - sent));
                if (ret > 0) {
                    sent += static_cast<size_t>(ret);
                } else {
                    wait_tls(ret, "sending request");
                }
                continue;
            }

            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<size_t>(n);
            } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                wait(POLLOUT, "sending request");
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                throw WriteError(WriteErrorKind::BackendUnreachable,
                                 std::string("send() failed: ") + std::strerror(errno));
            }
        }
    }

    // Appends available bytes to `out`. Returns false at end of stream.
    bool read_some(std::string& out) {
        char buf[4096];
        while (true) {
            if (ssl) {
                int ret = SSL_read(ssl.get(), buf, sizeof(buf));
                if (ret > 0) {
                    out.append(buf, static_cast<size_t>(ret));
                    return true;
                }
                int err = SSL_get_error(ssl.get(), ret);
                if (err == SSL_ERROR_ZERO_RETURN) return false;
                if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return false;
                wait_tls(ret, "reading response");
                continue;
            }

            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                return true;
            }
            if (n == 0) return false;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                wait(POLLIN, "reading response");
            } else if (errno != EINTR) {
                throw WriteError(WriteErrorKind::BackendUnreachable,
                                 std::string("recv() failed: ") + std::strerror(errno));
            }
        }
    }
};

std::string decode_chunked(const std::string& data) {
    std::string out;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t eol = data.find("\r\n", pos);
        if (eol == std::string::npos) break;
        size_t length = std::strtoul(data.substr(pos, eol - pos).c_str(), nullptr, 16);
        pos = eol + 2;
        if (length == 0) break;
        out.append(data, pos, std::min(length, data.size() - pos));
        pos += length + 2;
    }
    return out;
}

HttpResponse parse_response(const std::string& raw, size_t header_end) {
    HttpResponse response;

    size_t line_end = raw.find("\r\n");
    std::string status_line = raw.substr(0, line_end);
    size_t space = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) {
        throw WriteError(WriteErrorKind::BackendUnreachable, "Malformed HTTP status line: " + status_line);
    }
    response.status = std::atoi(status_line.c_str() + space + 1);
    if (response.status < 100 || response.status > 599) {
        throw WriteError(WriteErrorKind::BackendUnreachable, "Malformed HTTP status line: " + status_line);
    }

    std::string headers = lower(raw.substr(line_end, header_end - line_end));
    std::string body = raw.substr(header_end + 4);
    if (headers.find("transfer-encoding: chunked") != std::string::npos) {
        body = decode_chunked(body);
    }
    response.body = std::move(body);
    return response;
}

// Content-Length of a parsed header block, or npos when absent.
size_t content_length(const std::string& raw, size_t header_end) {
    std::string headers = lower(raw.substr(0, header_end));
    size_t pos = headers.find("\r\ncontent-length:");
    if (pos == std::string::npos) return std::string::npos;
    return std::strtoul(headers.c_str() + pos + 17, nullptr, 10);
}

}  // namespace

Url parse_url(const std::string& text) {
    Url url;
    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("URL has no scheme: " + text);
    }
    url.scheme = lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        throw ConfigError("Unsupported URL scheme: " + url.scheme);
    }

    std::string rest = text.substr(scheme_end + 3);
    size_t path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    url.path = path_start == std::string::npos ? "" : rest.substr(path_start);
    while (!url.path.empty() && url.path.back() == '/') url.path.pop_back();

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) throw ConfigError("Malformed IPv6 host in URL: " + text);
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') throw ConfigError("Malformed URL: " + text);
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_text = authority.substr(colon + 1);
    }
    if (url.host.empty()) {
        throw ConfigError("URL has no host: " + text);
    }

    if (port_text.empty()) {
        url.port = url.secure() ? 443 : 80;
    } else {
        char* end = nullptr;
        long port = std::strtol(port_text.c_str(), &end, 10);
        if (*end != '\0' || port <= 0 || port > 65535) {
            throw ConfigError("Invalid port in URL: " + text);
        }
        url.port = static_cast<uint16_t>(port);
    }
    return url;
}

HttpClient::HttpClient(const std::string& base_url, std::chrono::milliseconds t, bool verify_tls)
    : base(parse_url(base_url)), timeout(t), tls_context(nullptr, SSL_CTX_free) {
    if (!base.secure()) return;

    tls_context.reset(SSL_CTX_new(TLS_client_method()));
    if (!tls_context) {
        throw std::runtime_error("Failed to create TLS context: " + tls_error_string());
    }
    SSL_CTX_set_min_proto_version(tls_context.get(), TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(tls_context.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (verify_tls) {
        if (SSL_CTX_set_default_verify_paths(tls_context.get()) != 1) {
            Logger::warning("Could not load system CA certificates: " + tls_error_string());
        }
        SSL_CTX_set_verify(tls_context.get(), SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(tls_context.get(), SSL_VERIFY_NONE, nullptr);
        Logger::warning("TLS certificate verification disabled for " + base.host);
    }
}

HttpResponse HttpClient::post(const std::string& path_and_query, const Headers& headers, const std::string& body) {
    Connection conn(Clock::now() + timeout);
    conn.open(base);
    if (tls_context) {
        conn.start_tls(tls_context.get(), base.host,
                       SSL_CTX_get_verify_mode(tls_context.get()) != SSL_VERIFY_NONE);
    }

    std::string host_header = base.host.find(':') != std::string::npos ? "[" + base.host + "]" : base.host;
    bool default_port = (base.secure() && base.port == 443) || (!base.secure() && base.port == 80);
    if (!default_port) host_header += ":" + std::to_string(base.port);

    std::string request;
    request.reserve(body.size() + 512);
    request += "POST " + base.path + path_and_query + " HTTP/1.1\r\n";
    request += "Host: " + host_header + "\r\n";
    request += "User-Agent: gridstream/1.0\r\n";
    request += "Connection: close\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    for (const auto& [name, value] : headers) {
        request += name + ": " + value + "\r\n";
    }
    request += "\r\n";
    request += body;

    conn.send_all(request);

    std::string raw;
    size_t header_end = std::string::npos;
    size_t expected = std::string::npos;
    while (true) {
        bool more = conn.read_some(raw);

        if (header_end == std::string::npos) {
            header_end = raw.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                expected = content_length(raw, header_end);
                int status = std::atoi(raw.c_str() + std::min(raw.size(), size_t{9}));
                if (status == 204 || status == 304) expected = 0;
            }
        }
        if (header_end != std::string::npos && expected != std::string::npos &&
            raw.size() >= header_end + 4 + expected) {
            break;
        }
        if (!more) break;
    }

    if (header_end == std::string::npos) {
        throw WriteError(WriteErrorKind::BackendUnreachable,
                         raw.empty() ? "Connection closed without a response" : "Truncated HTTP response");
    }
    return parse_response(raw, header_end);
}
