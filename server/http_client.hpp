// server/http_client.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <openssl/ssl.h>

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string path;    // base path without trailing slash, may be empty

    bool secure() const { return scheme == "https"; }
};

// Throws ConfigError on anything but http(s)://host[:port][/path].
Url parse_url(const std::string& text);

struct HttpResponse {
    int status{0};
    std::string body;
};

// Minimal HTTP/1.1 client for the storage backend. One connection per request,
// every request bounded by `timeout` from connect to the last response byte.
// Transport failures throw WriteError (BackendUnreachable or Timeout).
class HttpClient {
private:
    Url base;
    std::chrono::milliseconds timeout;
    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> tls_context;

public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    HttpClient(const std::string& base_url, std::chrono::milliseconds timeout, bool verify_tls = true);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse post(const std::string& path_and_query, const Headers& headers, const std::string& body);
};
