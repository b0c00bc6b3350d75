#pragma once

#include "ca_bundle.hpp"
#include "check_config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>

struct HttpRequest {
    std::string url;
    // Sent as the Host header; the connection still goes to the URL host
    std::string host_override;
    // "Name: value" lines
    std::vector<std::string> headers;
    // When false the body is drained and dropped, never buffered
    bool capture_body = false;
};

struct HttpResponse {
    long status_code = 0;
    std::string reason;
    std::string body;

    // "404 Not Found", or just "404" when the server sent no reason phrase
    std::string status_text() const;
};

struct TransportResult {
    bool ok = false;
    HttpResponse response;
    std::string error;
};

// One request/response exchange. Implementations must be safe to share
// between threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual TransportResult perform(const HttpRequest& request) const = 0;
};

struct TransportOptions {
    std::chrono::milliseconds timeout{10000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds tls_handshake_timeout{5000};
    std::chrono::milliseconds response_header_timeout{5000};
    long max_connects = 1;
};

struct TlsSettings {
    bool skip_verify = false;
    std::shared_ptr<const CaBundle> ca_bundle;
};

struct TargetUrl {
    std::string scheme;
    std::string host;
    int port = 0;   // 0 when the URL names none
};

// Throws ConfigError unless the URL has an http/https scheme and a host.
TargetUrl parse_target_url(const std::string& url);

class CurlTransport : public HttpTransport {
public:
    // host:port that every TLS connection is pinned to
    struct DialTarget {
        std::string host;
        int port = 443;
    };

    explicit CurlTransport(TransportOptions options = TransportOptions{},
                           TlsSettings tls = TlsSettings{},
                           std::optional<DialTarget> dial = std::nullopt);

    TransportResult perform(const HttpRequest& request) const override;

    const TransportOptions& options() const { return options_; }
    const TlsSettings& tls() const { return tls_; }
    const std::optional<DialTarget>& dial_target() const { return dial_; }

    // TCP connect limit; https targets never wait longer than TLS_DIAL_TIMEOUT
    std::chrono::milliseconds dial_timeout(bool https) const;

private:
    TransportOptions options_;
    TlsSettings tls_;
    std::optional<DialTarget> dial_;
};

// TCP connect timeout for every https target
constexpr std::chrono::milliseconds TLS_DIAL_TIMEOUT{5000};

// Process-wide transport: built on first use, never mutated afterwards.
std::shared_ptr<const HttpTransport> default_transport();

// Returns default_transport() unless the check carries TLS settings, in which
// case a dedicated transport is built. Throws ConfigError.
std::shared_ptr<const HttpTransport> build_transport(const EndpointCheck& check);
