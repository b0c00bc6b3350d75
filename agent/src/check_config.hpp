#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised when a check cannot even be attempted (bad URL, bad CA material,
// malformed check list). Never raised for an unhealthy endpoint.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

constexpr int DEFAULT_UP_STATUS = 200;

struct EndpointCheck {
    std::string name;
    std::string url;

    // Expected status; 0 means DEFAULT_UP_STATUS
    int up_status = DEFAULT_UP_STATUS;

    // Zero disables the degraded classification
    std::chrono::nanoseconds threshold_rtt{0};

    // NOTE: either rule forces the whole response body into memory
    std::string must_contain;
    std::string must_not_contain;

    int attempts = 1;
    std::chrono::nanoseconds attempt_spacing{0};

    bool tls_skip_verify = false;
    std::string tls_ca_file;

    // Multiple values are joined with ", ". "Host" overrides the request host.
    std::map<std::string, std::vector<std::string>> headers;

    int effective_attempts() const { return attempts < 1 ? 1 : attempts; }
    int effective_up_status() const { return up_status == 0 ? DEFAULT_UP_STATUS : up_status; }
    bool has_tls_settings() const { return tls_skip_verify || !tls_ca_file.empty(); }

    static EndpointCheck from_json(const nlohmann::json& j);
};

// Accepts {"checkers": [{"type": "http", ...}]} or a bare array of checks.
std::vector<EndpointCheck> load_checks(const nlohmann::json& doc);
std::vector<EndpointCheck> load_checks_file(const std::string& path);
