#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ns();
    std::string to_lower(const std::string& str);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    std::string redact_dsn(const std::string& dsn);

    // Compact rendering: "50ms", "1.5s", "750µs", "2m30s"
    std::string format_duration(std::chrono::nanoseconds d);

    // Accepts "200ms", "1.5s", "750us", "2m", "1h30m". Throws std::invalid_argument.
    std::chrono::nanoseconds parse_duration(const std::string& text);
}
