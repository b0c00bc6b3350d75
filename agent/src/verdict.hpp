#pragma once

#include "check_config.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

struct Attempt {
    std::chrono::nanoseconds rtt{0};
    std::string error;   // empty when the attempt passed

    bool failed() const { return !error.empty(); }
};

using Attempts = std::vector<Attempt>;

struct Stats {
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds mean{0};
    std::chrono::nanoseconds median{0};
    std::chrono::nanoseconds min{0};
    std::chrono::nanoseconds max{0};
};

enum class Health {
    Healthy,
    Degraded,
    Down
};

std::string health_to_string(Health health);

struct Verdict {
    std::string title;
    std::string endpoint;
    int64_t timestamp = 0;   // Unix nanoseconds at check start
    Attempts times;
    Stats stats;
    std::chrono::nanoseconds threshold_rtt{0};
    Health health = Health::Healthy;
    std::string notice;

    bool healthy() const { return health == Health::Healthy; }
    bool degraded() const { return health == Health::Degraded; }
    bool down() const { return health == Health::Down; }

    nlohmann::json to_json() const;
};

// Stats over passed attempts only. For an even count the median is the mean
// of the two middle samples.
Stats compute_stats(const Attempts& attempts);

// " - Number of attempts = 3 (51ms 48ms 50ms)"
std::string attempts_summary(const Attempts& attempts);

// Pure: identical inputs always give an identical verdict. The timestamp is
// left for the caller to stamp.
Verdict conclude(const EndpointCheck& check, Attempts attempts);
