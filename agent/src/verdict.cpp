#include "verdict.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>

std::string health_to_string(Health health) {
    switch (health) {
        case Health::Healthy: return "healthy";
        case Health::Degraded: return "degraded";
        case Health::Down: return "down";
    }
    return "unknown";
}

Stats compute_stats(const Attempts& attempts) {
    Stats stats;

    std::vector<std::chrono::nanoseconds> samples;
    samples.reserve(attempts.size());
    for (const auto& a : attempts) {
        if (!a.failed()) samples.push_back(a.rtt);
    }
    if (samples.empty()) {
        return stats;
    }

    std::sort(samples.begin(), samples.end());

    for (const auto& s : samples) {
        stats.total += s;
    }
    stats.mean = stats.total / static_cast<int64_t>(samples.size());
    stats.min = samples.front();
    stats.max = samples.back();

    size_t mid = samples.size() / 2;
    if (samples.size() % 2 == 1) {
        stats.median = samples[mid];
    } else {
        stats.median = (samples[mid - 1] + samples[mid]) / 2;
    }

    return stats;
}

std::string attempts_summary(const Attempts& attempts) {
    std::vector<std::string> rtts;
    rtts.reserve(attempts.size());
    for (const auto& a : attempts) {
        rtts.push_back(util::format_duration(a.rtt));
    }
    return fmt::format(" - Number of attempts = {} ({})", attempts.size(), util::join(rtts, " "));
}

Verdict conclude(const EndpointCheck& check, Attempts attempts) {
    Verdict verdict;
    verdict.title = check.name;
    verdict.endpoint = check.url;
    verdict.threshold_rtt = check.threshold_rtt;
    verdict.times = std::move(attempts);
    verdict.stats = compute_stats(verdict.times);

    // Down wins over degraded; latency is not judged once anything failed
    const Attempt* first_failure = nullptr;
    size_t failures = 0;
    for (const auto& a : verdict.times) {
        if (a.failed()) {
            if (!first_failure) first_failure = &a;
            failures++;
        }
    }

    if (first_failure) {
        verdict.health = Health::Down;
        verdict.notice = fmt::format("{} of {} attempts failed: {}",
                                     failures, verdict.times.size(), first_failure->error)
                         + attempts_summary(verdict.times);
        return verdict;
    }

    if (check.threshold_rtt.count() > 0 && verdict.stats.median > check.threshold_rtt) {
        verdict.health = Health::Degraded;
        verdict.notice = fmt::format("median round trip time exceeded threshold ({})",
                                     util::format_duration(check.threshold_rtt))
                         + attempts_summary(verdict.times);
        return verdict;
    }

    verdict.health = Health::Healthy;
    return verdict;
}

nlohmann::json Verdict::to_json() const {
    nlohmann::json times_json = nlohmann::json::array();
    for (const auto& a : times) {
        nlohmann::json entry = {{"rtt", a.rtt.count()}};
        if (a.failed()) {
            entry["error"] = a.error;
        }
        times_json.push_back(entry);
    }

    nlohmann::json j = {
        {"title", title},
        {"endpoint", endpoint},
        {"timestamp", timestamp},
        {"times", times_json},
        {"threshold", threshold_rtt.count()},
        {"stats", {
            {"total", stats.total.count()},
            {"mean", stats.mean.count()},
            {"median", stats.median.count()},
            {"min", stats.min.count()},
            {"max", stats.max.count()}
        }},
        {"status", health_to_string(health)},
        {"healthy", healthy()},
        {"degraded", degraded()},
        {"down", down()}
    };
    if (!notice.empty()) {
        j["notice"] = notice;
    }
    return j;
}
