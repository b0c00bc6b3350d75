#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, const std::string& run_location)
    : run_location_(run_location) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis");
}

nlohmann::json RedisBus::availability_record(const Verdict& verdict, const std::string& run_location) {
    double mean_ms = std::chrono::duration<double, std::milli>(verdict.stats.mean).count();
    return {
        {"test_name", verdict.title},
        {"run_location", run_location},
        {"success", verdict.healthy()},
        {"status", health_to_string(verdict.health)},
        {"duration_ms", mean_ms},
        {"message", verdict.notice},
        {"endpoint", verdict.endpoint},
        {"ts", util::current_iso8601()}
    };
}

bool RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
        return false;
    }
}

size_t RedisBus::export_verdicts(const std::string& stream, const std::vector<Verdict>& verdicts) {
    size_t failed = 0;
    for (const auto& v : verdicts) {
        if (!publish(stream, availability_record(v, run_location_))) {
            failed++;
        }
    }
    spdlog::info("Exported {} of {} verdicts to {}", verdicts.size() - failed, verdicts.size(), stream);
    return failed;
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Redis ping failed: {}", e.what());
        return false;
    }
}
