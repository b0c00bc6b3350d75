#include "config.hpp"
#include "check_config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.checks_file = get_env("CHECKS_FILE", "checkup.json");
    cfg.max_parallel_checks = get_env_int("MAX_PARALLEL_CHECKS", 4);

    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_results = get_env("STREAM_RESULTS", "upcheck.results");
    cfg.test_location = get_env("TEST_LOCATION", "UpCheck Agent");

    cfg.pg_dsn = get_env("PG_DSN");
    cfg.check_expiry_hours = get_env_int("CHECK_EXPIRY_HOURS", 0);

    cfg.service_name = get_env("SERVICE_NAME", "upcheck-agent");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (checks_file.empty()) {
        throw ConfigError("CHECKS_FILE is required");
    }
    if (max_parallel_checks < 1) {
        throw ConfigError("MAX_PARALLEL_CHECKS must be at least 1");
    }
    if (check_expiry_hours < 0) {
        throw ConfigError("CHECK_EXPIRY_HOURS must not be negative");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Checks file: {}", checks_file);
    spdlog::info("  Parallel checks: {}", max_parallel_checks);
    spdlog::info("  Redis export: {}", redis_url.empty() ? "disabled" : stream_results);
    spdlog::info("  Postgres storage: {}", pg_dsn.empty() ? "disabled" : "enabled");
}
