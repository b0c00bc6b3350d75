#include "config.hpp"
#include "check_config.hpp"
#include "http_checker.hpp"
#include "redis_bus.hpp"
#include "results_store.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <thread>

void setup_logging(const std::string& log_level) {
    // stdout carries the verdict document, so logs go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("upcheck", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Runs every check once, at most `parallel` at a time. Slots stay empty for
// checks that could not be attempted.
std::vector<std::optional<Verdict>> run_checks(const std::vector<EndpointCheck>& checks,
                                               int parallel) {
    std::vector<std::optional<Verdict>> results(checks.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= checks.size()) break;

            try {
                HttpChecker checker(checks[i]);
                results[i] = checker.check();
            } catch (const ConfigError& e) {
                spdlog::error("Check {} not attempted: {}", checks[i].name, e.what());
            } catch (const std::exception& e) {
                spdlog::error("Check {} aborted: {}", checks[i].name, e.what());
            }
        }
    };

    size_t thread_count = std::min(checks.size(), static_cast<size_t>(std::max(parallel, 1)));
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t t = 0; t < thread_count; t++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    return results;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        if (argc > 1) {
            config.checks_file = argv[1];
        }
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("UpCheck Agent v1.0 ({})", config.service_name);
        spdlog::info("==============================================");

        config.validate();

        auto checks = load_checks_file(config.checks_file);
        spdlog::info("Running {} checks", checks.size());

        auto results = run_checks(checks, config.max_parallel_checks);

        std::vector<Verdict> verdicts;
        for (auto& r : results) {
            if (r) verdicts.push_back(std::move(*r));
        }
        size_t not_attempted = checks.size() - verdicts.size();

        nlohmann::json out = nlohmann::json::array();
        for (const auto& v : verdicts) {
            out.push_back(v.to_json());
        }
        std::cout << out.dump(2) << std::endl;

        if (!config.redis_url.empty()) {
            try {
                RedisBus redis(config.redis_url, config.test_location);
                if (redis.ping()) {
                    redis.export_verdicts(config.stream_results, verdicts);
                } else {
                    spdlog::warn("Redis unreachable, {} verdicts not exported", verdicts.size());
                }
            } catch (const std::exception& e) {
                spdlog::error("Redis export failed: {}", e.what());
            }
        }

        if (!config.pg_dsn.empty()) {
            try {
                ResultsStore store(config.pg_dsn);
                if (store.ping()) {
                    store.init_schema();
                    store.store(verdicts);
                    store.maintain(std::chrono::hours(config.check_expiry_hours));
                } else {
                    spdlog::warn("Postgres unreachable, {} verdicts not stored", verdicts.size());
                }
            } catch (const std::exception& e) {
                spdlog::error("Result storage failed: {}", e.what());
            }
        }

        size_t healthy = std::count_if(verdicts.begin(), verdicts.end(),
                                       [](const Verdict& v) { return v.healthy(); });
        spdlog::info("Done: {} healthy, {} unhealthy, {} not attempted",
                     healthy, verdicts.size() - healthy, not_attempted);

        return not_attempted == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
