#include "http_checker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HttpChecker::HttpChecker(EndpointCheck check,
                         std::shared_ptr<const HttpTransport> transport,
                         AttemptExecutor::Sleeper sleeper)
    : check_(std::move(check))
    , transport_(std::move(transport))
    , sleeper_(std::move(sleeper)) {}

HttpRequest HttpChecker::build_request(const EndpointCheck& check) {
    HttpRequest req;
    req.url = check.url;

    for (const auto& [name, values] : check.headers) {
        if (values.empty()) continue;

        if (util::to_lower(name) == "host") {
            req.host_override = values.front();
            continue;
        }
        std::string value = util::join(values, ", ");
        // libcurl drops "Name:" but sends "Name;" as a header with no value
        req.headers.push_back(value.empty() ? name + ";" : name + ": " + value);
    }

    return req;
}

Verdict HttpChecker::check() const {
    if (check_.url.empty()) {
        throw ConfigError("endpoint_url is required for " + check_.name);
    }
    // Rejects a malformed URL before any network activity
    parse_target_url(check_.url);

    auto transport = transport_ ? transport_ : build_transport(check_);

    HttpRequest request = build_request(check_);
    AttemptExecutor executor(transport, ResponseClassifier::for_check(check_), sleeper_);

    int64_t started_ns = util::current_timestamp_ns();
    Attempts attempts = executor.run(request, check_.effective_attempts(), check_.attempt_spacing);

    Verdict verdict = conclude(check_, std::move(attempts));
    verdict.timestamp = started_ns;

    if (verdict.healthy()) {
        spdlog::info("{} ({}) is healthy, median {}", verdict.title, verdict.endpoint,
                     util::format_duration(verdict.stats.median));
    } else {
        spdlog::warn("{} ({}) is {}: {}", verdict.title, verdict.endpoint,
                     health_to_string(verdict.health), verdict.notice);
    }

    return verdict;
}
