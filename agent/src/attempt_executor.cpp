#include "attempt_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

AttemptExecutor::AttemptExecutor(std::shared_ptr<const HttpTransport> transport,
                                 ResponseClassifier classifier,
                                 Sleeper sleeper)
    : transport_(std::move(transport))
    , classifier_(std::move(classifier))
    , sleeper_(std::move(sleeper))
{
    if (!transport_) {
        throw std::invalid_argument("AttemptExecutor requires a transport");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::nanoseconds d) { std::this_thread::sleep_for(d); };
    }
}

Attempt AttemptExecutor::run_once(const HttpRequest& request) const {
    Attempt attempt;

    HttpRequest req = request;
    req.capture_body = classifier_.needs_body();

    auto start = std::chrono::steady_clock::now();
    TransportResult result;
    try {
        result = transport_->perform(req);
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }
    attempt.rtt = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    if (!result.ok) {
        attempt.error = result.error.empty() ? "request failed" : result.error;
        return attempt;
    }

    attempt.error = classifier_.classify(result.response);
    return attempt;
}

Attempts AttemptExecutor::run(const HttpRequest& request, int count,
                              std::chrono::nanoseconds spacing) const {
    if (count < 1) count = 1;

    Attempts attempts;
    attempts.reserve(count);

    for (int i = 0; i < count; i++) {
        attempts.push_back(run_once(request));

        const auto& last = attempts.back();
        if (last.failed()) {
            spdlog::debug("Attempt {}/{} against {} failed after {}: {}",
                          i + 1, count, request.url, util::format_duration(last.rtt), last.error);
        } else {
            spdlog::debug("Attempt {}/{} against {} passed in {}",
                          i + 1, count, request.url, util::format_duration(last.rtt));
        }

        if (spacing.count() > 0 && i + 1 < count) {
            sleeper_(spacing);
        }
    }

    return attempts;
}
