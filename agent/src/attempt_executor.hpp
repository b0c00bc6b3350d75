#pragma once

#include "transport.hpp"
#include "response_classifier.hpp"
#include "verdict.hpp"
#include <memory>
#include <functional>
#include <chrono>

class AttemptExecutor {
public:
    using Sleeper = std::function<void(std::chrono::nanoseconds)>;

    AttemptExecutor(std::shared_ptr<const HttpTransport> transport,
                    ResponseClassifier classifier,
                    Sleeper sleeper = nullptr);

    // Runs exactly `count` attempts one after another. Every failure is
    // recorded and the loop carries on; `spacing` is slept between attempts
    // but not after the last one.
    Attempts run(const HttpRequest& request, int count,
                 std::chrono::nanoseconds spacing = std::chrono::nanoseconds(0)) const;

private:
    std::shared_ptr<const HttpTransport> transport_;
    ResponseClassifier classifier_;
    Sleeper sleeper_;

    Attempt run_once(const HttpRequest& request) const;
};
