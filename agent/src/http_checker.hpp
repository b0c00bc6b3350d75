#pragma once

#include "check_config.hpp"
#include "transport.hpp"
#include "attempt_executor.hpp"
#include "verdict.hpp"
#include <memory>

class HttpChecker {
public:
    // A null transport means one is built from the check's TLS settings
    // (or the process default) on every check() call.
    explicit HttpChecker(EndpointCheck check,
                         std::shared_ptr<const HttpTransport> transport = nullptr,
                         AttemptExecutor::Sleeper sleeper = nullptr);

    // Only configuration problems throw (ConfigError); an unreachable or
    // unhealthy endpoint still yields a verdict.
    Verdict check() const;

    const EndpointCheck& config() const { return check_; }

    // Request template shared by every attempt. A "Host" header, in any
    // case, becomes the host override instead of an ordinary header.
    static HttpRequest build_request(const EndpointCheck& check);

private:
    EndpointCheck check_;
    std::shared_ptr<const HttpTransport> transport_;
    AttemptExecutor::Sleeper sleeper_;
};
