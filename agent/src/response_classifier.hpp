#pragma once

#include "transport.hpp"
#include <string>

// Decides whether a single response counts as "up". Mismatches are returned
// as text, never thrown.
class ResponseClassifier {
public:
    ResponseClassifier(int up_status, std::string must_contain, std::string must_not_contain);

    static ResponseClassifier for_check(const EndpointCheck& check);

    // Body inspection is only worth buffering for when a content rule exists
    bool needs_body() const;

    // Empty string means the attempt passed
    std::string classify(const HttpResponse& response) const;

private:
    int up_status_;
    std::string must_contain_;
    std::string must_not_contain_;
};
