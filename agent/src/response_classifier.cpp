#include "response_classifier.hpp"

ResponseClassifier::ResponseClassifier(int up_status, std::string must_contain,
                                       std::string must_not_contain)
    : up_status_(up_status)
    , must_contain_(std::move(must_contain))
    , must_not_contain_(std::move(must_not_contain)) {}

ResponseClassifier ResponseClassifier::for_check(const EndpointCheck& check) {
    return ResponseClassifier(check.effective_up_status(), check.must_contain, check.must_not_contain);
}

bool ResponseClassifier::needs_body() const {
    return !must_contain_.empty() || !must_not_contain_.empty();
}

std::string ResponseClassifier::classify(const HttpResponse& response) const {
    if (response.status_code != up_status_) {
        return "response status " + response.status_text();
    }

    if (!needs_body()) {
        return "";
    }

    if (!must_contain_.empty() && response.body.find(must_contain_) == std::string::npos) {
        return "response does not contain '" + must_contain_ + "'";
    }
    if (!must_not_contain_.empty() && response.body.find(must_not_contain_) != std::string::npos) {
        return "response contains '" + must_not_contain_ + "'";
    }

    return "";
}
