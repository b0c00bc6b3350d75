#include <catch2/catch_test_macros.hpp>
#include "../src/response_classifier.hpp"

namespace {

HttpResponse make_response(long status, const std::string& body = "", const std::string& reason = "") {
    HttpResponse r;
    r.status_code = status;
    r.body = body;
    r.reason = reason;
    return r;
}

} // namespace

TEST_CASE("Status code classification", "[classifier]") {
    ResponseClassifier classifier(200, "", "");

    SECTION("Expected status passes") {
        REQUIRE(classifier.classify(make_response(200, "", "OK")).empty());
    }

    SECTION("Mismatch cites the actual status") {
        auto error = classifier.classify(make_response(503, "", "Service Unavailable"));
        REQUIRE(error == "response status 503 Service Unavailable");
    }

    SECTION("Mismatch without reason phrase") {
        auto error = classifier.classify(make_response(404));
        REQUIRE(error == "response status 404");
    }

    SECTION("Redirects are judged as returned") {
        ResponseClassifier expect_redirect(302, "", "");
        REQUIRE(expect_redirect.classify(make_response(302, "", "Found")).empty());
        REQUIRE(classifier.classify(make_response(302, "", "Found")).find("302") != std::string::npos);
    }

    SECTION("Body is not needed without content rules") {
        REQUIRE_FALSE(classifier.needs_body());
    }
}

TEST_CASE("Content rules", "[classifier]") {
    SECTION("Required substring present") {
        ResponseClassifier classifier(200, "World", "");
        REQUIRE(classifier.needs_body());
        REQUIRE(classifier.classify(make_response(200, "Hello World")).empty());
    }

    SECTION("Required substring missing") {
        ResponseClassifier classifier(200, "Goodbye", "");
        auto error = classifier.classify(make_response(200, "Hello World"));
        REQUIRE(error == "response does not contain 'Goodbye'");
    }

    SECTION("Forbidden substring present") {
        ResponseClassifier classifier(200, "", "ERROR");
        REQUIRE(classifier.needs_body());
        auto error = classifier.classify(make_response(200, "status: ERROR in db"));
        REQUIRE(error == "response contains 'ERROR'");
    }

    SECTION("Forbidden substring absent") {
        ResponseClassifier classifier(200, "", "ERROR");
        REQUIRE(classifier.classify(make_response(200, "status: fine")).empty());
    }

    SECTION("Both rules must hold") {
        ResponseClassifier classifier(200, "ok", "ERROR");
        REQUIRE(classifier.classify(make_response(200, "ok")).empty());
        REQUIRE_FALSE(classifier.classify(make_response(200, "ok ERROR")).empty());
        REQUIRE_FALSE(classifier.classify(make_response(200, "fine")).empty());
    }

    SECTION("Status is checked before content") {
        ResponseClassifier classifier(200, "World", "");
        auto error = classifier.classify(make_response(500, "Hello World", "Internal Server Error"));
        REQUIRE(error == "response status 500 Internal Server Error");
    }
}

TEST_CASE("Classifier built from a check", "[classifier]") {
    EndpointCheck check;
    check.name = "x";
    check.url = "http://x.local";
    check.up_status = 0;
    check.must_contain = "alive";

    auto classifier = ResponseClassifier::for_check(check);
    REQUIRE(classifier.needs_body());
    REQUIRE(classifier.classify(make_response(200, "alive")).empty());
}
