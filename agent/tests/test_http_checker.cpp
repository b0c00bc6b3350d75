#include <catch2/catch_test_macros.hpp>
#include "../src/http_checker.hpp"
#include "fake_transport.hpp"
#include "test_certs.hpp"
#include <httplib.h>
#include <cstdio>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Local endpoint the checks run against
class TestServer {
public:
    TestServer() {
        server_.Get("/ok", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(50ms);
            res.set_content("OK", "text/plain");
        });
        server_.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(300ms);
            res.set_content("OK", "text/plain");
        });
        server_.Get("/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("Hello World", "text/plain");
        });
        server_.Get("/error", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("status: ERROR", "text/plain");
        });
        server_.Get("/status", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
            res.set_content("unavailable", "text/plain");
        });
        server_.Get("/host", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.get_header_value("Host"), "text/plain");
        });
        server_.Get("/token", [](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("X-Token") != "secret") {
                res.status = 401;
                return;
            }
            res.set_content("authorized", "text/plain");
        });
        server_.Get("/redirect", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/ok");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(5ms);
        }
    }

    ~TestServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

// HTTPS endpoint serving a freshly generated self-signed certificate
class TlsTestServer {
public:
    TlsTestServer()
        : cert_(issue_certificate())
        , server_(CERT_PATH, KEY_PATH) {
        REQUIRE(server_.is_valid());
        server_.Get("/ok", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("OK", "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(5ms);
        }
    }

    ~TlsTestServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::remove(CERT_PATH);
        std::remove(KEY_PATH);
    }

    int port() const { return port_; }
    const char* ca_file() const { return CERT_PATH; }

    std::string url(const std::string& host, const std::string& path) const {
        return "https://" + host + ":" + std::to_string(port_) + path;
    }

private:
    static constexpr const char* CERT_PATH = "test_http_checker_cert.pem";
    static constexpr const char* KEY_PATH = "test_http_checker_key.pem";

    // The server loads its certificate from files, so they exist before it is built
    static TestCertificate issue_certificate() {
        TestCertificate cert = make_test_certificate();
        write_file(CERT_PATH, cert.cert_pem);
        write_file(KEY_PATH, cert.key_pem);
        return cert;
    }

    TestCertificate cert_;
    httplib::SSLServer server_;
    std::thread thread_;
    int port_ = 0;
};

EndpointCheck make_check(const std::string& url, int attempts = 1) {
    EndpointCheck check;
    check.name = "Local";
    check.url = url;
    check.attempts = attempts;
    return check;
}

} // namespace

TEST_CASE("Checks against a live endpoint", "[http_checker]") {
    TestServer server;

    SECTION("Fast endpoint is healthy") {
        auto check = make_check(server.url("/ok"), 3);
        check.threshold_rtt = 200ms;

        auto verdict = HttpChecker(check).check();
        REQUIRE(verdict.healthy());
        REQUIRE(verdict.times.size() == 3);
        for (const auto& a : verdict.times) {
            REQUIRE_FALSE(a.failed());
            REQUIRE(a.rtt >= 50ms);
        }
        REQUIRE(verdict.timestamp > 0);
        REQUIRE(verdict.notice.empty());
    }

    SECTION("Slow endpoint is degraded") {
        auto check = make_check(server.url("/slow"));
        check.threshold_rtt = 100ms;

        auto verdict = HttpChecker(check).check();
        REQUIRE(verdict.degraded());
        REQUIRE(verdict.notice.find("100ms") != std::string::npos);
    }

    SECTION("Slow endpoint without threshold is healthy") {
        auto verdict = HttpChecker(make_check(server.url("/slow"))).check();
        REQUIRE(verdict.healthy());
    }

    SECTION("Unexpected status is down and cites the status") {
        auto verdict = HttpChecker(make_check(server.url("/status"), 2)).check();
        REQUIRE(verdict.down());
        REQUIRE(verdict.times.size() == 2);
        REQUIRE(verdict.times[0].error.rfind("response status 503", 0) == 0);
    }

    SECTION("Expected non-200 status is healthy") {
        auto check = make_check(server.url("/status"));
        check.up_status = 503;
        REQUIRE(HttpChecker(check).check().healthy());
    }

    SECTION("Required content present") {
        auto check = make_check(server.url("/hello"));
        check.must_contain = "World";
        REQUIRE(HttpChecker(check).check().healthy());
    }

    SECTION("Required content missing") {
        auto check = make_check(server.url("/hello"));
        check.must_contain = "Goodbye";

        auto verdict = HttpChecker(check).check();
        REQUIRE(verdict.down());
        REQUIRE(verdict.times[0].error == "response does not contain 'Goodbye'");
    }

    SECTION("Forbidden content present") {
        auto check = make_check(server.url("/error"));
        check.must_not_contain = "ERROR";

        auto verdict = HttpChecker(check).check();
        REQUIRE(verdict.down());
        REQUIRE(verdict.times[0].error == "response contains 'ERROR'");
    }

    SECTION("Host header overrides the request host") {
        auto check = make_check(server.url("/host"));
        check.headers["Host"] = {"status.internal"};
        check.must_contain = "status.internal";

        REQUIRE(HttpChecker(check).check().healthy());
    }

    SECTION("Custom headers are sent") {
        auto check = make_check(server.url("/token"));
        check.headers["X-Token"] = {"secret"};
        REQUIRE(HttpChecker(check).check().healthy());

        check.headers.clear();
        REQUIRE(HttpChecker(check).check().down());
    }

    SECTION("Redirects are not followed") {
        auto verdict = HttpChecker(make_check(server.url("/redirect"))).check();
        REQUIRE(verdict.down());
        REQUIRE(verdict.times[0].error.find("302") != std::string::npos);

        auto check = make_check(server.url("/redirect"));
        check.up_status = 302;
        REQUIRE(HttpChecker(check).check().healthy());
    }
}

TEST_CASE("Checks against a TLS endpoint", "[http_checker]") {
    TlsTestServer server;

    SECTION("Untrusted certificate is down under the default transport") {
        auto verdict = HttpChecker(make_check(server.url("127.0.0.1", "/ok"))).check();
        REQUIRE(verdict.down());
        REQUIRE(verdict.times[0].error.find("certificate") != std::string::npos);
    }

    SECTION("Custom CA file makes the certificate trusted") {
        auto check = make_check(server.url("127.0.0.1", "/ok"), 2);
        check.tls_ca_file = server.ca_file();

        auto verdict = HttpChecker(check).check();
        REQUIRE(verdict.healthy());
        REQUIRE(verdict.times.size() == 2);
    }

    SECTION("Skip verify accepts the certificate") {
        auto check = make_check(server.url("127.0.0.1", "/ok"));
        check.tls_skip_verify = true;
        REQUIRE(HttpChecker(check).check().healthy());
    }

    SECTION("Connections go to the pinned dial target") {
        TlsSettings tls;
        tls.skip_verify = true;
        CurlTransport::DialTarget dial;
        dial.host = "127.0.0.1";
        dial.port = server.port();
        auto transport = std::make_shared<CurlTransport>(TransportOptions{}, tls, dial);

        // The URL host never resolves; only the pinned address is reachable
        auto check = make_check(server.url("upcheck.invalid", "/ok"));
        REQUIRE(HttpChecker(check, transport).check().healthy());
    }
}

TEST_CASE("Unreachable endpoint is down", "[http_checker]") {
    auto verdict = HttpChecker(make_check("http://127.0.0.1:1/health", 3)).check();

    REQUIRE(verdict.down());
    REQUIRE(verdict.times.size() == 3);
    for (const auto& a : verdict.times) {
        REQUIRE(a.failed());
    }
    REQUIRE(verdict.notice.rfind("3 of 3 attempts failed: ", 0) == 0);
}

TEST_CASE("Configuration errors are raised before any request", "[http_checker]") {
    auto transport = std::make_shared<FakeTransport>(
        std::vector<FakeTransport::Step>{FakeTransport::respond(200)});

    SECTION("Malformed URL") {
        auto check = make_check("example.com/health");
        check.tls_ca_file = "/nonexistent/ca.pem";

        REQUIRE_THROWS_AS(HttpChecker(check, transport).check(), ConfigError);
        REQUIRE(transport->calls() == 0);
    }

    SECTION("Missing URL") {
        REQUIRE_THROWS_AS(HttpChecker(make_check(""), transport).check(), ConfigError);
        REQUIRE(transport->calls() == 0);
    }

    SECTION("Unreadable CA file") {
        auto check = make_check("https://internal.local/health");
        check.tls_ca_file = "/nonexistent/ca.pem";
        REQUIRE_THROWS_AS(HttpChecker(check).check(), ConfigError);
    }
}

TEST_CASE("Checker drives the executor", "[http_checker]") {
    auto transport = std::make_shared<FakeTransport>(std::vector<FakeTransport::Step>{
        FakeTransport::respond(200), FakeTransport::fail("connection reset"), FakeTransport::respond(200)
    });
    std::vector<std::chrono::nanoseconds> sleeps;
    auto sleeper = [&sleeps](std::chrono::nanoseconds d) { sleeps.push_back(d); };

    auto check = make_check("http://svc.local/health", 3);
    check.attempt_spacing = 1s;

    auto verdict = HttpChecker(check, transport, sleeper).check();

    REQUIRE(transport->calls() == 3);
    REQUIRE(sleeps.size() == 2);
    REQUIRE(verdict.down());
    REQUIRE(verdict.times[1].error == "connection reset");
    REQUIRE(verdict.notice.rfind("1 of 3 attempts failed: connection reset", 0) == 0);
}

TEST_CASE("Request template", "[http_checker]") {
    auto check = make_check("https://svc.local/health");
    check.headers["host"] = {"virtual.local", "ignored.local"};
    check.headers["Accept"] = {"text/plain", "application/json"};
    check.headers["X-Blank"] = {""};
    check.headers["X-Empty"] = {};

    auto req = HttpChecker::build_request(check);

    REQUIRE(req.url == "https://svc.local/health");
    REQUIRE(req.host_override == "virtual.local");
    REQUIRE(req.headers.size() == 2);
    REQUIRE(req.headers[0] == "Accept: text/plain, application/json");
    // A blank value is still sent as a header
    REQUIRE(req.headers[1] == "X-Blank;");
    REQUIRE_FALSE(req.capture_body);
}
