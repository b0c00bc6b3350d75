#include "transport.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <mutex>

namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() { curl_slist_free_all(list); }

    void add(const std::string& h) {
        list = curl_slist_append(list, h.c_str());
    }
};

struct TransferState {
    CURL* curl = nullptr;
    HttpResponse* response = nullptr;
    const TransportOptions* options = nullptr;
    bool capture_body = false;
    bool https = false;
    bool headers_done = false;
    std::chrono::milliseconds connect_limit{0};
    std::chrono::steady_clock::time_point started;
    std::string abort_reason;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    if (state->capture_body) {
        state->response->body.append(ptr, size * nmemb);
    }
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    std::string line(buffer, size * nitems);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.rfind("HTTP/", 0) == 0) {
        // Interim 1xx responses are followed by another status line
        state->headers_done = false;
        state->response->reason.clear();
        auto code_start = line.find(' ');
        if (code_start != std::string::npos) {
            auto reason_start = line.find(' ', code_start + 1);
            if (reason_start != std::string::npos) {
                state->response->reason = line.substr(reason_start + 1);
            }
        }
    } else if (line.empty()) {
        state->headers_done = true;
    }
    return size * nitems;
}

// Enforces the per-phase timeouts libcurl has no dedicated option for.
int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    const auto* opts = state->options;

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - state->started).count();
    auto limit_us = [](std::chrono::milliseconds ms) {
        return static_cast<curl_off_t>(ms.count()) * 1000;
    };

    curl_off_t connect_us = 0;
    curl_off_t appconnect_us = 0;
    curl_off_t pretransfer_us = 0;
    curl_easy_getinfo(state->curl, CURLINFO_CONNECT_TIME_T, &connect_us);
    curl_easy_getinfo(state->curl, CURLINFO_APPCONNECT_TIME_T, &appconnect_us);
    curl_easy_getinfo(state->curl, CURLINFO_PRETRANSFER_TIME_T, &pretransfer_us);

    if (connect_us == 0) {
        if (elapsed_us > limit_us(state->connect_limit)) {
            state->abort_reason = "dial tcp: i/o timeout";
            return 1;
        }
        return 0;
    }

    if (state->https && appconnect_us == 0) {
        if (elapsed_us - connect_us > limit_us(opts->tls_handshake_timeout)) {
            state->abort_reason = "TLS handshake timeout";
            return 1;
        }
        return 0;
    }

    if (!state->headers_done && pretransfer_us > 0 &&
        elapsed_us - pretransfer_us > limit_us(opts->response_header_timeout)) {
        state->abort_reason = "timeout awaiting response headers";
        return 1;
    }
    return 0;
}

CURLcode ssl_ctx_callback(CURL*, void* sslctx, void* userp) {
    const auto* bundle = static_cast<const CaBundle*>(userp);
    X509_STORE* store = SSL_CTX_get_cert_store(static_cast<SSL_CTX*>(sslctx));
    if (!store) {
        return CURLE_SSL_CERTPROBLEM;
    }
    bundle->install(store);
    return CURLE_OK;
}

} // namespace

std::string HttpResponse::status_text() const {
    if (reason.empty()) {
        return std::to_string(status_code);
    }
    return std::to_string(status_code) + " " + reason;
}

TargetUrl parse_target_url(const std::string& url) {
    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
    if (!handle) {
        throw ConfigError("error parsing URL: out of memory");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        throw ConfigError("error parsing URL '" + url + "'");
    }

    auto part = [&handle](CURLUPart which) -> std::string {
        char* value = nullptr;
        if (curl_url_get(handle.get(), which, &value, 0) != CURLUE_OK || !value) {
            return "";
        }
        std::string out(value);
        curl_free(value);
        return out;
    };

    TargetUrl target;
    target.scheme = part(CURLUPART_SCHEME);
    target.host = part(CURLUPART_HOST);
    std::string port = part(CURLUPART_PORT);

    if (target.scheme != "http" && target.scheme != "https") {
        throw ConfigError("error parsing URL '" + url + "': unsupported scheme '" + target.scheme + "'");
    }
    if (target.host.empty()) {
        throw ConfigError("error parsing URL '" + url + "': missing host");
    }
    if (!port.empty()) {
        target.port = std::stoi(port);
    }
    return target;
}

CurlTransport::CurlTransport(TransportOptions options, TlsSettings tls,
                             std::optional<DialTarget> dial)
    : options_(options)
    , tls_(std::move(tls))
    , dial_(std::move(dial))
{
    ensure_curl_global_init();
}

std::chrono::milliseconds CurlTransport::dial_timeout(bool https) const {
    if (https) {
        return std::min(options_.connect_timeout, TLS_DIAL_TIMEOUT);
    }
    return options_.connect_timeout;
}

TransportResult CurlTransport::perform(const HttpRequest& request) const {
    TransportResult result;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    TransferState state;
    state.curl = curl.get();
    state.response = &result.response;
    state.options = &options_;
    state.capture_body = request.capture_body;
    state.https = util::to_lower(request.url).rfind("https://", 0) == 0;

    HeaderList headers;
    headers.add("Connection: close");
    for (const auto& h : request.headers) {
        headers.add(h);
    }
    if (!request.host_override.empty()) {
        headers.add("Host: " + request.host_override);
    }

    HeaderList connect_to;
    if (dial_ && state.https) {
        connect_to.add("::" + dial_->host + ":" + std::to_string(dial_->port));
    }

    state.connect_limit = dial_timeout(state.https);
    auto connect_limit = state.connect_limit;
    if (state.https) connect_limit += options_.tls_handshake_timeout;

    char errbuf[CURL_ERROR_SIZE] = {0};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "upcheck-agent/1.0");
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_limit.count()));
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(h, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(h, CURLOPT_MAXCONNECTS, options_.max_connects);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);

    if (connect_to.list) {
        curl_easy_setopt(h, CURLOPT_CONNECT_TO, connect_to.list);
    }

    if (tls_.skip_verify) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    if (tls_.ca_bundle && state.https) {
        CURLcode rc = curl_easy_setopt(h, CURLOPT_SSL_CTX_FUNCTION, ssl_ctx_callback);
        if (rc == CURLE_OK) {
            rc = curl_easy_setopt(h, CURLOPT_SSL_CTX_DATA,
                                  const_cast<CaBundle*>(tls_.ca_bundle.get()));
        }
        if (rc != CURLE_OK) {
            result.error = "GET " + request.url + ": custom CA bundle not supported by TLS backend: " +
                           curl_easy_strerror(rc);
            return result;
        }
    }

    state.started = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(h);

    if (res != CURLE_OK) {
        std::string detail;
        if (res == CURLE_ABORTED_BY_CALLBACK && !state.abort_reason.empty()) {
            detail = state.abort_reason;
        } else if (errbuf[0] != '\0') {
            detail = errbuf;
        } else {
            detail = curl_easy_strerror(res);
        }
        result.error = "GET " + request.url + ": " + detail;
        return result;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.response.status_code);
    result.ok = true;
    return result;
}

std::shared_ptr<const HttpTransport> default_transport() {
    static const std::shared_ptr<const HttpTransport> instance =
        std::make_shared<CurlTransport>();
    return instance;
}

std::shared_ptr<const HttpTransport> build_transport(const EndpointCheck& check) {
    TargetUrl target = parse_target_url(check.url);

    if (!check.has_tls_settings()) {
        return default_transport();
    }

    TlsSettings tls;
    tls.skip_verify = check.tls_skip_verify;
    if (!check.tls_ca_file.empty()) {
        tls.ca_bundle = CaBundle::load_file(check.tls_ca_file);
    }

    TransportOptions options;
    options.connect_timeout = TLS_DIAL_TIMEOUT;

    CurlTransport::DialTarget dial;
    dial.host = target.host;
    dial.port = target.port != 0 ? target.port : 443;

    spdlog::debug("Built TLS transport for {} (skip_verify={}, ca_certs={}, dial={}:{})",
                  check.name, tls.skip_verify,
                  tls.ca_bundle ? tls.ca_bundle->size() : 0, dial.host, dial.port);

    return std::make_shared<CurlTransport>(options, tls, dial);
}
