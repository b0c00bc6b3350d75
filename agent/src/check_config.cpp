#include "check_config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace {

std::chrono::nanoseconds duration_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::chrono::nanoseconds(0);
    }

    const auto& value = j[key];
    if (value.is_number_integer()) {
        return std::chrono::nanoseconds(value.get<int64_t>());
    }
    if (value.is_string()) {
        try {
            return util::parse_duration(value.get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string(key) + ": " + e.what());
        }
    }
    throw ConfigError(std::string(key) + " must be a duration string or integer nanoseconds");
}

std::map<std::string, std::vector<std::string>> headers_field(const nlohmann::json& j) {
    std::map<std::string, std::vector<std::string>> headers;
    if (!j.contains("headers") || j["headers"].is_null()) {
        return headers;
    }
    if (!j["headers"].is_object()) {
        throw ConfigError("headers must be an object");
    }

    for (auto& [name, value] : j["headers"].items()) {
        if (value.is_string()) {
            headers[name].push_back(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& v : value) {
                if (!v.is_string()) {
                    throw ConfigError("header " + name + " values must be strings");
                }
                headers[name].push_back(v.get<std::string>());
            }
        } else {
            throw ConfigError("header " + name + " must be a string or array of strings");
        }
    }
    return headers;
}

} // namespace

EndpointCheck EndpointCheck::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("check entry must be an object");
    }

    EndpointCheck check;
    try {
        check.name = j.value("endpoint_name", "");
        check.url = j.value("endpoint_url", "");
        check.up_status = j.value("up_status", DEFAULT_UP_STATUS);
        check.must_contain = j.value("must_contain", "");
        check.must_not_contain = j.value("must_not_contain", "");
        check.attempts = j.value("attempts", 1);
        check.tls_skip_verify = j.value("tls_skip_verify", false);
        check.tls_ca_file = j.value("tls_ca_file", "");
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid check entry: ") + e.what());
    }

    check.threshold_rtt = duration_field(j, "threshold_rtt");
    check.attempt_spacing = duration_field(j, "attempt_spacing");
    check.headers = headers_field(j);

    if (check.name.empty()) {
        throw ConfigError("endpoint_name is required");
    }
    if (check.url.empty()) {
        throw ConfigError("endpoint_url is required for " + check.name);
    }
    if (check.up_status == 0) check.up_status = DEFAULT_UP_STATUS;
    if (check.attempts < 1) check.attempts = 1;

    return check;
}

std::vector<EndpointCheck> load_checks(const nlohmann::json& doc) {
    std::vector<EndpointCheck> checks;

    nlohmann::json entries;
    if (doc.is_array()) {
        entries = doc;
    } else if (doc.is_object() && doc.contains("checkers") && doc["checkers"].is_array()) {
        entries = doc["checkers"];
    } else {
        throw ConfigError("check list must be an array or an object with a \"checkers\" array");
    }

    for (const auto& entry : entries) {
        if (entry.is_object() && entry.contains("type")) {
            std::string type = entry.value("type", "");
            if (type != "http") {
                throw ConfigError("unsupported checker type '" + type + "'");
            }
        }
        checks.push_back(EndpointCheck::from_json(entry));
    }

    spdlog::debug("Loaded {} endpoint checks", checks.size());
    return checks;
}

std::vector<EndpointCheck> load_checks_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open check list " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse check list " + path + ": " + e.what());
    }
    return load_checks(doc);
}
