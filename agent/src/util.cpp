#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <cmath>

namespace util {

namespace {

std::string with_fraction(int64_t whole, int64_t frac, int digits) {
    std::string out = std::to_string(whole);
    if (frac == 0) return out;

    std::ostringstream ss;
    ss << std::setw(digits) << std::setfill('0') << frac;
    std::string frac_str = ss.str();
    frac_str.erase(frac_str.find_last_not_of('0') + 1);
    return out + "." + frac_str;
}

int64_t unit_ns(const std::string& unit) {
    if (unit == "ns") return 1;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1000;
    if (unit == "ms") return 1000000;
    if (unit == "s") return 1000000000LL;
    if (unit == "m") return 60LL * 1000000000LL;
    if (unit == "h") return 3600LL * 1000000000LL;
    return 0;
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme_end = dsn.find("://");
    auto at = dsn.rfind('@');
    if (scheme_end == std::string::npos || at == std::string::npos || at < scheme_end) {
        return dsn;
    }
    auto colon = dsn.find(':', scheme_end + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

std::string format_duration(std::chrono::nanoseconds d) {
    int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    if (ns < 0) {
        sign = "-";
        ns = -ns;
    }

    if (ns < 1000) {
        return sign + std::to_string(ns) + "ns";
    }
    if (ns < 1000000) {
        return sign + with_fraction(ns / 1000, ns % 1000, 3) + "\xC2\xB5s";
    }
    if (ns < 1000000000LL) {
        return sign + with_fraction(ns / 1000000, ns % 1000000, 6) + "ms";
    }

    const int64_t hour = 3600LL * 1000000000LL;
    const int64_t minute = 60LL * 1000000000LL;
    int64_t hours = ns / hour;
    int64_t rem = ns % hour;
    int64_t minutes = rem / minute;
    rem %= minute;

    std::string out = sign;
    if (hours > 0) out += std::to_string(hours) + "h";
    if (hours > 0 || minutes > 0) out += std::to_string(minutes) + "m";
    out += with_fraction(rem / 1000000000LL, rem % 1000000000LL, 9) + "s";
    return out;
}

std::chrono::nanoseconds parse_duration(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty duration");
    }
    if (text == "0") return std::chrono::nanoseconds(0);

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        throw std::invalid_argument("invalid duration '" + text + "'");
    }

    long double total = 0;
    while (pos < text.size()) {
        size_t num_start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            pos++;
        }
        std::string number = text.substr(num_start, pos - num_start);
        if (number.empty() || number == "." || std::count(number.begin(), number.end(), '.') > 1) {
            throw std::invalid_argument("invalid duration '" + text + "'");
        }

        size_t unit_start = pos;
        while (pos < text.size() && !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '.') {
            pos++;
        }
        std::string unit = text.substr(unit_start, pos - unit_start);
        int64_t scale = unit_ns(unit);
        if (scale == 0) {
            throw std::invalid_argument("unknown unit '" + unit + "' in duration '" + text + "'");
        }

        total += std::stold(number) * static_cast<long double>(scale);
    }

    auto ns = static_cast<int64_t>(std::llround(total));
    return std::chrono::nanoseconds(negative ? -ns : ns);
}

} // namespace util
