#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace loft::util {

/// RFC 3339 / ISO 8601 ("2025-01-31T10:15:00.1234567+01:00", "...Z", or no zone = UTC).
inline std::chrono::system_clock::time_point parseRfc3339(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        ss.clear();
        ss.str(iso.substr(0, 19));
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    size_t pos = 19;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        std::chrono::nanoseconds frac{0};
        long long scale = 100000000;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) {
            frac += std::chrono::nanoseconds((iso[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
        tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(frac);
    }

    if (pos < iso.size() && (iso[pos] == '+' || iso[pos] == '-')) {
        int hh = 0, mm = 0;
        if (std::sscanf(iso.c_str() + pos + 1, "%2d:%2d", &hh, &mm) < 1)
            throw std::runtime_error("Failed to parse timestamp offset: " + iso);
        const auto offset = std::chrono::hours(hh) + std::chrono::minutes(mm);
        tp += iso[pos] == '+' ? -offset : offset;
    }

    return tp;
}

inline std::string formatRfc3339(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline std::string timestampToString(const std::time_t ts) {
    return formatRfc3339(std::chrono::system_clock::from_time_t(ts));
}

} // namespace loft::util
