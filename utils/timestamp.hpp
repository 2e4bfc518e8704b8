// utils/timestamp.hpp
#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace utils {

/**
 * Parse a dataset timestamp into Unix seconds (UTC).
 *
 * Accepted forms:
 *   "2024-03-01 13:00:00"      (pandas default)
 *   "2024-03-01T13:00:00"      (ISO 8601, fractional seconds and zone suffix ignored)
 *   "2024-03-01"               (midnight)
 *   "1709298000"               (already epoch seconds)
 *
 * @return false if the string matches none of the forms
 */
inline bool parse_timestamp(const std::string& s, int64_t& out_s) {
    if (s.empty()) return false;

    bool all_digits = true;
    for (char c : s) {
        if (c < '0' || c > '9') { all_digits = false; break; }
    }
    if (all_digits) {
        out_s = static_cast<int64_t>(std::stoll(s));
        return true;
    }

    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2d%*[ T]%2d:%2d:%2d", &Y, &M, &D, &h, &m, &sec);
    if (n < 3) return false;
    if (n < 6) {
        // date only, or date + HH:MM
        if (n != 3 && n != 5) return false;
        if (n == 3) { h = 0; m = 0; }
        sec = 0;
    }
    if (M < 1 || M > 12 || D < 1 || D > 31 || h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 60) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    out_s = static_cast<int64_t>(timegm(&tm));
    return true;
}

// "YYYY-MM-DDTHH:MM:SSZ"
inline std::string format_timestamp(int64_t epoch_s) {
    std::time_t t = static_cast<std::time_t>(epoch_s);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

inline int hour_of_day(int64_t epoch_s) {
    int64_t secs = epoch_s % 86400;
    if (secs < 0) secs += 86400;
    return static_cast<int>(secs / 3600);
}

} // namespace utils
