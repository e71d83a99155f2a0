#include "CivilTime.h"
#include <cctype>
#include <cstdio>

namespace scheduling {

static bool all_digits(const std::string& s, size_t from, size_t len) {
    if (from + len > s.size()) return false;
    for (size_t i = from; i < from + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

static int two(const std::string& s, size_t at) { return (s[at] - '0') * 10 + (s[at + 1] - '0'); }

static int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int64_t parse_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-' || !all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)) {
        throw ConfigurationError("invalid date: " + s);
    }
    std::tm tm{};
    tm.tm_year = (s[0] - '0') * 1000 + (s[1] - '0') * 100 + two(s, 2) - 1900;
    tm.tm_mon = two(s, 5) - 1;
    tm.tm_mday = two(s, 8);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) throw ConfigurationError("invalid date: " + s);
    std::time_t t = timegm(&tm);
    int64_t day = floor_div(static_cast<int64_t>(t), kSecondsPerDay);
    // timegm normalizes 02-30 into March; reject by round trip
    if (format_date(day) != s) throw ConfigurationError("invalid date: " + s);
    return day;
}

std::string format_date(int64_t day) {
    std::time_t t = static_cast<std::time_t>(day * kSecondsPerDay);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return std::string(buf);
}

std::string add_days(const std::string& date, int64_t n) { return format_date(parse_date(date) + n); }

int weekday(int64_t day) {
    // 1970-01-01 was a Thursday
    int64_t w = (day + 4) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

bool is_weekend(int64_t day) {
    int w = weekday(day);
    return w == 0 || w == 6;
}

std::time_t day_start(int64_t day) { return static_cast<std::time_t>(day * kSecondsPerDay); }

int64_t day_of(std::time_t t) { return floor_div(static_cast<int64_t>(t), kSecondsPerDay); }

int minute_of_day(std::time_t t) {
    return static_cast<int>((static_cast<int64_t>(t) - day_of(t) * kSecondsPerDay) / 60);
}

int minute_of_day_ceil(std::time_t t) {
    int64_t secs = static_cast<int64_t>(t) - day_of(t) * kSecondsPerDay;
    return static_cast<int>((secs + 59) / 60);
}

int parse_hhmm(const std::string& s) {
    if (s.size() != 5 || s[2] != ':' || !all_digits(s, 0, 2) || !all_digits(s, 3, 2)) throw ConfigurationError("invalid time: " + s);
    int h = two(s, 0);
    int m = two(s, 3);
    if (m > 59 || h > 24 || (h == 24 && m != 0)) throw ConfigurationError("invalid time: " + s);
    return h * 60 + m;
}

std::string format_hhmm(int minute) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minute / 60, minute % 60);
    return std::string(buf);
}

// Accepts 2026-03-02T10:00:00Z and the Postgres form 2026-03-02 10:00:00+00,
// with optional fractional seconds.
std::optional<std::time_t> parse_iso_z(const std::string& s_in) {
    std::string s = s_in;
    if (s.size() >= 19 && s[10] == ' ') {
        s[10] = 'T';
        auto tz = s.find_first_of("+-", 19);
        if (tz != std::string::npos) {
            std::string off = s.substr(tz);
            if (off != "+00" && off != "+00:00" && off != "+0000") return std::nullopt;
            s.erase(tz);
        }
        s.push_back('Z');
    }
    auto dot = s.find('.', 19);
    if (dot != std::string::npos) {
        auto z = s.find('Z', dot);
        if (z != std::string::npos) s.erase(dot, z - dot);
    }
    if (s.size() != 20) return std::nullopt;
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != 'Z') return std::nullopt;
    if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2) || !all_digits(s, 11, 2) || !all_digits(s, 14, 2) || !all_digits(s, 17, 2)) {
        return std::nullopt;
    }
    int64_t day = 0;
    try {
        day = parse_date(s.substr(0, 10));
    } catch (const ConfigurationError&) {
        return std::nullopt;
    }
    int h = two(s, 11), m = two(s, 14), sec = two(s, 17);
    if (h > 23 || m > 59 || sec > 60) return std::nullopt;
    return day_start(day) + h * 3600 + m * 60 + sec;
}

std::string format_iso_z(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

std::time_t placement_start(const Placement& p) { return day_start(parse_date(p.date)) + p.start_minute * 60; }

std::time_t placement_end(const Placement& p) { return day_start(parse_date(p.date)) + p.end_minute * 60; }

}
