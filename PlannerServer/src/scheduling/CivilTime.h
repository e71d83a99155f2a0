#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include "Types.h"

namespace scheduling {

// Timestamps carry the user's wall clock encoded as UTC seconds; a day is
// the count of days since 1970-01-01.

constexpr int kMinutesPerDay = 24 * 60;
constexpr std::time_t kSecondsPerDay = 24 * 60 * 60;

// Throws ConfigurationError on anything but a valid YYYY-MM-DD.
int64_t parse_date(const std::string& s);
std::string format_date(int64_t day);
std::string add_days(const std::string& date, int64_t n);

// 0 = Sunday.
int weekday(int64_t day);
bool is_weekend(int64_t day);

std::time_t day_start(int64_t day);
int64_t day_of(std::time_t t);
// Seconds past midnight rounded up to a whole minute; may return 1440.
int minute_of_day_ceil(std::time_t t);
int minute_of_day(std::time_t t);

// HH:MM, 24:00 allowed for end-of-day.
int parse_hhmm(const std::string& s);
std::string format_hhmm(int minute);

std::optional<std::time_t> parse_iso_z(const std::string& s);
std::string format_iso_z(std::time_t t);

std::time_t placement_start(const Placement& p);
std::time_t placement_end(const Placement& p);

}
