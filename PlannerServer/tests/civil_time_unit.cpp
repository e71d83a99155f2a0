#include <iostream>
#include <string>
#include "scheduling/CivilTime.h"

using namespace scheduling;

static bool throws_config(const std::string& date) {
    try {
        (void)parse_date(date);
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

int main() {
    if (parse_date("1970-01-01") != 0) { std::cerr << "epoch day mismatch\n"; return 1; }
    if (format_date(parse_date("2026-03-02")) != "2026-03-02") { std::cerr << "date round trip failed\n"; return 1; }
    if (add_days("2026-02-27", 2) != "2026-03-01") { std::cerr << "add_days across February failed: " << add_days("2026-02-27", 2) << "\n"; return 1; }
    if (add_days("2024-02-28", 1) != "2024-02-29") { std::cerr << "leap day missing\n"; return 1; }
    if (add_days("2026-01-01", -1) != "2025-12-31") { std::cerr << "negative add_days failed\n"; return 1; }

    for (const char* bad : {"2026-02-30", "2026-13-01", "2026-3-01", "20260301", "", "2026-03-0x"}) {
        if (!throws_config(bad)) { std::cerr << "accepted invalid date '" << bad << "'\n"; return 1; }
    }

    // 2026-03-02 is a Monday
    int64_t mon = parse_date("2026-03-02");
    if (weekday(mon) != 1) { std::cerr << "weekday mismatch: " << weekday(mon) << "\n"; return 1; }
    if (is_weekend(mon) || !is_weekend(mon + 5) || !is_weekend(mon + 6) || is_weekend(mon + 7)) {
        std::cerr << "weekend detection wrong\n"; return 1;
    }
    if (weekday(parse_date("1969-12-31")) != 3) { std::cerr << "pre-epoch weekday wrong\n"; return 1; }

    std::time_t t = day_start(mon) + 9 * 3600 + 15 * 60 + 30;
    if (day_of(t) != mon) { std::cerr << "day_of mismatch\n"; return 1; }
    if (minute_of_day(t) != 555) { std::cerr << "minute_of_day expected 555 got " << minute_of_day(t) << "\n"; return 1; }
    if (minute_of_day_ceil(t) != 556) { std::cerr << "minute_of_day_ceil expected 556\n"; return 1; }
    if (minute_of_day_ceil(day_start(mon) + 600) != 10) { std::cerr << "ceil of whole minute moved\n"; return 1; }

    if (parse_hhmm("09:30") != 570 || parse_hhmm("24:00") != 1440) { std::cerr << "parse_hhmm failed\n"; return 1; }
    if (format_hhmm(570) != "09:30" || format_hhmm(0) != "00:00") { std::cerr << "format_hhmm failed\n"; return 1; }
    for (const char* bad : {"9:30", "24:01", "12:60", "ab:cd"}) {
        bool threw = false;
        try { (void)parse_hhmm(bad); } catch (const ConfigurationError&) { threw = true; }
        if (!threw) { std::cerr << "accepted invalid time '" << bad << "'\n"; return 1; }
    }

    auto iso = parse_iso_z("2026-03-02T10:00:00Z");
    if (!iso || *iso != day_start(mon) + 10 * 3600) { std::cerr << "parse_iso_z failed\n"; return 1; }
    if (format_iso_z(*iso) != "2026-03-02T10:00:00Z") { std::cerr << "format_iso_z mismatch: " << format_iso_z(*iso) << "\n"; return 1; }
    auto pg = parse_iso_z("2026-03-02 10:00:00+00");
    if (!pg || *pg != *iso) { std::cerr << "postgres timestamp form rejected\n"; return 1; }
    auto frac = parse_iso_z("2026-03-02T10:00:00.250Z");
    if (!frac || *frac != *iso) { std::cerr << "fractional seconds rejected\n"; return 1; }
    if (parse_iso_z("2026-03-02 10:00:00+02")) { std::cerr << "non-UTC offset accepted\n"; return 1; }
    if (parse_iso_z("2026-03-02T25:00:00Z")) { std::cerr << "hour 25 accepted\n"; return 1; }
    if (parse_iso_z("garbage")) { std::cerr << "garbage accepted\n"; return 1; }

    Placement p;
    p.task_id = "t1";
    p.date = "2026-03-02";
    p.start_minute = 540;
    p.end_minute = 600;
    if (placement_start(p) != day_start(mon) + 9 * 3600 || placement_end(p) != day_start(mon) + 10 * 3600) {
        std::cerr << "placement bounds wrong\n"; return 1;
    }

    std::cout << "civil_time_unit ok\n";
    return 0;
}
