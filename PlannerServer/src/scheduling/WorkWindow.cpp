#include "WorkWindow.h"
#include "CivilTime.h"
#include <algorithm>
#include <string>

namespace scheduling {

static void check_hour(const char* name, int h) {
    if (h < 0 || h > 24) throw ConfigurationError(std::string(name) + " must be between 0 and 24, got " + std::to_string(h));
}

static void check_window(const char* what, int start, int end, int lunch_start, int lunch_end) {
    if (start >= end) throw ConfigurationError(std::string(what) + " start must be before end");
    if (lunch_start > lunch_end) throw ConfigurationError(std::string(what) + " lunch start must not be after lunch end");
}

void validate_options(const SchedulerOptions& o) {
    check_hour("workdayStartHour", o.workday_start_hour);
    check_hour("workdayEndHour", o.workday_end_hour);
    check_hour("lunchStartHour", o.lunch_start_hour);
    check_hour("lunchEndHour", o.lunch_end_hour);
    if (o.workday_start_minute < 0 || o.workday_start_minute > 59) {
        throw ConfigurationError("workdayStartMinute must be between 0 and 59, got " + std::to_string(o.workday_start_minute));
    }
    check_window("workday", o.workday_start_hour * 60 + o.workday_start_minute, o.workday_end_hour * 60, o.lunch_start_hour, o.lunch_end_hour);

    // Weekend hours only matter when a weekend day can be used.
    if (o.allow_weekends || o.force_start_date) {
        if (o.weekend_start_hour) check_hour("weekendStartHour", *o.weekend_start_hour);
        if (o.weekend_end_hour) check_hour("weekendEndHour", *o.weekend_end_hour);
        if (o.weekend_lunch_start_hour) check_hour("weekendLunchStartHour", *o.weekend_lunch_start_hour);
        if (o.weekend_lunch_end_hour) check_hour("weekendLunchEndHour", *o.weekend_lunch_end_hour);
        DayWindow we = day_window(o, 3);  // 1970-01-03 was a Saturday
        check_window("weekend", we.start, we.end, we.lunch_start, we.lunch_end);
    }

    if (o.weekday_max_minutes && *o.weekday_max_minutes <= 0) throw ConfigurationError("weekdayMaxMinutes must be positive");
    if (o.weekend_max_minutes && *o.weekend_max_minutes <= 0) throw ConfigurationError("weekendMaxMinutes must be positive");
}

void validate_task(const TaskInput& t) {
    if (t.id.empty()) throw ConfigurationError("task id must not be empty");
    if (t.duration_minutes <= 0) {
        throw ConfigurationError("task " + t.id + " duration must be positive, got " + std::to_string(t.duration_minutes));
    }
    if (t.priority < 1 || t.priority > 4) {
        throw ConfigurationError("task " + t.id + " priority must be between 1 and 4, got " + std::to_string(t.priority));
    }
}

void validate_placement(const Placement& p) {
    parse_date(p.date);
    if (p.start_minute < 0 || p.end_minute > 24 * 60 || p.start_minute >= p.end_minute)
        throw ConfigurationError("placement of task " + p.task_id + " must start before it ends within one day");
    if (p.duration_minutes != p.end_minute - p.start_minute)
        throw ConfigurationError("placement of task " + p.task_id + " lasts " + std::to_string(p.end_minute - p.start_minute) +
                                 " minutes but duration_minutes is " + std::to_string(p.duration_minutes));
}

DayWindow day_window(const SchedulerOptions& o, int64_t day) {
    DayWindow w;
    w.weekend = is_weekend(day);
    if (!w.weekend) {
        w.start = o.workday_start_hour * 60 + o.workday_start_minute;
        w.end = o.workday_end_hour * 60;
        w.lunch_start = o.lunch_start_hour * 60;
        w.lunch_end = o.lunch_end_hour * 60;
        w.cap = o.weekday_max_minutes;
        return w;
    }
    w.enabled = o.allow_weekends;
    w.start = o.weekend_start_hour ? *o.weekend_start_hour * 60 : o.workday_start_hour * 60 + o.workday_start_minute;
    w.end = o.weekend_end_hour.value_or(o.workday_end_hour) * 60;
    w.lunch_start = o.weekend_lunch_start_hour.value_or(o.lunch_start_hour) * 60;
    w.lunch_end = o.weekend_lunch_end_hour.value_or(o.lunch_end_hour) * 60;
    w.cap = o.weekend_max_minutes;
    return w;
}

static int lunch_overlap(const DayWindow& w) {
    int b = std::max(w.start, w.lunch_start);
    int e = std::min(w.end, w.lunch_end);
    return e > b ? e - b : 0;
}

int window_minutes(const DayWindow& w) { return (w.end - w.start) - lunch_overlap(w); }

int longest_segment(const DayWindow& w) {
    if (lunch_overlap(w) == 0) return w.end - w.start;
    int before = std::max(0, std::min(w.lunch_start, w.end) - w.start);
    int after = std::max(0, w.end - std::max(w.lunch_end, w.start));
    return std::max(before, after);
}

int day_capacity(const DayWindow& w) {
    int c = window_minutes(w);
    if (w.cap) c = std::min(c, *w.cap);
    return c;
}

std::vector<MinuteRange> free_intervals(const DayWindow& w, int from, int until, std::vector<MinuteRange> blocked) {
    std::vector<MinuteRange> out;
    int lo = std::max(w.start, from);
    int hi = std::min(w.end, until);
    if (lo >= hi) return out;
    if (w.lunch_start < w.lunch_end) blocked.push_back(MinuteRange{w.lunch_start, w.lunch_end});
    std::sort(blocked.begin(), blocked.end(), [](const MinuteRange& a, const MinuteRange& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });
    int cursor = lo;
    for (const auto& b : blocked) {
        if (b.end <= cursor) continue;
        if (b.start >= hi) break;
        if (b.start > cursor) out.push_back(MinuteRange{cursor, b.start});
        cursor = std::max(cursor, b.end);
        if (cursor >= hi) break;
    }
    if (cursor < hi) out.push_back(MinuteRange{cursor, hi});
    return out;
}

void add_load(DayLoad& load, const Placement& p) {
    load.occupied.push_back(MinuteRange{p.start_minute, p.end_minute});
    if (!p.detached) load.used_minutes += p.duration_minutes;
}

std::map<int64_t, DayLoad> load_by_day(const std::vector<Placement>& placements, const std::string& skip_task_id) {
    std::map<int64_t, DayLoad> out;
    for (const auto& p : placements) {
        if (!skip_task_id.empty() && p.task_id == skip_task_id) continue;
        add_load(out[parse_date(p.date)], p);
    }
    return out;
}

}
