#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Availability.h"
#include "Types.h"

namespace scheduling {

// Resolved working hours of one calendar day, in minutes after midnight.
struct DayWindow {
    bool weekend = false;
    bool enabled = true;
    int start = 0;
    int end = 0;
    int lunch_start = 0;
    int lunch_end = 0;
    std::optional<int> cap;
};

// Minutes already taken on one day by committed or freshly placed tasks.
// Detached placements occupy time but do not count toward the cap.
struct DayLoad {
    std::vector<MinuteRange> occupied;
    int used_minutes = 0;
};

void validate_options(const SchedulerOptions& o);
void validate_task(const TaskInput& t);
// Same-day bounds, and duration_minutes equal to end minus start.
void validate_placement(const Placement& p);

DayWindow day_window(const SchedulerOptions& o, int64_t day);

// Window width minus the lunch carve-out.
int window_minutes(const DayWindow& w);
// Longest stretch a single task could ever occupy on this day.
int longest_segment(const DayWindow& w);
// window_minutes capped by the per-day limit.
int day_capacity(const DayWindow& w);

// Free stretches of [max(start, from), min(end, until)) after removing lunch
// and `blocked`, in start order.
std::vector<MinuteRange> free_intervals(const DayWindow& w, int from, int until, std::vector<MinuteRange> blocked);

// Placements of `skip_task_id` are left out.
std::map<int64_t, DayLoad> load_by_day(const std::vector<Placement>& placements, const std::string& skip_task_id = std::string());
void add_load(DayLoad& load, const Placement& p);

}
