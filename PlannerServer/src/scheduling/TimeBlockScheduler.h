#pragma once

#include <ctime>
#include <utility>
#include <vector>
#include "Types.h"

namespace scheduling {

// Greedy first-fit placement of `tasks` into the horizon.
//
// Tasks are taken by orderIndex (then priority, longer first, id) and a task
// waits until every dependency has a placement, either from this run or from
// `existing`. Each task gets one contiguous interval inside the day's work
// window, clear of lunch, busy time, time off and every other placement, and
// never past the deadline. A task that cannot be placed is reported in
// `unplaced`; its dependents follow it there with the blocking id.
//
// Throws ConfigurationError for invalid options, tasks or horizon. The result
// is a pure function of the arguments.
ScheduleResult schedule(const std::vector<TaskInput>& tasks,
                        const Horizon& horizon,
                        const SchedulerOptions& options,
                        const NormalizedAvailability& availability,
                        const std::vector<Placement>& existing,
                        std::time_t now);

// Pairs of placements on the same date whose intervals intersect. Detached
// placements are ignored.
std::vector<std::pair<Placement, Placement>> find_overlaps(const std::vector<Placement>& placements);

}
