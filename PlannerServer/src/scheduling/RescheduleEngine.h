#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Types.h"

namespace scheduling {

// Weight applied per hour of displacement; urgent work costs more to move.
double priority_weight(int priority);

// Best alternative slot for a conflicted placement, or nullopt when nothing
// fits before the deadline or horizon end.
//
// Candidates on every eligible day are the earliest start, the latest start
// and the original start clamped into each free interval. Score:
//   proximity       = 100 - displacement_hours
//   priorityPenalty = displacement_hours * priority_weight(priority)
//   densityPenalty  = 10 * (minutes_used + duration) / day_capacity
//   contextScore    = proximity - priorityPenalty - densityPenalty
// Highest score wins; ties go to the earlier start. The proposal comes back
// pending with an empty id and created_at = now.
std::optional<RescheduleProposal> propose(const Placement& conflicted,
                                          const TaskInput& task,
                                          const NormalizedAvailability& availability,
                                          const std::vector<Placement>& other_placements,
                                          const Horizon& horizon,
                                          const SchedulerOptions& options,
                                          std::time_t now);

// RepositoryUnavailable is only set by the service when storing a proposal fails.
enum class OverdueSkipReason { PendingProposal, NoFeasibleSlot, RepositoryUnavailable };
const char* to_string(OverdueSkipReason r);

struct OverdueSkip {
    std::string task_id;
    OverdueSkipReason reason = OverdueSkipReason::NoFeasibleSlot;
};

struct OverdueRun {
    std::vector<RescheduleProposal> proposals;
    std::vector<OverdueSkip> skipped;
};

// One proposal per overdue placement in `committed`, in plan order.
//
// The plan is taken as if every pending proposal were already accepted, and
// each new proposal is added to it before the next overdue task is moved.
// Tasks that already have a pending proposal are skipped. `tasks` supplies
// priority and dependencies; a task missing from it is moved with priority 3
// and the duration of its placement.
OverdueRun propose_overdue(const std::vector<Placement>& committed,
                           const std::vector<TaskInput>& tasks,
                           const std::vector<RescheduleProposal>& pending,
                           const NormalizedAvailability& availability,
                           const Horizon& horizon,
                           const SchedulerOptions& options,
                           std::time_t now);

}
