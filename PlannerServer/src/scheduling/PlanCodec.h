#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "RescheduleEngine.h"
#include "Types.h"

namespace scheduling {

// JSON <-> engine types for the HTTP layer. Parsers take the raw text of a
// JSON object and throw ConfigurationError for missing or out-of-range
// fields; malformed JSON surfaces as std::runtime_error from MiniJson.

TaskInput parse_task(const std::string& obj);
BusySlot parse_busy_slot(const std::string& obj, BusySource default_source);
// `fallback_task_id` fills a missing task_id (placements nested in a proposal).
Placement parse_placement(const std::string& obj, const std::string& fallback_task_id = std::string());
Horizon parse_horizon(const std::string& obj);
// Overrides `defaults` with whatever keys the work_hours object carries.
SchedulerOptions parse_options(const std::optional<std::string>& obj, const SchedulerOptions& defaults);

struct ScheduleRequest {
    std::vector<TaskInput> tasks;
    Horizon horizon;
    SchedulerOptions options;
    NormalizedAvailability availability;
    std::vector<Placement> existing;
    std::time_t now = 0;
};

// `slot` set: check against that slot only; otherwise against all of
// `availability`.
struct ConflictRequest {
    std::optional<BusySlot> slot;
    NormalizedAvailability availability;
    std::vector<Placement> placements;
};

struct ProposeRequest {
    Placement conflicted;
    TaskInput task;
    NormalizedAvailability availability;
    std::vector<Placement> others;
    Horizon horizon;
    SchedulerOptions options;
    std::time_t now = 0;
};

// Body of an overdue sweep. Every field is optional; `tasks` only carries
// priority and dependencies for the plan's tasks.
struct OverdueRequest {
    std::vector<TaskInput> tasks;
    NormalizedAvailability availability;
    Horizon horizon;
    SchedulerOptions options;
    std::time_t now = 0;
};

// `now` stands in when the body has no "now".
ScheduleRequest parse_schedule_request(const std::string& body, const SchedulerOptions& defaults, std::time_t now);
ConflictRequest parse_conflict_request(const std::string& body);
// Without a horizon the search covers `window_days` days from the later of
// the conflicted date and today.
ProposeRequest parse_propose_request(const std::string& body, const SchedulerOptions& defaults, int window_days, std::time_t now);
// Same body with the placements taken from a plan snapshot: the task's own
// committed placement is the conflicted one unless the body names another.
ProposeRequest parse_plan_propose_request(const std::string& body, const std::vector<Placement>& snapshot,
                                          const SchedulerOptions& defaults, int window_days, std::time_t now);

// Without a horizon the sweep covers `window_days` days from today.
OverdueRequest parse_overdue_request(const std::string& body, const SchedulerOptions& defaults, int window_days, std::time_t now);

std::string placement_json(const Placement& p);
std::string placements_json(const std::vector<Placement>& ps);
std::string schedule_result_json(const ScheduleResult& r);
std::string proposal_json(const RescheduleProposal& p);
std::string proposals_json(const std::vector<RescheduleProposal>& ps);
std::string overdue_run_json(const OverdueRun& run);

}
