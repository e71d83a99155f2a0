#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scheduling {

// Malformed input rejected before any placement attempt.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class BusySource { ExistingPlan, ManualTask, CalendarEvent, TimeOff };

const char* to_string(BusySource s);
std::optional<BusySource> busy_source_from_string(const std::string& s);

struct BusySlot {
    std::time_t start = 0;
    std::time_t end = 0;
    BusySource source = BusySource::CalendarEvent;
    std::map<std::string, std::string> metadata;
    int merged_count = 1;
};

struct NormalizedAvailability {
    std::vector<BusySlot> busy_slots;
    std::vector<BusySlot> time_off;
    std::optional<std::time_t> deadline;
};

struct TaskInput {
    std::string id;
    std::string name;
    int duration_minutes = 0;
    int priority = 3;
    int order_index = 0;
    std::vector<std::string> dependency_ids;
};

// Times are minutes after midnight of `date` (YYYY-MM-DD).
struct Placement {
    std::string task_id;
    std::string date;
    int start_minute = 0;
    int end_minute = 0;
    int duration_minutes = 0;
    int day_index = 0;
    bool detached = false;

    bool same_slot(const Placement& o) const {
        return task_id == o.task_id && date == o.date && start_minute == o.start_minute && end_minute == o.end_minute;
    }
};

// Inclusive date range.
struct Horizon {
    std::string start_date;
    std::string end_date;
};

struct SchedulerOptions {
    int workday_start_hour = 9;
    int workday_start_minute = 0;
    int workday_end_hour = 17;
    int lunch_start_hour = 12;
    int lunch_end_hour = 13;
    bool allow_weekends = false;
    std::optional<int> weekend_start_hour;
    std::optional<int> weekend_end_hour;
    std::optional<int> weekend_lunch_start_hour;
    std::optional<int> weekend_lunch_end_hour;
    std::optional<int> weekday_max_minutes;
    std::optional<int> weekend_max_minutes;
    bool force_start_date = false;
    bool require_start_date = false;
};

enum class UnplacedReason { NoCapacity, ExceedsDayWindow, DependencyUnplaced, PastHorizon };

const char* to_string(UnplacedReason r);

struct UnplacedTask {
    TaskInput task;
    UnplacedReason reason = UnplacedReason::NoCapacity;
    std::string blocking_dependency;
};

struct ScheduleResult {
    std::vector<Placement> placements;
    std::vector<UnplacedTask> unplaced;
    int total_scheduled_minutes = 0;
};

enum class ProposalStatus { Pending, Accepted, Rejected, Expired };

const char* to_string(ProposalStatus s);
std::optional<ProposalStatus> proposal_status_from_string(const std::string& s);

struct RescheduleProposal {
    std::string id;
    std::string task_id;
    Placement original;
    Placement proposed;
    double context_score = 0.0;
    double priority_penalty = 0.0;
    double density_penalty = 0.0;
    std::string reason;
    ProposalStatus status = ProposalStatus::Pending;
    std::time_t created_at = 0;
    std::optional<std::time_t> reviewed_at;
};

}
