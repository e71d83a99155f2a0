#include "RescheduleEngine.h"
#include "Availability.h"
#include "CivilTime.h"
#include "ConflictDetector.h"
#include "WorkWindow.h"
#include "../observability/Logging.h"
#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>

namespace scheduling {

double priority_weight(int priority) {
    switch (priority) {
        case 1: return 3.0;
        case 2: return 2.0;
        case 3: return 1.0;
        default: return 0.5;
    }
}

static std::string describe_slot(const BusySlot& s) {
    std::string out;
    switch (s.source) {
        case BusySource::ExistingPlan: out = "task from another plan"; break;
        case BusySource::ManualTask: out = "manual task"; break;
        case BusySource::CalendarEvent: out = "calendar event"; break;
        case BusySource::TimeOff: out = "time off"; break;
    }
    auto title = s.metadata.find("title");
    if (title != s.metadata.end() && !title->second.empty()) out += " \"" + title->second + "\"";
    out += " " + format_hhmm(minute_of_day(s.start)) + "-" + format_hhmm(minute_of_day(s.end));
    return out;
}

static std::string conflict_cause(const Placement& conflicted, const NormalizedAvailability& availability, const std::vector<Placement>& others) {
    auto hits = overlapping(availability, placement_start(conflicted), placement_end(conflicted));
    if (!hits.empty()) return "conflicts with " + describe_slot(hits.front());
    for (const auto& o : others) {
        if (o.task_id == conflicted.task_id || o.date != conflicted.date) continue;
        if (o.start_minute < conflicted.end_minute && conflicted.start_minute < o.end_minute) {
            return "overlaps task " + o.task_id + " " + format_hhmm(o.start_minute) + "-" + format_hhmm(o.end_minute);
        }
    }
    return "requested move";
}

std::optional<RescheduleProposal> propose(const Placement& conflicted,
                                          const TaskInput& task,
                                          const NormalizedAvailability& availability,
                                          const std::vector<Placement>& other_placements,
                                          const Horizon& horizon,
                                          const SchedulerOptions& options,
                                          std::time_t now) {
    validate_options(options);
    validate_task(task);
    if (conflicted.task_id != task.id) throw ConfigurationError("placement task " + conflicted.task_id + " does not match task " + task.id);
    validate_placement(conflicted);
    for (const auto& o : other_placements) validate_placement(o);
    int64_t first_day = parse_date(horizon.start_date);
    int64_t last_day = parse_date(horizon.end_date);
    if (first_day > last_day) throw ConfigurationError("horizon start must not be after horizon end");

    const int dur = task.duration_minutes;
    const int64_t orig_day = parse_date(conflicted.date);
    const std::time_t orig_start = placement_start(conflicted);
    auto loads = load_by_day(other_placements, task.id);

    std::optional<std::time_t> not_before;
    for (const auto& dep : task.dependency_ids) {
        for (const auto& o : other_placements) {
            if (o.task_id != dep) continue;
            std::time_t e = placement_end(o);
            if (!not_before || *not_before < e) not_before = e;
        }
    }

    const auto& deadline = availability.deadline;
    const int64_t today = day_of(now);
    std::optional<RescheduleProposal> best;

    for (int64_t d = std::max(first_day, today); d <= last_day; ++d) {
        if (deadline && d > day_of(*deadline)) break;
        DayWindow w = day_window(options, d);
        if (!w.enabled && !(options.force_start_date && d == first_day)) continue;
        int capacity = day_capacity(w);
        if (capacity <= 0) continue;

        int from = (d == today) ? minute_of_day_ceil(now) : 0;
        if (not_before) {
            if (d < day_of(*not_before)) continue;
            if (d == day_of(*not_before)) from = std::max(from, minute_of_day_ceil(*not_before));
        }
        int until = kMinutesPerDay;
        if (deadline && d == day_of(*deadline)) until = minute_of_day(*deadline);

        const DayLoad& load = loads[d];
        if (w.cap && load.used_minutes + dur > *w.cap) continue;
        const double density = 10.0 * double(load.used_minutes + dur) / double(capacity);

        auto blocked = blocked_minutes_on(availability, d);
        blocked.insert(blocked.end(), load.occupied.begin(), load.occupied.end());
        for (const auto& iv : free_intervals(w, from, until, std::move(blocked))) {
            if (iv.end - iv.start < dur) continue;
            std::vector<int> starts = {iv.start, iv.end - dur, std::clamp(conflicted.start_minute, iv.start, iv.end - dur)};
            std::sort(starts.begin(), starts.end());
            starts.erase(std::unique(starts.begin(), starts.end()), starts.end());
            for (int s : starts) {
                if (d == orig_day && s == conflicted.start_minute) continue;
                std::time_t ts = day_start(d) + s * 60;
                double hours = std::llabs(static_cast<long long>(ts - orig_start)) / 3600.0;
                double priority_penalty = hours * priority_weight(task.priority);
                double score = (100.0 - hours) - priority_penalty - density;
                if (best && score <= best->context_score + 1e-9) continue;

                RescheduleProposal p;
                p.task_id = task.id;
                p.original = conflicted;
                p.proposed.task_id = task.id;
                p.proposed.date = format_date(d);
                p.proposed.start_minute = s;
                p.proposed.end_minute = s + dur;
                p.proposed.duration_minutes = dur;
                p.proposed.day_index = static_cast<int>(d - first_day);
                p.context_score = score;
                p.priority_penalty = priority_penalty;
                p.density_penalty = density;
                p.created_at = now;
                best = std::move(p);
            }
        }
    }

    if (!best) {
        observability::log_debug("reschedule.no_feasible_slot", {{"task_id", task.id}, {"date", conflicted.date}});
        return std::nullopt;
    }
    best->reason = conflict_cause(conflicted, availability, other_placements) + "; moved to " + best->proposed.date + " " +
                   format_hhmm(best->proposed.start_minute) + "-" + format_hhmm(best->proposed.end_minute);
    return best;
}

const char* to_string(OverdueSkipReason r) {
    switch (r) {
        case OverdueSkipReason::PendingProposal: return "pending_proposal";
        case OverdueSkipReason::NoFeasibleSlot: return "no_feasible_slot";
        case OverdueSkipReason::RepositoryUnavailable: return "repository_unavailable";
    }
    return "no_feasible_slot";
}

// Puts `slot` in place of its task's placement in `plan`.
static void move_within(std::vector<Placement>& plan, const Placement& slot) {
    for (auto& p : plan) {
        if (p.task_id != slot.task_id) continue;
        p.date = slot.date;
        p.start_minute = slot.start_minute;
        p.end_minute = slot.end_minute;
        p.duration_minutes = slot.duration_minutes;
        p.day_index = slot.day_index;
        return;
    }
    plan.push_back(slot);
}

OverdueRun propose_overdue(const std::vector<Placement>& committed,
                           const std::vector<TaskInput>& tasks,
                           const std::vector<RescheduleProposal>& pending,
                           const NormalizedAvailability& availability,
                           const Horizon& horizon,
                           const SchedulerOptions& options,
                           std::time_t now) {
    std::map<std::string, TaskInput> by_id;
    for (const auto& t : tasks) by_id[t.id] = t;

    std::vector<Placement> plan = committed;
    std::set<std::string> has_pending;
    for (const auto& p : pending) {
        if (p.status != ProposalStatus::Pending) continue;
        has_pending.insert(p.task_id);
        move_within(plan, p.proposed);
    }

    OverdueRun run;
    auto overdue = detect_overdue(committed, now);
    for (const auto& late : overdue) {
        if (has_pending.count(late.task_id)) {
            run.skipped.push_back(OverdueSkip{late.task_id, OverdueSkipReason::PendingProposal});
            continue;
        }
        TaskInput task;
        auto it = by_id.find(late.task_id);
        if (it != by_id.end()) {
            task = it->second;
        } else {
            task.id = late.task_id;
            task.name = late.task_id;
            task.duration_minutes = late.duration_minutes;
        }
        auto p = propose(late, task, availability, plan, horizon, options, now);
        if (!p) {
            run.skipped.push_back(OverdueSkip{late.task_id, OverdueSkipReason::NoFeasibleSlot});
            continue;
        }
        p->reason = "overdue since " + late.date + " " + format_hhmm(late.end_minute) + "; moved to " + p->proposed.date + " " +
                    format_hhmm(p->proposed.start_minute) + "-" + format_hhmm(p->proposed.end_minute);
        move_within(plan, p->proposed);
        run.proposals.push_back(std::move(*p));
    }

    observability::log_info("reschedule.overdue", {{"overdue", int64_t(overdue.size())},
                                                   {"proposed", int64_t(run.proposals.size())},
                                                   {"skipped", int64_t(run.skipped.size())}});
    return run;
}

}
