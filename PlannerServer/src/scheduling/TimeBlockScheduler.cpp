#include "TimeBlockScheduler.h"
#include "Availability.h"
#include "CivilTime.h"
#include "WorkWindow.h"
#include "../observability/Logging.h"
#include <algorithm>
#include <map>
#include <optional>
#include <set>

namespace scheduling {

namespace {

struct RunContext {
    const SchedulerOptions& options;
    const NormalizedAvailability& availability;
    int64_t first_day = 0;
    int64_t last_day = 0;
    int64_t start_day = 0;
    std::optional<std::time_t> elapsed_until;
    std::map<int64_t, DayLoad> loads;
};

struct Attempt {
    std::optional<Placement> placement;
    UnplacedReason reason = UnplacedReason::NoCapacity;
};

Attempt place_task(const TaskInput& t, RunContext& ctx, std::optional<std::time_t> not_before) {
    Attempt a;
    const auto& deadline = ctx.availability.deadline;
    bool walked = false;
    bool saw_enabled = false;
    bool long_enough = false;

    for (int64_t d = ctx.start_day; d <= ctx.last_day; ++d) {
        if (deadline && d > day_of(*deadline)) break;
        walked = true;
        DayWindow w = day_window(ctx.options, d);
        if (!w.enabled && !(ctx.options.force_start_date && d == ctx.first_day)) continue;
        saw_enabled = true;
        if (longest_segment(w) < t.duration_minutes) continue;
        long_enough = true;

        int from = 0;
        if (ctx.elapsed_until && d == day_of(*ctx.elapsed_until)) from = minute_of_day_ceil(*ctx.elapsed_until);
        if (not_before) {
            if (d < day_of(*not_before)) continue;
            if (d == day_of(*not_before)) from = std::max(from, minute_of_day_ceil(*not_before));
        }
        int until = kMinutesPerDay;
        if (deadline && d == day_of(*deadline)) until = minute_of_day(*deadline);

        DayLoad& load = ctx.loads[d];
        if (w.cap && load.used_minutes + t.duration_minutes > *w.cap) continue;

        auto blocked = blocked_minutes_on(ctx.availability, d);
        blocked.insert(blocked.end(), load.occupied.begin(), load.occupied.end());
        for (const auto& iv : free_intervals(w, from, until, std::move(blocked))) {
            if (iv.end - iv.start < t.duration_minutes) continue;
            Placement p;
            p.task_id = t.id;
            p.date = format_date(d);
            p.start_minute = iv.start;
            p.end_minute = iv.start + t.duration_minutes;
            p.duration_minutes = t.duration_minutes;
            p.day_index = static_cast<int>(d - ctx.first_day);
            add_load(load, p);
            a.placement = std::move(p);
            return a;
        }
    }

    if (!walked) a.reason = UnplacedReason::PastHorizon;
    else if (saw_enabled && !long_enough) a.reason = UnplacedReason::ExceedsDayWindow;
    else a.reason = UnplacedReason::NoCapacity;
    return a;
}

}

ScheduleResult schedule(const std::vector<TaskInput>& tasks,
                        const Horizon& horizon,
                        const SchedulerOptions& options,
                        const NormalizedAvailability& availability,
                        const std::vector<Placement>& existing,
                        std::time_t now) {
    validate_options(options);
    std::set<std::string> batch_ids;
    for (const auto& t : tasks) {
        validate_task(t);
        if (!batch_ids.insert(t.id).second) throw ConfigurationError("duplicate task id: " + t.id);
    }
    int64_t first_day = parse_date(horizon.start_date);
    int64_t last_day = parse_date(horizon.end_date);
    if (first_day > last_day) throw ConfigurationError("horizon start must not be after horizon end");
    for (const auto& p : existing) validate_placement(p);

    RunContext ctx{options, availability};
    ctx.first_day = first_day;
    ctx.last_day = last_day;
    ctx.start_day = first_day;
    if (!options.require_start_date) {
        int64_t today = day_of(now);
        ctx.start_day = std::max(first_day, today);
        ctx.elapsed_until = now;
    }
    ctx.loads = load_by_day(existing);

    std::map<std::string, std::time_t> placed_end;
    for (const auto& p : existing) {
        std::time_t e = placement_end(p);
        auto it = placed_end.find(p.task_id);
        if (it == placed_end.end() || it->second < e) placed_end[p.task_id] = e;
    }

    std::vector<const TaskInput*> order;
    order.reserve(tasks.size());
    for (const auto& t : tasks) order.push_back(&t);
    std::sort(order.begin(), order.end(), [](const TaskInput* a, const TaskInput* b) {
        if (a->order_index != b->order_index) return a->order_index < b->order_index;
        if (a->priority != b->priority) return a->priority < b->priority;
        if (a->duration_minutes != b->duration_minutes) return a->duration_minutes > b->duration_minutes;
        return a->id < b->id;
    });

    ScheduleResult result;
    std::set<std::string> failed;
    std::vector<bool> done(order.size(), false);

    auto mark_cascade = [&](size_t i, const std::string& blocking) {
        UnplacedTask u;
        u.task = *order[i];
        u.reason = UnplacedReason::DependencyUnplaced;
        u.blocking_dependency = blocking;
        result.unplaced.push_back(std::move(u));
        failed.insert(order[i]->id);
        done[i] = true;
        observability::log_warn("schedule.cascading_unplaced", {{"task_id", order[i]->id}, {"blocking", blocking}});
    };

    // Restart from the front after every decision so the earliest ready task
    // in order always goes next.
    bool progress = true;
    while (progress) {
        progress = false;
        for (size_t i = 0; i < order.size(); ++i) {
            if (done[i]) continue;
            const TaskInput& t = *order[i];
            std::optional<std::time_t> not_before;
            std::string blocking;
            bool waiting = false;
            for (const auto& dep : t.dependency_ids) {
                auto pe = placed_end.find(dep);
                if (pe != placed_end.end() && dep != t.id) {
                    if (!not_before || *not_before < pe->second) not_before = pe->second;
                } else if (dep == t.id || failed.count(dep) || !batch_ids.count(dep)) {
                    blocking = dep;
                    break;
                } else {
                    waiting = true;
                }
            }
            if (!blocking.empty()) {
                mark_cascade(i, blocking);
                progress = true;
                break;
            }
            if (waiting) continue;

            Attempt a = place_task(t, ctx, not_before);
            if (a.placement) {
                placed_end[t.id] = placement_end(*a.placement);
                result.total_scheduled_minutes += a.placement->duration_minutes;
                result.placements.push_back(std::move(*a.placement));
            } else {
                result.unplaced.push_back(UnplacedTask{t, a.reason, std::string()});
                failed.insert(t.id);
            }
            done[i] = true;
            progress = true;
            break;
        }
    }

    // Whatever is left waits on a dependency cycle.
    for (size_t i = 0; i < order.size(); ++i) {
        if (done[i]) continue;
        std::string blocking;
        for (const auto& dep : order[i]->dependency_ids) {
            if (!placed_end.count(dep)) { blocking = dep; break; }
        }
        mark_cascade(i, blocking);
    }

    observability::log_debug("schedule.run", {
        {"tasks", int64_t(tasks.size())},
        {"placed", int64_t(result.placements.size())},
        {"unplaced", int64_t(result.unplaced.size())},
        {"minutes", int64_t(result.total_scheduled_minutes)}});
    return result;
}

std::vector<std::pair<Placement, Placement>> find_overlaps(const std::vector<Placement>& placements) {
    std::vector<std::pair<Placement, Placement>> out;
    for (size_t i = 0; i < placements.size(); ++i) {
        const auto& a = placements[i];
        if (a.detached) continue;
        for (size_t j = i + 1; j < placements.size(); ++j) {
            const auto& b = placements[j];
            if (b.detached || a.date != b.date) continue;
            if (a.start_minute < b.end_minute && b.start_minute < a.end_minute) out.emplace_back(a, b);
        }
    }
    return out;
}

}
