#include "PlanCodec.h"
#include "Availability.h"
#include "CivilTime.h"
#include "WorkWindow.h"
#include "../net/MiniJson.h"
#include <algorithm>
#include <limits>
#include <sstream>

namespace scheduling {

static std::string required_string(const std::string& obj, const std::string& key) {
    auto pr = json_extract_string_opt_present(obj, key);
    if (!pr.second.has_value() || pr.second->empty()) throw ConfigurationError("missing field: " + key);
    return *pr.second;
}

static std::optional<int> int_field(const std::string& obj, const std::string& key) {
    auto v = json_extract_int_opt(obj, key);
    if (!v) return std::nullopt;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) throw ConfigurationError("out of range: " + key);
    return static_cast<int>(*v);
}

static std::time_t timestamp_field(const std::string& obj, const std::string& key) {
    std::string s = required_string(obj, key);
    auto t = parse_iso_z(s);
    if (!t) throw ConfigurationError("invalid timestamp for " + key + ": " + s);
    return *t;
}

static std::optional<std::time_t> optional_timestamp(const std::string& obj, const std::string& key) {
    auto pr = json_extract_string_opt_present(obj, key);
    if (!pr.second.has_value()) return std::nullopt;
    auto t = parse_iso_z(*pr.second);
    if (!t) throw ConfigurationError("invalid timestamp for " + key + ": " + *pr.second);
    return t;
}

TaskInput parse_task(const std::string& obj) {
    TaskInput t;
    t.id = required_string(obj, "id");
    t.name = json_extract_string(obj, "name");
    auto dur = int_field(obj, "duration_minutes");
    if (!dur) throw ConfigurationError("missing field: duration_minutes for task " + t.id);
    t.duration_minutes = *dur;
    t.priority = int_field(obj, "priority").value_or(3);
    t.order_index = int_field(obj, "order_index").value_or(0);
    t.dependency_ids = json_extract_string_array(obj, "dependency_ids");
    validate_task(t);
    return t;
}

BusySlot parse_busy_slot(const std::string& obj, BusySource default_source) {
    BusySlot s;
    s.start = timestamp_field(obj, "start");
    s.end = timestamp_field(obj, "end");
    s.source = default_source;
    auto src = json_extract_string_opt_present(obj, "source");
    if (src.second.has_value()) {
        auto parsed = busy_source_from_string(*src.second);
        if (!parsed) throw ConfigurationError("unknown busy source: " + *src.second);
        s.source = *parsed;
    }
    s.metadata = json_extract_string_map(obj, "metadata");
    return s;
}

Placement parse_placement(const std::string& obj, const std::string& fallback_task_id) {
    Placement p;
    p.task_id = json_extract_string(obj, "task_id");
    if (p.task_id.empty()) p.task_id = fallback_task_id;
    if (p.task_id.empty()) throw ConfigurationError("missing field: task_id");
    p.date = required_string(obj, "date");
    parse_date(p.date);
    p.start_minute = parse_hhmm(required_string(obj, "start"));
    p.end_minute = parse_hhmm(required_string(obj, "end"));
    if (p.start_minute >= p.end_minute) throw ConfigurationError("placement start must be before end for task " + p.task_id);
    p.duration_minutes = int_field(obj, "duration_minutes").value_or(p.end_minute - p.start_minute);
    p.day_index = int_field(obj, "day_index").value_or(0);
    p.detached = json_extract_bool_opt(obj, "detached").value_or(false);
    validate_placement(p);
    return p;
}

Horizon parse_horizon(const std::string& obj) {
    Horizon h;
    h.start_date = required_string(obj, "start_date");
    h.end_date = required_string(obj, "end_date");
    if (parse_date(h.start_date) > parse_date(h.end_date)) throw ConfigurationError("horizon start must not be after horizon end");
    return h;
}

SchedulerOptions parse_options(const std::optional<std::string>& obj, const SchedulerOptions& defaults) {
    SchedulerOptions o = defaults;
    if (!obj) return o;
    const std::string& js = *obj;
    if (auto v = int_field(js, "workday_start_hour")) o.workday_start_hour = *v;
    if (auto v = int_field(js, "workday_start_minute")) o.workday_start_minute = *v;
    if (auto v = int_field(js, "workday_end_hour")) o.workday_end_hour = *v;
    if (auto v = int_field(js, "lunch_start_hour")) o.lunch_start_hour = *v;
    if (auto v = int_field(js, "lunch_end_hour")) o.lunch_end_hour = *v;
    if (auto v = json_extract_bool_opt(js, "allow_weekends")) o.allow_weekends = *v;
    if (auto v = int_field(js, "weekend_start_hour")) o.weekend_start_hour = *v;
    if (auto v = int_field(js, "weekend_end_hour")) o.weekend_end_hour = *v;
    if (auto v = int_field(js, "weekend_lunch_start_hour")) o.weekend_lunch_start_hour = *v;
    if (auto v = int_field(js, "weekend_lunch_end_hour")) o.weekend_lunch_end_hour = *v;
    if (auto v = int_field(js, "weekday_max_minutes")) o.weekday_max_minutes = *v;
    if (auto v = int_field(js, "weekend_max_minutes")) o.weekend_max_minutes = *v;
    if (auto v = json_extract_bool_opt(js, "force_start_date")) o.force_start_date = *v;
    if (auto v = json_extract_bool_opt(js, "require_start_date")) o.require_start_date = *v;
    return o;
}

static std::vector<BusySlot> slots_field(const std::string& body, const std::string& key, BusySource source) {
    std::vector<BusySlot> out;
    for (const auto& o : json_extract_object_array(body, key)) out.push_back(parse_busy_slot(o, source));
    return out;
}

static std::vector<Placement> placements_field(const std::string& body, const std::string& key) {
    std::vector<Placement> out;
    for (const auto& o : json_extract_object_array(body, key)) out.push_back(parse_placement(o));
    return out;
}

static NormalizedAvailability availability_fields(const std::string& body) {
    return normalize(slots_field(body, "busy_slots", BusySource::CalendarEvent),
                     slots_field(body, "time_off", BusySource::TimeOff),
                     optional_timestamp(body, "deadline"));
}

ScheduleRequest parse_schedule_request(const std::string& body, const SchedulerOptions& defaults, std::time_t now) {
    ScheduleRequest r;
    for (const auto& o : json_extract_object_array(body, "tasks")) r.tasks.push_back(parse_task(o));
    auto horizon = json_extract_object(body, "horizon");
    if (!horizon) throw ConfigurationError("missing field: horizon");
    r.horizon = parse_horizon(*horizon);
    r.options = parse_options(json_extract_object(body, "work_hours"), defaults);
    r.availability = availability_fields(body);
    r.existing = placements_field(body, "existing_placements");
    r.now = optional_timestamp(body, "now").value_or(now);
    return r;
}

ConflictRequest parse_conflict_request(const std::string& body) {
    ConflictRequest r;
    if (auto slot = json_extract_object(body, "slot")) r.slot = parse_busy_slot(*slot, BusySource::CalendarEvent);
    else r.availability = availability_fields(body);
    r.placements = placements_field(body, "placements");
    return r;
}

static void propose_common(ProposeRequest& r, const std::string& body, const SchedulerOptions& defaults, int window_days, std::time_t now) {
    r.availability = availability_fields(body);
    r.options = parse_options(json_extract_object(body, "work_hours"), defaults);
    r.now = optional_timestamp(body, "now").value_or(now);
    if (auto horizon = json_extract_object(body, "horizon")) {
        r.horizon = parse_horizon(*horizon);
    } else {
        int64_t first = std::max(parse_date(r.conflicted.date), day_of(r.now));
        r.horizon.start_date = format_date(first);
        r.horizon.end_date = format_date(first + std::max(window_days, 1) - 1);
    }
}

static TaskInput task_field(const std::string& body) {
    auto task = json_extract_object(body, "task");
    if (!task) throw ConfigurationError("missing field: task");
    return parse_task(*task);
}

ProposeRequest parse_propose_request(const std::string& body, const SchedulerOptions& defaults, int window_days, std::time_t now) {
    ProposeRequest r;
    auto placement = json_extract_object(body, "placement");
    if (!placement) throw ConfigurationError("missing field: placement");
    r.conflicted = parse_placement(*placement);
    r.task = task_field(body);
    r.others = placements_field(body, "other_placements");
    propose_common(r, body, defaults, window_days, now);
    return r;
}

ProposeRequest parse_plan_propose_request(const std::string& body, const std::vector<Placement>& snapshot,
                                          const SchedulerOptions& defaults, int window_days, std::time_t now) {
    ProposeRequest r;
    r.task = task_field(body);
    bool found = false;
    for (const auto& p : snapshot) {
        if (p.task_id == r.task.id) { r.conflicted = p; found = true; }
        else r.others.push_back(p);
    }
    if (auto placement = json_extract_object(body, "placement")) {
        r.conflicted = parse_placement(*placement, r.task.id);
        found = true;
    }
    if (!found) throw ConfigurationError("task " + r.task.id + " has no committed placement");
    propose_common(r, body, defaults, window_days, now);
    return r;
}

OverdueRequest parse_overdue_request(const std::string& body, const SchedulerOptions& defaults, int window_days, std::time_t now) {
    OverdueRequest r;
    for (const auto& o : json_extract_object_array(body, "tasks")) r.tasks.push_back(parse_task(o));
    r.availability = availability_fields(body);
    r.options = parse_options(json_extract_object(body, "work_hours"), defaults);
    r.now = optional_timestamp(body, "now").value_or(now);
    if (auto horizon = json_extract_object(body, "horizon")) {
        r.horizon = parse_horizon(*horizon);
    } else {
        int64_t first = day_of(r.now);
        r.horizon.start_date = format_date(first);
        r.horizon.end_date = format_date(first + std::max(window_days, 1) - 1);
    }
    return r;
}

std::string placement_json(const Placement& p) {
    std::ostringstream ss;
    ss << "{\"task_id\":\"" << json_escape_resp(p.task_id) << "\"";
    ss << ",\"date\":\"" << p.date << "\"";
    ss << ",\"start\":\"" << format_hhmm(p.start_minute) << "\"";
    ss << ",\"end\":\"" << format_hhmm(p.end_minute) << "\"";
    ss << ",\"duration_minutes\":" << p.duration_minutes;
    ss << ",\"day_index\":" << p.day_index;
    ss << ",\"detached\":" << (p.detached ? "true" : "false") << '}';
    return ss.str();
}

std::string placements_json(const std::vector<Placement>& ps) {
    std::string out = "[";
    for (size_t i = 0; i < ps.size(); ++i) {
        if (i) out += ',';
        out += placement_json(ps[i]);
    }
    return out + "]";
}

std::string schedule_result_json(const ScheduleResult& r) {
    std::ostringstream ss;
    ss << "{\"placements\":" << placements_json(r.placements) << ",\"unplaced\":[";
    for (size_t i = 0; i < r.unplaced.size(); ++i) {
        const auto& u = r.unplaced[i];
        if (i) ss << ',';
        ss << "{\"task_id\":\"" << json_escape_resp(u.task.id) << "\",\"name\":\"" << json_escape_resp(u.task.name) << "\"";
        ss << ",\"reason\":\"" << to_string(u.reason) << "\"";
        if (!u.blocking_dependency.empty()) ss << ",\"blocking_dependency\":\"" << json_escape_resp(u.blocking_dependency) << "\"";
        ss << '}';
    }
    ss << "],\"total_scheduled_minutes\":" << r.total_scheduled_minutes << '}';
    return ss.str();
}

std::string proposal_json(const RescheduleProposal& p) {
    std::ostringstream ss;
    ss << "{\"id\":\"" << json_escape_resp(p.id) << "\"";
    ss << ",\"task_id\":\"" << json_escape_resp(p.task_id) << "\"";
    ss << ",\"original\":" << placement_json(p.original);
    ss << ",\"proposed\":" << placement_json(p.proposed);
    ss << ",\"context_score\":" << json_emit_double(p.context_score);
    ss << ",\"priority_penalty\":" << json_emit_double(p.priority_penalty);
    ss << ",\"density_penalty\":" << json_emit_double(p.density_penalty);
    ss << ",\"reason\":\"" << json_escape_resp(p.reason) << "\"";
    ss << ",\"status\":\"" << to_string(p.status) << "\"";
    ss << ",\"created_at\":\"" << format_iso_z(p.created_at) << "\"";
    ss << ",\"reviewed_at\":";
    if (p.reviewed_at) ss << '"' << format_iso_z(*p.reviewed_at) << '"'; else ss << "null";
    ss << '}';
    return ss.str();
}

std::string proposals_json(const std::vector<RescheduleProposal>& ps) {
    std::string out = "[";
    for (size_t i = 0; i < ps.size(); ++i) {
        if (i) out += ',';
        out += proposal_json(ps[i]);
    }
    return out + "]";
}

std::string overdue_run_json(const OverdueRun& run) {
    std::ostringstream ss;
    ss << "{\"proposals\":" << proposals_json(run.proposals) << ",\"skipped\":[";
    for (size_t i = 0; i < run.skipped.size(); ++i) {
        if (i) ss << ',';
        ss << "{\"task_id\":\"" << json_escape_resp(run.skipped[i].task_id) << "\",\"reason\":\"" << to_string(run.skipped[i].reason) << "\"}";
    }
    ss << "]}";
    return ss.str();
}

}
