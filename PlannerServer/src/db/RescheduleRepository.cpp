#include "RescheduleRepository.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../scheduling/CivilTime.h"
#include "../scheduling/WorkWindow.h"
#include <cstdlib>
#include <stdexcept>

namespace db {

using scheduling::DecisionError;
using scheduling::DecisionResult;
using scheduling::Placement;
using scheduling::RescheduleProposal;

static const char* kPlacementColumns =
    "task_id, date::text AS date, to_char(start_time, 'HH24:MI') AS start_time, "
    "to_char(end_time, 'HH24:MI') AS end_time, duration_minutes, day_index, is_detached";

static const char* kProposalColumns =
    "id::text AS id, task_id, "
    "original_date::text AS original_date, to_char(original_start_time, 'HH24:MI') AS original_start, "
    "to_char(original_end_time, 'HH24:MI') AS original_end, original_day_index, "
    "proposed_date::text AS proposed_date, to_char(proposed_start_time, 'HH24:MI') AS proposed_start, "
    "to_char(proposed_end_time, 'HH24:MI') AS proposed_end, proposed_day_index, duration_minutes, "
    "context_score, priority_penalty, density_penalty, reason, status, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS created_at, "
    "to_char(reviewed_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS reviewed_at";

static std::optional<std::string> cell(const DbResult& r, size_t row, const char* name) {
    int c = r.column(name);
    if (c < 0 || row >= r.rows.size() || size_t(c) >= r.rows[row].size()) return std::nullopt;
    return r.rows[row][size_t(c)];
}

static std::string text(const DbResult& r, size_t row, const char* name) { return cell(r, row, name).value_or(std::string()); }

static int integer(const DbResult& r, size_t row, const char* name) { return json_parse_int32_strict(cell(r, row, name)).value_or(0); }

static double number(const DbResult& r, size_t row, const char* name) {
    auto v = cell(r, row, name);
    return v ? std::strtod(v->c_str(), nullptr) : 0.0;
}

// Placement stored as date + HH:MM columns sharing `prefix`.
static Placement placement_at(const DbResult& r, size_t row, const std::string& task_id, const std::string& prefix, const char* day_index_col) {
    Placement p;
    p.task_id = task_id;
    p.date = text(r, row, (prefix + "date").c_str());
    scheduling::parse_date(p.date);
    p.start_minute = scheduling::parse_hhmm(text(r, row, (prefix + "start").c_str()));
    p.end_minute = scheduling::parse_hhmm(text(r, row, (prefix + "end").c_str()));
    p.duration_minutes = integer(r, row, "duration_minutes");
    p.day_index = integer(r, row, day_index_col);
    scheduling::validate_placement(p);
    return p;
}

static boost::system::error_code failed_statement(const char* op, const DbResult& r) {
    observability::log_warn("repository.query_failed", {{"op", std::string(op)}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    return boost::system::errc::make_error_code(boost::system::errc::io_error);
}

RescheduleRepository::RescheduleRepository(std::shared_ptr<DbPool> db) : db_(std::move(db)) {}

std::vector<Placement> RescheduleRepository::placements_from(const DbResult& r) {
    std::vector<Placement> out;
    for (size_t i = 0; i < r.rows.size(); ++i) {
        try {
            Placement p;
            p.task_id = text(r, i, "task_id");
            p.date = text(r, i, "date");
            scheduling::parse_date(p.date);
            p.start_minute = scheduling::parse_hhmm(text(r, i, "start_time"));
            p.end_minute = scheduling::parse_hhmm(text(r, i, "end_time"));
            p.duration_minutes = integer(r, i, "duration_minutes");
            p.day_index = integer(r, i, "day_index");
            p.detached = text(r, i, "is_detached") == "t";
            scheduling::validate_placement(p);
            out.push_back(std::move(p));
        } catch (const scheduling::ConfigurationError& e) {
            observability::log_warn("repository.bad_row", {{"table", std::string("task_schedule")}, {"err", std::string(e.what())}});
        }
    }
    return out;
}

std::vector<RescheduleProposal> RescheduleRepository::proposals_from(const DbResult& r) {
    std::vector<RescheduleProposal> out;
    for (size_t i = 0; i < r.rows.size(); ++i) {
        try {
            RescheduleProposal p;
            p.id = text(r, i, "id");
            p.task_id = text(r, i, "task_id");
            p.original = placement_at(r, i, p.task_id, "original_", "original_day_index");
            p.proposed = placement_at(r, i, p.task_id, "proposed_", "proposed_day_index");
            p.context_score = number(r, i, "context_score");
            p.priority_penalty = number(r, i, "priority_penalty");
            p.density_penalty = number(r, i, "density_penalty");
            p.reason = text(r, i, "reason");
            auto st = scheduling::proposal_status_from_string(text(r, i, "status"));
            if (!st) throw scheduling::ConfigurationError("unknown status: " + text(r, i, "status"));
            p.status = *st;
            p.created_at = scheduling::parse_iso_z(text(r, i, "created_at")).value_or(0);
            if (auto rv = cell(r, i, "reviewed_at")) p.reviewed_at = scheduling::parse_iso_z(*rv);
            out.push_back(std::move(p));
        } catch (const scheduling::ConfigurationError& e) {
            observability::log_warn("repository.bad_row", {{"table", std::string("pending_reschedules")}, {"err", std::string(e.what())}});
        }
    }
    return out;
}

DecisionResult RescheduleRepository::decision_from(const DbResult& r, const std::string& proposal_id) {
    DecisionResult d;
    d.proposal_id = proposal_id;
    if (r.rows.empty()) { d.error = DecisionError::NotFound; return d; }
    if (text(r, 0, "previous_status") != "pending") { d.error = DecisionError::NotPending; return d; }
    if (text(r, 0, "new_status") == "expired") d.error = DecisionError::Stale;
    return d;
}

void RescheduleRepository::async_list_placements(const std::string& plan_id, PlacementsCb cb) {
    std::string sql = std::string("SELECT ") + kPlacementColumns +
        " FROM task_schedule WHERE plan_id = $1::uuid ORDER BY date, start_time, task_id";
    db_->async_exec_params(sql, {plan_id}, [cb](const boost::system::error_code& ec, DbResult r) {
        if (ec) { cb(ec, {}); return; }
        if (!r.ok) { cb(failed_statement("list_placements", r), {}); return; }
        cb({}, placements_from(r));
    });
}

void RescheduleRepository::async_insert_proposal(const std::string& plan_id, const RescheduleProposal& p, InsertCb cb) {
    std::string sql = std::string(
        "INSERT INTO pending_reschedules(id, plan_id, task_id, "
        "original_date, original_start_time, original_end_time, original_day_index, "
        "proposed_date, proposed_start_time, proposed_end_time, proposed_day_index, duration_minutes, "
        "context_score, priority_penalty, density_penalty, reason, status, created_at) "
        "VALUES($1::uuid, $2::uuid, $3, $4::date, $5::time, $6::time, $7::int, $8::date, $9::time, $10::time, $11::int, $12::int, "
        "$13::double precision, $14::double precision, $15::double precision, $16, 'pending', $17::timestamptz) "
        "RETURNING ") + kProposalColumns;
    std::string id = p.id;
    if (id.empty()) {
        try {
            id = scheduling::generate_proposal_id();
        } catch (const std::runtime_error& e) {
            observability::log_error("repository.proposal_id_failed", {{"err", std::string(e.what())}});
            cb(boost::system::errc::make_error_code(boost::system::errc::io_error), DecisionResult{}, std::nullopt);
            return;
        }
    }
    std::vector<std::optional<std::string>> params = {
        id, plan_id, p.task_id,
        p.original.date, scheduling::format_hhmm(p.original.start_minute), scheduling::format_hhmm(p.original.end_minute), std::to_string(p.original.day_index),
        p.proposed.date, scheduling::format_hhmm(p.proposed.start_minute), scheduling::format_hhmm(p.proposed.end_minute), std::to_string(p.proposed.day_index),
        std::to_string(p.proposed.duration_minutes),
        json_emit_double(p.context_score), json_emit_double(p.priority_penalty), json_emit_double(p.density_penalty),
        p.reason, scheduling::format_iso_z(p.created_at)};
    db_->async_exec_params(sql, std::move(params), [cb, id](const boost::system::error_code& ec, DbResult r) {
        DecisionResult d;
        d.proposal_id = id;
        if (ec) { cb(ec, d, std::nullopt); return; }
        if (!r.ok) {
            if (r.sqlstate == "23505") { d.error = DecisionError::DuplicatePending; cb({}, d, std::nullopt); return; }
            cb(failed_statement("insert_proposal", r), d, std::nullopt);
            return;
        }
        auto rows = proposals_from(r);
        if (rows.empty()) { cb(boost::system::errc::make_error_code(boost::system::errc::io_error), d, std::nullopt); return; }
        cb({}, d, std::move(rows.front()));
    });
}

void RescheduleRepository::async_list_proposals(const std::string& plan_id, std::optional<scheduling::ProposalStatus> status, ProposalsCb cb) {
    std::string sql = std::string("SELECT ") + kProposalColumns +
        " FROM pending_reschedules WHERE plan_id = $1::uuid AND ($2::text IS NULL OR status = $2::text)"
        " ORDER BY created_at, id";
    std::optional<std::string> st;
    if (status) st = std::string(scheduling::to_string(*status));
    db_->async_exec_params(sql, {plan_id, st}, [cb](const boost::system::error_code& ec, DbResult r) {
        if (ec) { cb(ec, {}); return; }
        if (!r.ok) { cb(failed_statement("list_proposals", r), {}); return; }
        cb({}, proposals_from(r));
    });
}

void RescheduleRepository::async_accept_proposal(const std::string& proposal_id, DecisionCb cb) {
    // The row lock on the proposal serializes concurrent decisions; the swap
    // is guarded by the original slot so a moved task turns the proposal stale.
    static const char* sql =
        "WITH p AS ("
        "  SELECT * FROM pending_reschedules WHERE id = $1::uuid FOR UPDATE"
        "), swapped AS ("
        "  UPDATE task_schedule t"
        "     SET date = p.proposed_date, start_time = p.proposed_start_time, end_time = p.proposed_end_time,"
        "         day_index = p.proposed_day_index, rescheduled_from = t.date,"
        "         reschedule_count = t.reschedule_count + 1, last_rescheduled_at = now(), updated_at = now()"
        "    FROM p"
        "   WHERE p.status = 'pending' AND t.plan_id = p.plan_id AND t.task_id = p.task_id"
        "     AND t.date = p.original_date AND t.start_time = p.original_start_time AND t.end_time = p.original_end_time"
        "     AND NOT EXISTS ("
        "       SELECT 1 FROM task_schedule o"
        "        WHERE o.plan_id = p.plan_id AND o.task_id <> p.task_id AND NOT o.is_detached"
        "          AND o.date = p.proposed_date"
        "          AND o.start_time < p.proposed_end_time AND p.proposed_start_time < o.end_time)"
        "  RETURNING t.task_id"
        "), history AS ("
        "  INSERT INTO scheduling_history(plan_id, task_id, proposal_id, from_date, from_start_time, to_date, to_start_time)"
        "  SELECT p.plan_id, p.task_id, p.id, p.original_date, p.original_start_time, p.proposed_date, p.proposed_start_time"
        "    FROM p WHERE EXISTS (SELECT 1 FROM swapped)"
        "), marked AS ("
        "  UPDATE pending_reschedules r"
        "     SET status = CASE WHEN EXISTS (SELECT 1 FROM swapped) THEN 'accepted' ELSE 'expired' END,"
        "         reviewed_at = now()"
        "    FROM p WHERE r.id = p.id AND p.status = 'pending'"
        "  RETURNING r.status"
        ") SELECT p.status AS previous_status, (SELECT status FROM marked) AS new_status FROM p";
    db_->async_exec_params(sql, {proposal_id}, [cb, proposal_id](const boost::system::error_code& ec, DbResult r) {
        DecisionResult d;
        d.proposal_id = proposal_id;
        if (ec) { cb(ec, d); return; }
        if (!r.ok) { cb(failed_statement("accept_proposal", r), d); return; }
        d = decision_from(r, proposal_id);
        if (d.error == DecisionError::Stale) observability::log_info("proposal.stale", {{"proposal_id", proposal_id}});
        cb({}, d);
    });
}

void RescheduleRepository::async_reject_proposal(const std::string& proposal_id, DecisionCb cb) {
    static const char* sql =
        "WITH p AS ("
        "  SELECT id, status FROM pending_reschedules WHERE id = $1::uuid FOR UPDATE"
        "), marked AS ("
        "  UPDATE pending_reschedules r SET status = 'rejected', reviewed_at = now()"
        "    FROM p WHERE r.id = p.id AND p.status = 'pending'"
        "  RETURNING r.status"
        ") SELECT p.status AS previous_status, (SELECT status FROM marked) AS new_status FROM p";
    db_->async_exec_params(sql, {proposal_id}, [cb, proposal_id](const boost::system::error_code& ec, DbResult r) {
        DecisionResult d;
        d.proposal_id = proposal_id;
        if (ec) { cb(ec, d); return; }
        if (!r.ok) { cb(failed_statement("reject_proposal", r), d); return; }
        cb({}, decision_from(r, proposal_id));
    });
}

}
