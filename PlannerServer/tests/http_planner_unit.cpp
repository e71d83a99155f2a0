#include "fake_libpq.h"
#include <boost/asio/thread_pool.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include "db/DbPool.h"
#include "db/RescheduleRepository.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "observability/Logging.h"
#include "http_test_util.h"
#include "test_util.h"

static void fail(const std::string& msg) {
    std::cerr << msg << std::endl;
    std::exit(2);
}

static void expect(const std::pair<int, std::string>& res, int code, const std::string& needle, const std::string& what) {
    if (res.first != code) fail(what + ": expected " + std::to_string(code) + " got " + std::to_string(res.first) + " body=" + res.second);
    if (!needle.empty() && res.second.find(needle) == std::string::npos) fail(what + ": body missing " + needle + " in " + res.second);
}

static const char* kPlan = "5b0c6a3e-2f7d-4a8e-9c41-0d6f1e2a3b4c";
static const char* kProposal = "0f8fad5b-d9cb-469f-a165-70867728950e";

static const char* kStandup =
    "{\"start\":\"2026-03-02T10:00:00Z\",\"end\":\"2026-03-02T11:00:00Z\",\"metadata\":{\"title\":\"Standup\"}}";

int main() {
    observability::set_log_level(4);
    fake_pg_clear_queue();
    fake_pg_set_connect_ok(1);

    Router router;
    router.add_route("GET", "/health", [](const Request& req) {
        Response res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json; charset=utf-8");
        res.body() = "{\"status\":\"ok\"}";
        res.prepare_payload();
        return res;
    });

    AppLoop app;
    auto cpu_pool = std::make_shared<boost::asio::thread_pool>(2);
    auto pool = std::make_shared<db::DbPool>(app.ioc, "dbname=test", 1);
    auto repo = std::make_shared<db::RescheduleRepository>(pool);
    scheduling::SchedulerOptions defaults;

    HttpServer bare(app.ioc, 0, router, false, false, nullptr, nullptr, cpu_pool, defaults, 7);
    HttpServer backed(app.ioc, 0, router, false, false, pool, repo, cpu_pool, defaults, 7);
    bare.run();
    backed.run();
    const unsigned short port = bare.local_port();
    const unsigned short db_port = backed.local_port();

    expect(get(port, "/health"), 200, "\"status\":\"ok\"", "health");
    expect(get(port, "/nope"), 404, "not_found", "unknown path");
    expect(get(port, "/schedule"), 405, "method_not_allowed", "GET /schedule");

    // a morning of two tasks around lunch
    {
        std::string body =
            "{\"tasks\":[{\"id\":\"a\",\"name\":\"Write report\",\"duration_minutes\":120,\"priority\":1},"
            "{\"id\":\"b\",\"duration_minutes\":120,\"priority\":2}],"
            "\"horizon\":{\"start_date\":\"2026-03-02\",\"end_date\":\"2026-03-02\"},"
            "\"now\":\"2026-03-02T08:00:00Z\"}";
        auto res = post_json(port, "/schedule", body);
        expect(res, 200, "\"task_id\":\"a\",\"date\":\"2026-03-02\",\"start\":\"09:00\",\"end\":\"11:00\"", "schedule");
        expect(res, 200, "\"task_id\":\"b\",\"date\":\"2026-03-02\",\"start\":\"13:00\",\"end\":\"15:00\"", "schedule after lunch");
        expect(res, 200, "\"total_scheduled_minutes\":240", "schedule total");
    }

    {
        std::string body =
            "{\"tasks\":[{\"id\":\"big\",\"duration_minutes\":600}],"
            "\"horizon\":{\"start_date\":\"2026-03-02\",\"end_date\":\"2026-03-02\"},\"now\":\"2026-03-02T08:00:00Z\"}";
        expect(post_json(port, "/schedule", body), 200, "\"reason\":\"exceeds_day_window\"", "oversized task");
    }

    expect(post_json(port, "/schedule", "{\"tasks\":[{\"id\":\"a\",\"duration_minutes\":0}],"
                                       "\"horizon\":{\"start_date\":\"2026-03-02\",\"end_date\":\"2026-03-02\"}}"),
           400, "invalid_input", "zero duration");
    expect(post_json(port, "/schedule", "{\"tasks\":[}"), 400, "invalid_json", "malformed body");

    {
        std::string body = std::string("{\"slot\":") + kStandup + ",\"placements\":["
            "{\"task_id\":\"a\",\"date\":\"2026-03-02\",\"start\":\"09:30\",\"end\":\"10:30\"},"
            "{\"task_id\":\"b\",\"date\":\"2026-03-02\",\"start\":\"11:00\",\"end\":\"12:00\"}]}";
        auto res = post_json(port, "/conflicts", body);
        expect(res, 200, "\"task_id\":\"a\"", "conflicts");
        if (res.second.find("\"task_id\":\"b\"") != std::string::npos) fail("adjacent placement reported as conflict");
    }

    {
        std::string body = std::string("{\"placement\":{\"task_id\":\"a\",\"date\":\"2026-03-02\",\"start\":\"09:30\",\"end\":\"10:30\"},"
            "\"task\":{\"id\":\"a\",\"duration_minutes\":60},\"busy_slots\":[") + kStandup + "],"
            "\"now\":\"2026-03-02T09:15:00Z\"}";
        auto res = post_json(port, "/reschedules/propose", body);
        expect(res, 200, "\"proposed\":{\"task_id\":\"a\",\"date\":\"2026-03-02\",\"start\":\"11:00\",\"end\":\"12:00\"", "propose");
        expect(res, 200, "\"status\":\"pending\"", "propose status");
    }

    // plan routes need a repository
    expect(get(port, std::string("/plans/") + kPlan + "/reschedules"), 503, "repository_unavailable", "no repository");
    expect(post_json(port, std::string("/reschedules/") + kProposal + "/accept", ""), 503, "repository_unavailable", "accept without repository");
    expect(get(db_port, "/plans/not-a-uuid/reschedules"), 400, "invalid_input", "plan id");
    expect(get(db_port, std::string("/plans/") + kPlan + "/reschedules?status=maybe"), 400, "unknown status", "status filter");

    {
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "task_id,date,start_time,end_time,duration_minutes,day_index,is_detached",
                               "t1,2026-03-02,10:00,11:00,60,0,f", "");
        std::string row = std::string(kProposal) +
            ",t1,2026-03-02,10:00,11:00,0,2026-03-02,11:00,12:00,0,60,95.0000,1.0000,1.4286,moved,pending,2026-03-02T09:15:00Z,<NULL>";
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "",
            "id,task_id,original_date,original_start,original_end,original_day_index,"
            "proposed_date,proposed_start,proposed_end,proposed_day_index,duration_minutes,"
            "context_score,priority_penalty,density_penalty,reason,status,created_at,reviewed_at", row.c_str(), "");
        std::string body = std::string("{\"task\":{\"id\":\"t1\",\"duration_minutes\":60},\"busy_slots\":[") + kStandup + "],"
            "\"now\":\"2026-03-02T09:15:00Z\"}";
        auto res = post_json(db_port, std::string("/plans/") + kPlan + "/reschedules", body);
        expect(res, 201, std::string("\"id\":\"") + kProposal + "\"", "stored proposal");
        if (fake_pg_last_nparams() != 17 || std::string(fake_pg_last_param(8)) != "11:00") fail("computed slot not stored");
    }

    {
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "task_id,date,start_time,end_time,duration_minutes,day_index,is_detached", "", "");
        std::string body = "{\"task\":{\"id\":\"ghost\",\"duration_minutes\":60}}";
        expect(post_json(db_port, std::string("/plans/") + kPlan + "/reschedules", body), 400, "no committed placement", "task without placement");
    }

    // overdue sweep: one move stored, one task already pending, one rejected by the unique index
    {
        const std::string overdue = std::string("/plans/") + kPlan + "/reschedules/overdue";
        expect(get(db_port, overdue), 405, "method_not_allowed", "GET overdue");
        expect(post_json(port, overdue, ""), 503, "repository_unavailable", "overdue without repository");

        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "task_id,date,start_time,end_time,duration_minutes,day_index,is_detached",
                               "pend,2026-02-27,14:00,15:00,60,0,f;late,2026-03-02,09:00,10:00,60,0,f;"
                               "also,2026-03-02,10:00,11:00,60,0,f;next,2026-03-02,15:00,16:00,60,0,f", "");
        const char* cols =
            "id,task_id,original_date,original_start,original_end,original_day_index,"
            "proposed_date,proposed_start,proposed_end,proposed_day_index,duration_minutes,"
            "context_score,priority_penalty,density_penalty,reason,status,created_at,reviewed_at";
        std::string waiting = std::string(kProposal) +
            ",pend,2026-02-27,14:00,15:00,0,2026-03-02,13:00,14:00,0,60,0,0,0,overdue,pending,2026-03-02T08:00:00Z,<NULL>";
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", cols, waiting.c_str(), "");
        std::string moved = "3d2c1b0a-9f8e-4d7c-8b6a-5f4e3d2c1b0a"
            ",late,2026-03-02,09:00,10:00,0,2026-03-02,14:00,15:00,0,60,89.5714,5.0000,1.4286,overdue,pending,2026-03-02T11:15:00Z,<NULL>";
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", cols, moved.c_str(), "");
        fake_pg_queue_response(PGRES_FATAL_ERROR, "duplicate key value violates unique constraint", "23505", "", "", "");

        auto res = post_json(db_port, overdue, "{\"now\":\"2026-03-02T11:15:00Z\"}");
        expect(res, 200, "\"task_id\":\"late\"", "overdue proposal stored");
        expect(res, 200, "\"skipped\":[{\"task_id\":\"pend\",\"reason\":\"pending_proposal\"},{\"task_id\":\"also\",\"reason\":\"pending_proposal\"}]", "overdue skips");
        if (std::string(fake_pg_last_param(8)) != "16:00") fail("second overdue move should avoid the first, got " + std::string(fake_pg_last_param(8)));
    }

    {
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "pending,accepted", "");
        expect(post_json(db_port, std::string("/reschedules/") + kProposal + "/accept", ""), 200, "\"status\":\"accepted\"", "accept");
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "pending,expired", "");
        expect(post_json(db_port, std::string("/reschedules/") + kProposal + "/accept", ""), 409, "proposal_stale", "stale accept");
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "", "");
        expect(post_json(db_port, std::string("/reschedules/") + kProposal + "/reject", ""), 404, "not_found", "reject unknown");
        expect(post_json(db_port, "/reschedules/nope/reject", ""), 404, "not_found", "reject malformed id");
    }

    {
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "pending,accepted", "");
        std::string body = std::string("{\"ids\":[\"") + kProposal + "\",\"bogus\"]}";
        auto res = post_json(db_port, "/reschedules/accept", body);
        expect(res, 200, std::string("\"accepted\":[\"") + kProposal + "\"]", "batch accepted");
        expect(res, 200, "{\"id\":\"bogus\",\"error\":\"not_found\"}", "batch errors");
    }

    // a failed statement mid-batch is reported for that id and the rest still run
    {
        const std::string first = "1b4e28ba-2fa1-41d2-883f-0016d3cca427";
        const std::string middle = "6fa459ea-ee8a-4ca4-894e-db77e160355e";
        const std::string last = "9a7b330a-a736-41e5-8f2e-b3c6b8b3e6e1";
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "pending,accepted", "");
        fake_pg_queue_response(PGRES_FATAL_ERROR, "canceling statement due to statement timeout", "57014", "", "", "");
        fake_pg_queue_response(PGRES_TUPLES_OK, "", "", "previous_status,new_status", "pending,accepted", "");
        std::string body = "{\"ids\":[\"" + first + "\",\"" + middle + "\",\"" + last + "\"]}";
        auto res = post_json(db_port, "/reschedules/accept", body);
        expect(res, 200, "\"accepted\":[\"" + first + "\",\"" + last + "\"]", "batch keeps going after a failure");
        expect(res, 200, "{\"id\":\"" + middle + "\",\"error\":\"repository_unavailable\"}", "failed id reported");
    }

    expect(raw_request(port, "POST /schedule HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\nContent-Length: 2000000\r\n\r\n"),
           413, "body_too_large", "oversized body");

    app.stop();
    cpu_pool->join();
    std::cout << "http_planner_unit ok" << std::endl;
    return 0;
}
