#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "MiniJson.h"
#include "../observability/Metrics.h"
#include "../observability/Logging.h"
#include "../scheduling/CivilTime.h"
#include "../scheduling/ConflictDetector.h"
#include "../scheduling/PlanCodec.h"
#include "../scheduling/ProposalLedger.h"
#include "../scheduling/RescheduleEngine.h"
#include "../scheduling/TimeBlockScheduler.h"
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <optional>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            auto hex = [&](char h)->int {
                if (h >= '0' && h <= '9') return h - '0';
                if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
                if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
                return -1;
            };
            int hi = hex(s[i+1]); int lo = hex(s[i+2]); if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

static std::optional<std::string> query_param(std::string_view target, std::string_view key) {
    auto q = target.find('?');
    if (q == std::string_view::npos) return std::nullopt;
    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        auto eq = pair.find('=');
        if (url_decode(pair.substr(0, eq)) == key) {
            return eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        rest = rest.substr(amp + 1);
    }
    return std::nullopt;
}

static bool is_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { if (s[i] != '-') return false; continue; }
        if (!isxdigit((unsigned char)s[i])) return false;
    }
    return true;
}

static std::string error_json(const std::string& code, const std::string& message = std::string()) {
    std::string out = "{\"error\":\"" + json_escape_resp(code) + "\"";
    if (!message.empty()) out += ",\"message\":\"" + json_escape_resp(message) + "\"";
    return out + "}";
}

static http::status decision_status(scheduling::DecisionError e) {
    switch (e) {
        case scheduling::DecisionError::None: return http::status::ok;
        case scheduling::DecisionError::NotFound: return http::status::not_found;
        case scheduling::DecisionError::NotPending:
        case scheduling::DecisionError::Stale:
        case scheduling::DecisionError::DuplicatePending: return http::status::conflict;
        case scheduling::DecisionError::RepositoryUnavailable: return http::status::service_unavailable;
    }
    return http::status::internal_server_error;
}

struct BatchState {
    std::vector<std::string> ids;
    size_t next = 0;
    scheduling::BatchDecision out;
};

struct OverdueState {
    std::string plan_id;
    scheduling::OverdueRun computed;
    scheduling::OverdueRun stored;
    size_t next = 0;
};

struct Reply {
    http::status status = http::status::ok;
    std::string body;
};

// Maps what the codec and engine throw onto JSON error replies.
template <typename Work>
static Reply guarded(const std::string& route, Work&& work) {
    try {
        return work();
    } catch (const scheduling::ConfigurationError& e) {
        return {http::status::bad_request, error_json("invalid_input", e.what())};
    } catch (const std::runtime_error& e) {
        return {http::status::bad_request, error_json("invalid_json", e.what())};
    } catch (const std::exception& e) {
        observability::log_error("handler_exception", {{"path", route}, {"err", std::string(e.what())}});
        return {http::status::internal_server_error, error_json("internal")};
    }
}

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<db::DbPool> db;
    std::shared_ptr<db::RescheduleRepository> repo;
    std::shared_ptr<boost::asio::thread_pool> cpu_pool;
    scheduling::SchedulerOptions scheduler_defaults;
    int reschedule_window_days = 7;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::shared_ptr<db::DbPool> dbp, std::shared_ptr<db::RescheduleRepository> rp)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al), db(std::move(dbp)), repo(std::move(rp)) {}
    void run() { do_read(); }
    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        start_ts = std::chrono::steady_clock::now();

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(1 * 1024 * 1024);

        self->read_timer.expires_after(std::chrono::seconds(5));
        self->read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored_cancel; self->read_timer.cancel(ignored_cancel);

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, error_json("header_too_large"), true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, error_json("bad_request"), true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();
            std::size_t content_len = 0;
            auto it = hdr_req.find(http::field::content_length);
            if (it != hdr_req.end()) {
                auto parsed = parse_int64_strict_sv(std::string_view(it->value().data(), it->value().size()));
                content_len = (parsed && *parsed > 0) ? std::size_t(*parsed) : 0;
            }

            const std::size_t MAX_PARSER_BODY = 1 * 1024 * 1024;
            if (content_len > MAX_PARSER_BODY) {
                observability::log_info("oversized_body_header", {{"path", std::string("(header)")}, {"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, error_json("body_too_large"), true, "(body)");
                return;
            }

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored_cancel2; self->read_timer.cancel(ignored_cancel2);

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, error_json("payload_too_large"), true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }

                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    std::shared_ptr<Response> make_json(http::status st, std::string body) {
        auto res = std::make_shared<Response>(st, req.version());
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->keep_alive(req.keep_alive());
        res->body() = std::move(body);
        res->prepare_payload();
        return res;
    }

    void reply(const Reply& r, const std::string& route) { send_response(make_json(r.status, r.body), route); }

    // Runs `work` on the CPU pool and writes its reply from the socket's executor.
    template <typename Work>
    void run_compute(const std::string& route, Work work) {
        auto self = shared_from_this();
        auto job = [self, route, work = std::move(work)]() mutable {
            Reply r = guarded(route, work);
            net::post(self->socket.get_executor(), [self, route, r]() { self->reply(r, route); });
        };
        if (cpu_pool) net::post(*cpu_pool, std::move(job));
        else net::post(socket.get_executor(), std::move(job));
    }

    void handle_request() {
        std::string target = std::string(req.target());
        std::string path = target.substr(0, target.find('?'));
        const std::string method = std::string(req.method_string());
        auto self = shared_from_this();

        if (path == "/db/health") {
            if (!db) {
                reply({http::status::internal_server_error, "{\"db\":\"down\"}"}, path);
                return;
            }
            db->async_scalar_int("SELECT 1", [self, path](const boost::system::error_code& ec, int v) {
                if (ec || v != 1) self->reply({http::status::internal_server_error, "{\"db\":\"down\"}"}, path);
                else self->reply({http::status::ok, "{\"db\":\"ok\"}"}, path);
            });
            return;
        }

        if (path == "/schedule" || path == "/conflicts" || path == "/reschedules/propose") {
            if (method != "POST") { reply({http::status::method_not_allowed, error_json("method_not_allowed")}, path); return; }
            handle_compute(path);
            return;
        }

        Router::Params params;
        if (Router::match_pattern("/plans/:plan_id/reschedules/overdue", path, params)) {
            const std::string route = "/plans/:plan_id/reschedules/overdue";
            const std::string& plan_id = params["plan_id"];
            if (method != "POST") { reply({http::status::method_not_allowed, error_json("method_not_allowed")}, route); return; }
            if (!is_uuid(plan_id)) { reply({http::status::bad_request, error_json("invalid_input", "plan_id must be a uuid")}, route); return; }
            if (!repo) { reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            sweep_overdue(plan_id, route);
            return;
        }
        if (Router::match_pattern("/plans/:plan_id/reschedules", path, params)) {
            const std::string route = "/plans/:plan_id/reschedules";
            const std::string& plan_id = params["plan_id"];
            if (method != "GET" && method != "POST") { reply({http::status::method_not_allowed, error_json("method_not_allowed")}, route); return; }
            if (!is_uuid(plan_id)) { reply({http::status::bad_request, error_json("invalid_input", "plan_id must be a uuid")}, route); return; }
            if (!repo) { reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            if (method == "GET") list_proposals(plan_id, target, route);
            else create_proposal(plan_id, route);
            return;
        }
        if (path == "/reschedules/accept") {
            const std::string route = path;
            if (method != "POST") { reply({http::status::method_not_allowed, error_json("method_not_allowed")}, route); return; }
            if (!repo) { reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            accept_batch(route);
            return;
        }
        for (const char* action : {"accept", "reject"}) {
            const std::string route = std::string("/reschedules/:id/") + action;
            if (!Router::match_pattern(route, path, params)) continue;
            if (method != "POST") { reply({http::status::method_not_allowed, error_json("method_not_allowed")}, route); return; }
            if (!repo) { reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            if (!is_uuid(params["id"])) { reply({http::status::not_found, error_json("not_found")}, route); return; }
            decide(params["id"], std::string(action) == "accept", route);
            return;
        }

        auto res = std::make_shared<Response>(router.route(req));
        send_response(res, path);
    }

    void handle_compute(const std::string& path) {
        std::string body = req.body();
        const auto defaults = scheduler_defaults;
        const int window_days = reschedule_window_days;
        const std::time_t now = std::time(nullptr);
        if (path == "/schedule") {
            run_compute(path, [body, defaults, now]() -> Reply {
                auto in = scheduling::parse_schedule_request(body, defaults, now);
                auto result = scheduling::schedule(in.tasks, in.horizon, in.options, in.availability, in.existing, in.now);
                auto& m = observability::Metrics::instance();
                m.inc_counter("scheduler_runs_total");
                m.inc_counter("scheduler_tasks_placed_total", "", result.placements.size());
                m.inc_counter("scheduler_tasks_unplaced_total", "", result.unplaced.size());
                return {http::status::ok, scheduling::schedule_result_json(result)};
            });
        } else if (path == "/conflicts") {
            run_compute(path, [body]() -> Reply {
                auto in = scheduling::parse_conflict_request(body);
                auto hits = in.slot ? scheduling::detect_conflicts(*in.slot, in.placements)
                                    : scheduling::detect_conflicts_all(in.availability, in.placements);
                return {http::status::ok, "{\"conflicts\":" + scheduling::placements_json(hits) + "}"};
            });
        } else {
            run_compute(path, [body, defaults, window_days, now]() -> Reply {
                auto in = scheduling::parse_propose_request(body, defaults, window_days, now);
                auto p = scheduling::propose(in.conflicted, in.task, in.availability, in.others, in.horizon, in.options, in.now);
                observability::Metrics::instance().inc_counter("reschedule_proposals_total", p ? "proposed" : "no_feasible");
                return {http::status::ok, std::string("{\"proposal\":") + (p ? scheduling::proposal_json(*p) : "null") + "}"};
            });
        }
    }

    void list_proposals(const std::string& plan_id, const std::string& target, const std::string& route) {
        std::optional<scheduling::ProposalStatus> status;
        if (auto s = query_param(target, "status")) {
            status = scheduling::proposal_status_from_string(*s);
            if (!status) { reply({http::status::bad_request, error_json("invalid_input", "unknown status: " + *s)}, route); return; }
        }
        auto self = shared_from_this();
        repo->async_list_proposals(plan_id, status, [self, route](const boost::system::error_code& ec, std::vector<scheduling::RescheduleProposal> ps) {
            if (ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            self->reply({http::status::ok, "{\"proposals\":" + scheduling::proposals_json(ps) + "}"}, route);
        });
    }

    // Loads the plan's committed placements, computes a proposal for the
    // task named in the body and stores it as pending.
    void create_proposal(const std::string& plan_id, const std::string& route) {
        auto self = shared_from_this();
        repo->async_list_placements(plan_id, [self, plan_id, route](const boost::system::error_code& ec, std::vector<scheduling::Placement> snapshot) {
            if (ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            auto proposal = std::make_shared<std::optional<scheduling::RescheduleProposal>>();
            std::string body = self->req.body();
            const auto defaults = self->scheduler_defaults;
            const int window_days = self->reschedule_window_days;
            const std::time_t now = std::time(nullptr);
            auto job = [self, plan_id, route, proposal, body, snapshot = std::move(snapshot), defaults, window_days, now]() {
                Reply r = guarded(route, [&]() -> Reply {
                    auto in = scheduling::parse_plan_propose_request(body, snapshot, defaults, window_days, now);
                    *proposal = scheduling::propose(in.conflicted, in.task, in.availability, in.others, in.horizon, in.options, in.now);
                    if (!*proposal) {
                        observability::Metrics::instance().inc_counter("reschedule_proposals_total", "no_feasible");
                        return {http::status::ok, "{\"proposal\":null}"};
                    }
                    return {http::status::created, std::string()};
                });
                net::post(self->socket.get_executor(), [self, plan_id, route, proposal, r]() {
                    if (r.status != http::status::created) { self->reply(r, route); return; }
                    self->store_proposal(plan_id, **proposal, route);
                });
            };
            if (self->cpu_pool) net::post(*self->cpu_pool, std::move(job));
            else net::post(self->socket.get_executor(), std::move(job));
        });
    }

    void store_proposal(const std::string& plan_id, const scheduling::RescheduleProposal& p, const std::string& route) {
        auto self = shared_from_this();
        repo->async_insert_proposal(plan_id, p, [self, route](const boost::system::error_code& ec, scheduling::DecisionResult d, std::optional<scheduling::RescheduleProposal> stored) {
            if (ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            if (!d.ok() || !stored) { self->reply({decision_status(d.error), error_json(scheduling::to_string(d.error))}, route); return; }
            observability::Metrics::instance().inc_counter("reschedule_proposals_total", "proposed");
            self->reply({http::status::created, "{\"proposal\":" + scheduling::proposal_json(*stored) + "}"}, route);
        });
    }

    // Proposes a new slot for every overdue task of the plan and stores each
    // proposal as pending. Tasks that already have one are skipped.
    void sweep_overdue(const std::string& plan_id, const std::string& route) {
        auto self = shared_from_this();
        repo->async_list_placements(plan_id, [self, plan_id, route](const boost::system::error_code& ec, std::vector<scheduling::Placement> snapshot) {
            if (ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            self->repo->async_list_proposals(plan_id, scheduling::ProposalStatus::Pending,
                [self, plan_id, route, snapshot = std::move(snapshot)](const boost::system::error_code& list_ec, std::vector<scheduling::RescheduleProposal> pending) {
                if (list_ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
                auto st = std::make_shared<OverdueState>();
                st->plan_id = plan_id;
                std::string body = self->req.body();
                const auto defaults = self->scheduler_defaults;
                const int window_days = self->reschedule_window_days;
                const std::time_t now = std::time(nullptr);
                auto job = [self, route, st, body, snapshot, pending = std::move(pending), defaults, window_days, now]() {
                    Reply r = guarded(route, [&]() -> Reply {
                        auto in = scheduling::parse_overdue_request(body, defaults, window_days, now);
                        st->computed = scheduling::propose_overdue(snapshot, in.tasks, pending, in.availability, in.horizon, in.options, in.now);
                        return {http::status::ok, std::string()};
                    });
                    net::post(self->socket.get_executor(), [self, route, st, r]() {
                        if (r.status != http::status::ok) { self->reply(r, route); return; }
                        auto& m = observability::Metrics::instance();
                        for (const auto& s : st->computed.skipped) {
                            if (s.reason == scheduling::OverdueSkipReason::NoFeasibleSlot) m.inc_counter("reschedule_proposals_total", "no_feasible");
                        }
                        st->stored.skipped = st->computed.skipped;
                        self->store_overdue_next(st, route);
                    });
                };
                if (self->cpu_pool) net::post(*self->cpu_pool, std::move(job));
                else net::post(self->socket.get_executor(), std::move(job));
            });
        });
    }

    void store_overdue_next(std::shared_ptr<OverdueState> st, const std::string& route) {
        if (st->next == st->computed.proposals.size()) {
            reply({http::status::ok, scheduling::overdue_run_json(st->stored)}, route);
            return;
        }
        const scheduling::RescheduleProposal& p = st->computed.proposals[st->next++];
        auto self = shared_from_this();
        repo->async_insert_proposal(st->plan_id, p, [self, st, route, task_id = p.task_id](const boost::system::error_code& ec, scheduling::DecisionResult d, std::optional<scheduling::RescheduleProposal> stored) {
            if (ec) {
                observability::log_warn("overdue_store_failed", {{"task_id", task_id}, {"err", ec.message()}});
                st->stored.skipped.push_back(scheduling::OverdueSkip{task_id, scheduling::OverdueSkipReason::RepositoryUnavailable});
            } else if (d.ok() && stored) {
                observability::Metrics::instance().inc_counter("reschedule_proposals_total", "proposed");
                st->stored.proposals.push_back(std::move(*stored));
            } else {
                st->stored.skipped.push_back(scheduling::OverdueSkip{task_id, scheduling::OverdueSkipReason::PendingProposal});
            }
            self->store_overdue_next(st, route);
        });
    }

    void decide(const std::string& id, bool accept, const std::string& route) {
        auto self = shared_from_this();
        auto done = [self, accept, route](const boost::system::error_code& ec, scheduling::DecisionResult d) {
            if (ec) { self->reply({http::status::service_unavailable, error_json("repository_unavailable")}, route); return; }
            auto& m = observability::Metrics::instance();
            if (d.error == scheduling::DecisionError::Stale) m.inc_counter("reschedule_proposals_total", "stale");
            if (!d.ok()) { self->reply({decision_status(d.error), error_json(scheduling::to_string(d.error))}, route); return; }
            m.inc_counter("reschedule_proposals_total", accept ? "accepted" : "rejected");
            self->reply({http::status::ok, "{\"id\":\"" + json_escape_resp(d.proposal_id) + "\",\"status\":\"" + (accept ? "accepted" : "rejected") + "\"}"}, route);
        };
        if (accept) repo->async_accept_proposal(id, done);
        else repo->async_reject_proposal(id, done);
    }

    // Accepts each id in order; one failure does not stop the rest.
    void accept_batch(const std::string& route) {
        auto batch = std::make_shared<BatchState>();
        Reply bad = guarded(route, [&]() -> Reply {
            batch->ids = json_extract_string_array(req.body(), "ids");
            return {http::status::ok, std::string()};
        });
        if (bad.status != http::status::ok) { reply(bad, route); return; }
        accept_next(batch, route);
    }

    void accept_next(std::shared_ptr<BatchState> batch, const std::string& route) {
        if (batch->next == batch->ids.size()) {
            std::string body = "{\"accepted\":[";
            for (size_t i = 0; i < batch->out.accepted.size(); ++i) {
                if (i) body += ',';
                body += "\"" + json_escape_resp(batch->out.accepted[i]) + "\"";
            }
            body += "],\"errors\":[";
            for (size_t i = 0; i < batch->out.errors.size(); ++i) {
                const auto& e = batch->out.errors[i];
                if (i) body += ',';
                body += "{\"id\":\"" + json_escape_resp(e.proposal_id) + "\",\"error\":\"" + scheduling::to_string(e.error) + "\"}";
            }
            body += "]}";
            reply({http::status::ok, body}, route);
            return;
        }
        const std::string id = batch->ids[batch->next++];
        auto self = shared_from_this();
        auto record = [self, batch, route](const boost::system::error_code& ec, scheduling::DecisionResult d) {
            auto& m = observability::Metrics::instance();
            if (ec) {
                // The rest of the batch still runs; this id is reported as failed.
                observability::log_warn("batch_accept_failed", {{"proposal_id", d.proposal_id}, {"err", ec.message()}});
                d.error = scheduling::DecisionError::RepositoryUnavailable;
            }
            if (d.ok()) {
                m.inc_counter("reschedule_proposals_total", "accepted");
                batch->out.accepted.push_back(d.proposal_id);
            } else {
                if (d.error == scheduling::DecisionError::Stale) m.inc_counter("reschedule_proposals_total", "stale");
                batch->out.errors.push_back(std::move(d));
            }
            self->accept_next(batch, route);
        };
        if (!is_uuid(id)) {
            scheduling::DecisionResult d;
            d.proposal_id = id;
            d.error = scheduling::DecisionError::NotFound;
            record({}, d);
            return;
        }
        repo->async_accept_proposal(id, record);
    }

    void send_response(std::shared_ptr<Response> res, const std::string& route) {
        auto self = shared_from_this();
        if (res->find(http::field::connection) == res->end()) res->keep_alive(req.keep_alive());

        const int code = static_cast<int>(res->result_int());
        const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        const std::string method = std::string(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().inc(route, method, code);
            observability::Metrics::instance().observe_latency(route, method, ms);
        }
        if (access_log) {
            observability::log_info("access", {{"method", method}, {"path", route}, {"status", int64_t(code)}, {"ms", ms}});
        }

        http::async_write(socket, *res, [self, res, route](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", route}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& route) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (close_conn) {
            res->set(http::field::connection, "close");
            http::async_write(socket, *res, [self = shared_from_this(), res, route](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    observability::log_warn("write_error", {{"path", route}, {"err", int64_t(ec.value())}});
                    self->close_socket();
                    return;
                }
                self->graceful_close_after_write();
            });
        } else {
            send_response(res, route);
        }
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::shared_ptr<db::DbPool> db, std::shared_ptr<db::RescheduleRepository> repo,
                       std::shared_ptr<boost::asio::thread_pool> cpu_pool,
                       const scheduling::SchedulerOptions& scheduler_defaults, int reschedule_window_days)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log),
      db_(std::move(db)), repo_(std::move(repo)), cpu_pool_(std::move(cpu_pool)), scheduler_defaults_(scheduler_defaults), reschedule_window_days_(reschedule_window_days) {}

void HttpServer::run() { do_accept(); }

unsigned short HttpServer::local_port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, db_, repo_);
            s->cpu_pool = cpu_pool_;
            s->scheduler_defaults = scheduler_defaults_;
            s->reschedule_window_days = reschedule_window_days_;
            s->run();
        } else observability::log_warn("accept error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
