#include "DbPool.h"
#include <cstdlib>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace db {

int DbResult::column(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) if (columns[i] == name) return int(i);
    return -1;
}

static DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = ct ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("dbpool.exec_result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 2;

    struct Task { std::function<void(PGconn*&)> fn; };
    std::queue<Task> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_)
        : app_ioc(ioc), conninfo(ci), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            PQfinish(c);
            return nullptr;
        }
        return c;
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_info("dbpool.worker_started", {{"local_conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    if (local_conn) { PQfinish(local_conn); local_conn = nullptr; }
                    return;
                }
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn(local_conn);
            } catch (const std::exception& e) {
                observability::log_error(std::string("db task exception: ") + e.what());
            }
        }
    }

    void post_task(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }

    // Runs `exec` on the worker's connection with one reconnect attempt and
    // posts the converted result to the application io_context.
    void run(std::function<PGresult*(PGconn*)> exec, DbResultCb cb) {
        post_task([this, exec = std::move(exec), cb = std::move(cb)](PGconn*& local_conn) mutable {
            boost::system::error_code ec;
            PGresult* res = nullptr;
            for (int attempt = 0; attempt < 2; ++attempt) {
                if (!local_conn) {
                    local_conn = connect_one();
                    if (!local_conn) { ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable); break; }
                }
                res = exec(local_conn);
                if (!res) {
                    PQfinish(local_conn); local_conn = nullptr;
                    ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                    continue;
                }
                ec.clear();
                break;
            }
            DbResult r;
            if (res) {
                r = to_db_result(res);
                PQclear(res);
            } else {
                observability::log_warn("dbpool.exec_null", {{"err", ec.message()}});
            }
            boost::asio::post(app_ioc, [cb = std::move(cb), ec, r = std::move(r)]() mutable { cb(ec, std::move(r)); });
        });
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers);
}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    impl_->run([sql](PGconn* c) { return PQexec(c, sql.c_str()); }, std::move(cb));
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::optional<std::string>> params, DbResultCb cb) {
    impl_->run([sql, params = std::move(params)](PGconn* c) {
        std::vector<const char*> cparams; cparams.reserve(params.size());
        for (const auto& p : params) cparams.push_back(p ? p->c_str() : nullptr);
        return PQexecParams(c, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
    }, std::move(cb));
}

void DbPool::async_scalar_int(const std::string& sql, ScalarIntCb cb) {
    async_exec(sql, [cb](const boost::system::error_code& ec, const DbResult& r) {
        if (ec) { cb(ec, 0); return; }
        if (!r.ok || r.rows.empty() || r.rows[0].empty()) { cb(boost::asio::error::operation_aborted, 0); return; }
        auto val = json_parse_int32_strict(r.rows[0][0]);
        if (!val) { cb(boost::asio::error::invalid_argument, 0); return; }
        cb({}, *val);
    });
}

}
