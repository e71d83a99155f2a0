#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <memory>
#include <thread>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "db/RescheduleRepository.h"
#include "scheduling/WorkWindow.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(cfg.log_level_number());

    const auto defaults = cfg.scheduler_defaults();
    try {
        scheduling::validate_options(defaults);
    } catch (const scheduling::ConfigurationError& e) {
        std::cerr << "fatal: invalid default work hours: " << e.what() << "\n";
        return 2;
    }

    try {
        boost::asio::io_context io;

        Router router;

        router.add_route("GET", "/health", [](const Request& req) {
            Response res{boost::beast::http::status::ok, req.version()};
            res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
            res.keep_alive(req.keep_alive());
            res.body() = "{\"status\":\"ok\"}";
            res.prepare_payload();
            return res;
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        std::shared_ptr<db::DbPool> dbpool;
        std::shared_ptr<db::RescheduleRepository> repo;
        if (!cfg.database_url.empty()) {
            dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
            repo = std::make_shared<db::RescheduleRepository>(dbpool);
        } else {
            log_warn("db_not_configured", {});
        }

        unsigned cpu_workers = cfg.cpu_workers > 0 ? unsigned(cfg.cpu_workers) : std::max(1u, std::thread::hardware_concurrency());
        auto cpu_pool = std::make_shared<boost::asio::thread_pool>(cpu_workers);

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log, dbpool, repo, cpu_pool, defaults, cfg.reschedule_window_days);
        log_info("server_start", {{"port", int64_t(server.local_port())}, {"cpu_workers", int64_t(cpu_workers)}, {"db", std::string(dbpool ? "on" : "off")}});
        server.run();
        io.run();
        cpu_pool->join();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
