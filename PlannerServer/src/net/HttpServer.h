#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include "../db/DbPool.h"
#include "../db/RescheduleRepository.h"
#include "../scheduling/Types.h"
#include <memory>
#include <string>

class HttpServer {
public:
    // Port 0 binds an ephemeral port; see local_port().
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::shared_ptr<db::DbPool> db, std::shared_ptr<db::RescheduleRepository> repo,
               std::shared_ptr<boost::asio::thread_pool> cpu_pool,
               const scheduling::SchedulerOptions& scheduler_defaults, int reschedule_window_days);
    void run();
    unsigned short local_port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<db::DbPool> db_;
    std::shared_ptr<db::RescheduleRepository> repo_;
    std::shared_ptr<boost::asio::thread_pool> cpu_pool_;
    scheduling::SchedulerOptions scheduler_defaults_;
    int reschedule_window_days_ = 7;
};
