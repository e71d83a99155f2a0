#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {


struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;

    // Index of a named column, or -1.
    int column(const std::string& name) const;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;


// Fixed set of worker threads, each owning one libpq connection. Statements
// run on the workers; callbacks are posted to the application io_context.
// A dropped connection is reopened once per statement before the error is
// reported.
class DbPool {
public:

    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4);
    ~DbPool();


    void async_exec(const std::string& sql, DbResultCb cb);

    // Text-format parameters; std::nullopt is sent as SQL NULL.
    void async_exec_params(const std::string& sql, std::vector<std::optional<std::string>> params, DbResultCb cb);


    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
