#pragma once

#include <cstdint>
#include <string>
#include "../scheduling/Types.h"

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 16;
    int cpu_workers = 0;
    int default_workday_start_hour = 9;
    int default_workday_end_hour = 17;
    int default_lunch_start_hour = 12;
    int default_lunch_end_hour = 13;
    int reschedule_window_days = 7;

    static Config from_env(int argc, char** argv);
    // Options a request starts from before applying its own work_hours.
    scheduling::SchedulerOptions scheduler_defaults() const;
    int log_level_number() const;
};

}
