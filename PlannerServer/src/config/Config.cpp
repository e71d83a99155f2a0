#include "Config.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

// Unparseable or out-of-range text keeps the default.
static int parse_int_or(const std::string& s, int def) {
    if (s.empty()) return def;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0' || v < -2147483647L || v > 2147483647L) return def;
    return static_cast<int>(v);
}

static int env_int_or(const char* name, int def) {
    const char* v = std::getenv(name);
    return v ? parse_int_or(v, def) : def;
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static uint16_t parse_port_or(const std::string& s, uint16_t def) {
    int p = parse_int_or(s, -1);
    if (p < 0 || p > 65535) return def;
    return static_cast<uint16_t>(p);
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    c.port = parse_port_or(getenv_or("PORT", "8080"), c.port);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i + 1 < argc) c.port = parse_port_or(argv[i + 1], c.port);
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "");
    c.db_workers = std::clamp(env_int_or("DB_WORKERS", 16), 1, 256);
    c.cpu_workers = std::max(0, env_int_or("CPU_WORKERS", 0));

    c.default_workday_start_hour = env_int_or("DEFAULT_WORKDAY_START_HOUR", 9);
    c.default_workday_end_hour = env_int_or("DEFAULT_WORKDAY_END_HOUR", 17);
    c.default_lunch_start_hour = env_int_or("DEFAULT_LUNCH_START_HOUR", 12);
    c.default_lunch_end_hour = env_int_or("DEFAULT_LUNCH_END_HOUR", 13);
    c.reschedule_window_days = std::clamp(env_int_or("RESCHEDULE_WINDOW_DAYS", 7), 1, 366);
    return c;
}

scheduling::SchedulerOptions Config::scheduler_defaults() const {
    scheduling::SchedulerOptions o;
    o.workday_start_hour = default_workday_start_hour;
    o.workday_end_hour = default_workday_end_hour;
    o.lunch_start_hour = default_lunch_start_hour;
    o.lunch_end_hour = default_lunch_end_hour;
    return o;
}

int Config::log_level_number() const {
    switch (log_level) {
        case LogLevel::DEBUG: return 1;
        case LogLevel::INFO: return 2;
        case LogLevel::WARN: return 3;
        case LogLevel::ERROR: return 4;
    }
    return 2;
}

}
