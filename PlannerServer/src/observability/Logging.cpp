#include "Logging.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace observability {

static std::atomic<int> g_level{kInfo};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level = level; }

bool log_enabled(int level) { return level >= g_level.load(); }

static const char* level_name(int level) {
    switch (level) {
        case kDebug: return "DEBUG";
        case kWarn: return "WARN";
        case kError: return "ERROR";
        default: return "INFO";
    }
}

static void append_escaped(std::string& out, const std::string& s) {
    for (unsigned char c : s) {
        if (c == '"' || c == '\\') { out.push_back('\\'); out.push_back(static_cast<char>(c)); }
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", c);
            out += buf;
        } else out.push_back(static_cast<char>(c));
    }
}

struct FieldWriter {
    std::string& out;
    void operator()(const std::string& s) const { out.push_back('"'); append_escaped(out, s); out.push_back('"'); }
    void operator()(int64_t v) const { out += std::to_string(v); }
    void operator()(double v) const {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.3f", v);
        out += buf;
    }
};

static void write_line(int level, const std::string& msg, const Fields& fields) {
    if (!log_enabled(level)) return;
    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string line = "{\"ts\":" + std::to_string(static_cast<int64_t>(ts));
    line += ",\"level\":\"";
    line += level_name(level);
    line += "\",\"msg\":\"";
    append_escaped(line, msg);
    line.push_back('"');
    for (const auto& f : fields) {
        line += ",\"";
        append_escaped(line, f.first);
        line += "\":";
        std::visit(FieldWriter{line}, f.second);
    }
    line += "}\n";
    std::lock_guard<std::mutex> lock(g_out_mu);
    std::cout << line << std::flush;
}

void log_debug(const std::string& msg, const Fields& fields) { write_line(kDebug, msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { write_line(kInfo, msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { write_line(kWarn, msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { write_line(kError, msg, fields); }

}
