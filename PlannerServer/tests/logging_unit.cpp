#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include "../src/observability/Logging.h"
#include "../src/scheduling/CivilTime.h"
#include "../src/scheduling/TimeBlockScheduler.h"

using namespace observability;

static bool is_json_line(const std::string& s) {
    if (s.empty()) return false;

    return s.front() == '{' && s.back() == '}' && s.find("\"level\"") != std::string::npos && s.find("\"msg\"") != std::string::npos;
}

// Runs `body` with stdout redirected to `path` and returns what it wrote.
template <typename F>
static bool capture(const char* path, F body, std::string& out) {
    std::fflush(stdout);
    int saved = dup(fileno(stdout));
    if (saved == -1) { std::cerr << "dup failed\n"; return false; }
    FILE* f = freopen(path, "w+", stdout);
    if (!f) { std::cerr << "freopen failed\n"; return false; }
    body();
    std::fflush(stdout);
    std::cout.flush();
    if (dup2(saved, fileno(stdout)) == -1) { std::cerr << "dup2 restore failed\n"; return false; }
    close(saved);
    std::ifstream ifs(path);
    if (!ifs) { std::cerr << "open " << path << " failed\n"; return false; }
    out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return true;
}

int main() {

    set_log_level(2);
    if (log_enabled(kDebug) || !log_enabled(kInfo) || !log_enabled(kError)) { std::cerr << "log_enabled disagrees with level\n"; return 1; }
    std::string out;
    if (!capture("/tmp/planner_logging_stage1.txt", [] {
            log_debug("debug-hidden");
            log_info("info-message", {{"task_id", std::string("t\"1")}, {"placed", int64_t(3)}, {"score", 96.5}});
            log_warn("warn-message");
            log_error("error-message");
        }, out)) return 1;

    std::istringstream in(out);
    std::string line;
    size_t lines = 0;
    bool saw_info = false, saw_warn = false, saw_error = false;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        ++lines;
        if (!is_json_line(line)) { std::cerr << "line not json: " << line << "\n"; return 1; }
        if (line.find("\"level\":\"INFO\"") != std::string::npos) saw_info = true;
        if (line.find("\"level\":\"WARN\"") != std::string::npos) saw_warn = true;
        if (line.find("\"level\":\"ERROR\"") != std::string::npos) saw_error = true;
    }
    if (lines != 3) { std::cerr << "expected 3 log lines got " << lines << "\n"; return 1; }
    if (!saw_info || !saw_warn || !saw_error) { std::cerr << "missing level outputs info=" << saw_info << " warn=" << saw_warn << " err=" << saw_error << "\n"; return 1; }
    if (out.find("debug-hidden") != std::string::npos) { std::cerr << "debug line printed at INFO level\n"; return 1; }
    if (out.find("\"task_id\":\"t\\\"1\"") == std::string::npos) { std::cerr << "string field not escaped\n"; return 1; }
    if (out.find("\"placed\":3") == std::string::npos || out.find("\"score\":96.500") == std::string::npos) { std::cerr << "numeric fields missing\n"; return 1; }

    // the scheduler reports each run at debug level
    set_log_level(1);
    if (!capture("/tmp/planner_logging_stage2.txt", [] {
            scheduling::TaskInput t;
            t.id = "t1";
            t.duration_minutes = 600;
            scheduling::TaskInput d;
            d.id = "t2";
            d.duration_minutes = 30;
            d.dependency_ids = {"t1"};
            scheduling::Horizon h{"2026-03-02", "2026-03-02"};
            (void)scheduling::schedule({t, d}, h, scheduling::SchedulerOptions{}, scheduling::NormalizedAvailability{}, {}, 0);
        }, out)) return 1;
    if (out.find("\"msg\":\"schedule.run\"") == std::string::npos || out.find("\"unplaced\":2") == std::string::npos) { std::cerr << "schedule.run not logged: " << out << "\n"; return 1; }
    if (out.find("\"msg\":\"schedule.cascading_unplaced\"") == std::string::npos || out.find("\"blocking\":\"t1\"") == std::string::npos) {
        std::cerr << "cascade warning not logged\n"; return 1;
    }
    set_log_level(2);


    const int threads = 4;
    const int iters = 1000;
    if (!capture("/tmp/planner_logging_stage3.txt", [&] {
            std::vector<std::thread> th;
            for (int t = 0; t < threads; ++t) {
                th.emplace_back([t, iters]() {
                    for (int i = 0; i < iters; ++i) {
                        log_info("t" + std::to_string(t) + " msg " + std::to_string(i));
                    }
                });
            }
            for (auto& tt : th) tt.join();
        }, out)) return 1;

    std::istringstream in3(out);
    size_t count = 0;
    while (std::getline(in3, line)) {
        if (!is_json_line(line)) { std::cerr << "interleaved line: " << line << "\n"; return 1; }
        ++count;
    }
    if (count != size_t(threads * iters)) {
        std::cerr << "multi-threaded expected " << threads * iters << " lines, got " << count << "\n";
        return 1;
    }

    std::cout << "logging_unit ok\n";
    return 0;
}
