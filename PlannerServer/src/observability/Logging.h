#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
// Ordered so a line's keys come out the same way every time.
using Fields = std::map<std::string, FieldValue>;

enum LogLevel { kDebug = 1, kInfo = 2, kWarn = 3, kError = 4 };

// One JSON object per line on stdout: ts, level, msg, then the fields.
void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

void set_log_level(int level);
bool log_enabled(int level);

}
