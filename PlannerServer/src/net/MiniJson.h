#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Field readers for a JSON object document. Only members of the outermost
// object are considered, so keys inside nested values never match. Malformed
// JSON or a value of the wrong type throws std::runtime_error; a missing key
// is reported as absent.

std::string json_escape_resp(const std::string& s);

// Raw text of the member's value, e.g. `{"a":1}` or `"x"`.
std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key);

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
// Empty string on missing key or explicit null.
std::string json_extract_string(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);
std::optional<double> json_extract_double_opt(const std::string& js, const std::string& key);
std::optional<bool> json_extract_bool_opt(const std::string& js, const std::string& key);
std::optional<std::string> json_extract_object(const std::string& js, const std::string& key);
// Each element's raw object text; throws if an element is not an object.
std::vector<std::string> json_extract_object_array(const std::string& js, const std::string& key);
std::vector<std::string> json_extract_string_array(const std::string& js, const std::string& key);
// Flat object of scalars; strings are decoded, other values kept as raw text.
std::map<std::string, std::string> json_extract_string_map(const std::string& js, const std::string& key);

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o);
std::string json_emit_double(double v);


inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}


inline std::optional<int> json_parse_int32_strict(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty()) return std::nullopt;
    auto p = json_parse_int_strict(o);
    if (!p.has_value()) return std::nullopt;
    int64_t v = *p;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(v);
}
