#include "MiniJson.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

static size_t skip_ws(const std::string& js, size_t i) {
    while (i < js.size() && isspace((unsigned char)js[i])) ++i;
    return i;
}

// `start` points just past the opening quote. Returns the decoded text and the
// index of the closing quote.
static std::pair<std::string, size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    for (size_t i = start;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c != '\\') { out.push_back(c); continue; }
        if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
        char e = js[i+1];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                // BMP only
                if (i + 5 >= n) throw std::runtime_error("invalid unicode escape in json string");
                int code = 0;
                for (size_t k = i+2; k <= i+5; ++k) {
                    char ch = js[k];
                    code <<= 4;
                    if (ch >= '0' && ch <= '9') code += ch - '0';
                    else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                    else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                    else throw std::runtime_error("invalid hex in unicode escape");
                }
                if (code <= 0x7f) out.push_back((char)code);
                else if (code <= 0x7ff) {
                    out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
                    out.push_back((char)(0x80 | (code & 0x3f)));
                } else {
                    out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
                    out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
                    out.push_back((char)(0x80 | (code & 0x3f)));
                }
                i += 4;
                break;
            }
            default: throw std::runtime_error("unsupported escape in json string");
        }
        ++i;
    }
}

// Index just past the value starting at `i`.
static size_t skip_value(const std::string& js, size_t i) {
    const size_t n = js.size();
    if (i >= n) throw std::runtime_error("missing json value");
    char c = js[i];
    if (c == '"') return decode_string(js, i + 1).second + 1;
    if (c == '{' || c == '[') {
        std::vector<char> stack;
        for (; i < n; ++i) {
            char ch = js[i];
            if (ch == '"') { i = decode_string(js, i + 1).second; continue; }
            if (ch == '{' || ch == '[') stack.push_back(ch);
            else if (ch == '}' || ch == ']') {
                if (stack.empty()) throw std::runtime_error("unbalanced json");
                char open = stack.back();
                if ((ch == '}' && open != '{') || (ch == ']' && open != '[')) throw std::runtime_error("mismatched json brackets");
                stack.pop_back();
                if (stack.empty()) return i + 1;
            }
        }
        throw std::runtime_error("unterminated json container");
    }
    size_t end = i;
    while (end < n && js[end] != ',' && js[end] != '}' && js[end] != ']' && !isspace((unsigned char)js[end])) ++end;
    if (end == i) throw std::runtime_error("missing json value");
    return end;
}

// [begin, end) of a member's value in the outermost object.
static std::optional<std::pair<size_t, size_t>> find_member(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    size_t i = skip_ws(js, 0);
    if (i >= n) return std::nullopt;
    if (js[i] != '{') throw std::runtime_error("json object expected");
    i = skip_ws(js, i + 1);
    if (i < n && js[i] == '}') return std::nullopt;
    while (true) {
        if (i >= n || js[i] != '"') throw std::runtime_error("missing key in json object");
        auto k = decode_string(js, i + 1);
        i = skip_ws(js, k.second + 1);
        if (i >= n || js[i] != ':') throw std::runtime_error("missing ':' after string field");
        size_t v = skip_ws(js, i + 1);
        size_t e = skip_value(js, v);
        if (k.first == key) return std::make_pair(v, e);
        i = skip_ws(js, e);
        if (i >= n) throw std::runtime_error("unterminated json object");
        if (js[i] == '}') return std::nullopt;
        if (js[i] != ',') throw std::runtime_error("expected ',' or '}' in json object");
        i = skip_ws(js, i + 1);
    }
}

static bool is_null_at(const std::string& js, size_t v, size_t e) { return e - v == 4 && js.compare(v, 4, "null") == 0; }

// Calls `fn(begin, end)` for each element of the array at [v, e).
template <typename Fn>
static void for_each_element(const std::string& js, size_t v, size_t e, Fn fn) {
    if (js[v] != '[') throw std::runtime_error("json array expected");
    size_t i = skip_ws(js, v + 1);
    if (i < e && js[i] == ']') return;
    while (i < e) {
        size_t end = skip_value(js, i);
        fn(i, end);
        i = skip_ws(js, end);
        if (i < e && js[i] == ']') return;
        if (i >= e || js[i] != ',') throw std::runtime_error("expected ',' or ']' in json array");
        i = skip_ws(js, i + 1);
    }
    throw std::runtime_error("unterminated json array");
}

std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m) return std::nullopt;
    return js.substr(m->first, m->second - m->first);
}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m) return {false, std::nullopt};
    if (is_null_at(js, m->first, m->second)) return {true, std::nullopt};
    if (js[m->first] != '"') throw std::runtime_error("invalid type for json string field");
    return {true, decode_string(js, m->first + 1).first};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    auto pr = json_extract_string_opt_present(js, key);
    if (!pr.first || !pr.second.has_value()) return std::string();
    return pr.second.value();
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m) return std::nullopt;
    if (is_null_at(js, m->first, m->second)) throw std::runtime_error("null not allowed for integer field");
    auto parsed = parse_int64_strict_sv(std::string_view(js).substr(m->first, m->second - m->first));
    if (!parsed.has_value()) throw std::runtime_error("invalid json int value");
    return parsed;
}

std::optional<double> json_extract_double_opt(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m) return std::nullopt;
    if (is_null_at(js, m->first, m->second)) return std::nullopt;
    std::string tok = js.substr(m->first, m->second - m->first);
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(tok.c_str(), &end);
    if (errno != 0 || end == tok.c_str() || *end != '\0' || tok[0] == '"') throw std::runtime_error("invalid json number");
    return v;
}

std::optional<bool> json_extract_bool_opt(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m) return std::nullopt;
    std::string tok = js.substr(m->first, m->second - m->first);
    if (tok == "true") return true;
    if (tok == "false") return false;
    if (tok == "null") return std::nullopt;
    throw std::runtime_error("invalid json bool");
}

std::optional<std::string> json_extract_object(const std::string& js, const std::string& key) {
    auto m = find_member(js, key);
    if (!m || is_null_at(js, m->first, m->second)) return std::nullopt;
    if (js[m->first] != '{') throw std::runtime_error("json object expected for field " + key);
    return js.substr(m->first, m->second - m->first);
}

std::vector<std::string> json_extract_object_array(const std::string& js, const std::string& key) {
    std::vector<std::string> out;
    auto m = find_member(js, key);
    if (!m || is_null_at(js, m->first, m->second)) return out;
    for_each_element(js, m->first, m->second, [&](size_t b, size_t e) {
        if (js[b] != '{') throw std::runtime_error("array of objects expected for field " + key);
        out.push_back(js.substr(b, e - b));
    });
    return out;
}

std::vector<std::string> json_extract_string_array(const std::string& js, const std::string& key) {
    std::vector<std::string> out;
    auto m = find_member(js, key);
    if (!m || is_null_at(js, m->first, m->second)) return out;
    for_each_element(js, m->first, m->second, [&](size_t b, size_t) {
        if (js[b] != '"') throw std::runtime_error("array of strings expected for field " + key);
        out.push_back(decode_string(js, b + 1).first);
    });
    return out;
}

std::map<std::string, std::string> json_extract_string_map(const std::string& js, const std::string& key) {
    std::map<std::string, std::string> out;
    auto obj = json_extract_object(js, key);
    if (!obj) return out;
    const std::string& o = *obj;
    size_t i = skip_ws(o, 1);
    if (i < o.size() && o[i] == '}') return out;
    while (i < o.size()) {
        if (o[i] != '"') throw std::runtime_error("missing key in json object");
        auto k = decode_string(o, i + 1);
        i = skip_ws(o, k.second + 1);
        if (i >= o.size() || o[i] != ':') throw std::runtime_error("missing ':' after string field");
        size_t v = skip_ws(o, i + 1);
        size_t e = skip_value(o, v);
        if (o[v] == '{' || o[v] == '[') throw std::runtime_error("nested value not allowed in " + key);
        out[k.first] = (o[v] == '"') ? decode_string(o, v + 1).first : o.substr(v, e - v);
        i = skip_ws(o, e);
        if (i < o.size() && o[i] == '}') break;
        if (i >= o.size() || o[i] != ',') throw std::runtime_error("expected ',' or '}' in json object");
        i = skip_ws(o, i + 1);
    }
    return out;
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty()) return std::nullopt;
    return parse_int64_strict_sv(std::string_view(*o));
}

std::string json_emit_double(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return std::string(buf);
}
