#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    void add_route(std::string method, std::string path, Handler h);
    // 405 when the path is known under another method, 404 otherwise. The
    // query string is ignored.
    Response route(const Request& req) const;
    bool has_path(const std::string& path) const;

    using Params = std::unordered_map<std::string, std::string>;
    // Segment-wise match of `path` (no query string) against `pattern`;
    // ":name" segments capture into `params`. Empty segments never match.
    static bool match_pattern(const std::string& pattern, const std::string& path, Params& params);
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, Handler, KeyHash, KeyEq> routes_;
};
