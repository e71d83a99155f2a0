#include "Router.h"
#include <boost/beast/http.hpp>

static Response json_reply(boost::beast::http::status st, const Request& req, const char* body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

void Router::add_route(std::string method, std::string path, Handler h) {
    Key k{std::move(method), std::move(path)};
    routes_.emplace(std::move(k), std::move(h));
}

static std::vector<std::string> segments(const std::string& path) {
    std::vector<std::string> out;
    size_t i = path.empty() || path[0] != '/' ? 0 : 1;
    while (i <= path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        out.push_back(path.substr(i, j - i));
        i = j + 1;
    }
    return out;
}

bool Router::match_pattern(const std::string& pattern, const std::string& path, Params& params) {
    auto want = segments(pattern);
    auto got = segments(path);
    if (want.size() != got.size()) return false;
    Params captured;
    for (size_t i = 0; i < want.size(); ++i) {
        if (got[i].empty()) return false;
        if (!want[i].empty() && want[i][0] == ':') captured[want[i].substr(1)] = got[i];
        else if (want[i] != got[i]) return false;
    }
    params = std::move(captured);
    return true;
}

bool Router::has_path(const std::string& path) const {
    for (const auto& p : routes_) {
        if (p.first.path == path) return true;
    }
    return false;
}

Response Router::route(const Request& req) const {
    std::string target = std::string(req.target());
    Key k{std::string(req.method_string()), target.substr(0, target.find('?'))};
    auto it = routes_.find(k);
    if (it != routes_.end()) return it->second(req);
    if (has_path(k.path)) return json_reply(boost::beast::http::status::method_not_allowed, req, "{\"error\":\"method_not_allowed\"}");
    return json_reply(boost::beast::http::status::not_found, req, "{\"error\":\"not_found\"}");
}
