#include "Router.h"
#include <boost/beast/http.hpp>

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> out;
    size_t pos = (!path.empty() && path[0] == '/') ? 1 : 0;
    for (;;) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) { out.push_back(path.substr(pos)); break; }
        out.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return out;
}

static bool is_param_segment(const std::string& seg) {
    return seg.size() > 2 && seg.front() == '{' && seg.back() == '}';
}

void Router::add_route(std::string method, std::string pattern, Handler h) {
    add_async_route(std::move(method), std::move(pattern), [h = std::move(h)](const Request& req, const RouteParams&, Reply reply) {
        reply(h(req));
    });
}

void Router::add_async_route(std::string method, std::string pattern, AsyncHandler h) {
    Route r;
    r.method = std::move(method);
    r.segments = split_path(pattern);
    for (const auto& s : r.segments) if (is_param_segment(s)) ++r.params;
    r.pattern = std::move(pattern);
    r.handler = std::move(h);
    routes_.push_back(std::move(r));
}

bool Router::match(const Route& r, const std::vector<std::string>& segs, RouteParams* out) {
    if (r.segments.size() != segs.size()) return false;
    for (size_t i = 0; i < segs.size(); ++i) {
        const auto& want = r.segments[i];
        if (is_param_segment(want)) {
            if (segs[i].empty()) return false;
        } else if (want != segs[i]) {
            return false;
        }
    }
    if (out) {
        out->pattern = r.pattern;
        out->path.clear();
        for (size_t i = 0; i < segs.size(); ++i) {
            const auto& want = r.segments[i];
            if (is_param_segment(want)) out->path[want.substr(1, want.size() - 2)] = url_decode(segs[i], false);
        }
    }
    return true;
}

const Router::Route* Router::find(const std::string& method, const std::string& path, RouteParams* out, bool* path_exists) const {
    auto segs = split_path(path);
    const Route* best = nullptr;
    bool any = false;
    for (const auto& r : routes_) {
        if (!match(r, segs, nullptr)) continue;
        any = true;
        if (r.method != method) continue;
        // literal routes win over parameterised ones
        if (!best || r.params < best->params) best = &r;
    }
    if (path_exists) *path_exists = any;
    if (best && out) match(*best, segs, out);
    return best;
}

bool Router::has_route(const std::string& method, const std::string& path) const {
    return find(method, path, nullptr, nullptr) != nullptr;
}

std::string Router::pattern_for(const std::string& path) const {
    auto segs = split_path(path);
    const Route* best = nullptr;
    for (const auto& r : routes_) {
        if (match(r, segs, nullptr) && (!best || r.params < best->params)) best = &r;
    }
    return best ? best->pattern : std::string("(unmatched)");
}

void Router::route(const Request& req, Reply reply) const {
    auto [path, query] = split_target(std::string(req.target()));
    RouteParams params;
    bool path_exists = false;
    const Route* r = find(std::string(req.method_string()), path, &params, &path_exists);
    if (!r) {
        if (path_exists) {
            reply(make_json_response(boost::beast::http::status::method_not_allowed, req.version(), req.keep_alive(), "{\"detail\":\"Method Not Allowed\"}"));
            return;
        }
        reply(make_json_response(boost::beast::http::status::not_found, req.version(), req.keep_alive(), "{\"detail\":\"Not Found\"}"));
        return;
    }
    params.query = QueryParams::parse(query);
    r->handler(req, params, std::move(reply));
}
