#pragma once

#include "Request.h"
#include "Response.h"
#include "Url.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

struct RouteParams {
    // the matched pattern, e.g. "/api/schedules/{scheduleId}/status"
    std::string pattern;
    std::unordered_map<std::string, std::string> path;
    QueryParams query;

    std::string path_param(const std::string& name) const {
        auto it = path.find(name);
        return it == path.end() ? std::string() : it->second;
    }
};

class Router {
public:
    using Reply = std::function<void(Response)>;
    using Handler = std::function<Response(const Request&)>;
    // Must invoke reply exactly once, possibly from another thread.
    using AsyncHandler = std::function<void(const Request&, const RouteParams&, Reply)>;

    // Patterns are literal paths; a "{name}" segment captures one path segment.
    void add_route(std::string method, std::string pattern, Handler h);
    void add_async_route(std::string method, std::string pattern, AsyncHandler h);

    // 404/405 are answered synchronously through reply.
    void route(const Request& req, Reply reply) const;
    bool has_route(const std::string& method, const std::string& path) const;
    // Pattern used as the metrics label; "(unmatched)" when no route applies.
    std::string pattern_for(const std::string& path) const;

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        int params = 0;
        AsyncHandler handler;
    };
    const Route* find(const std::string& method, const std::string& path, RouteParams* out, bool* path_exists) const;
    static bool match(const Route& r, const std::vector<std::string>& segs, RouteParams* out);
    std::vector<Route> routes_;
};
