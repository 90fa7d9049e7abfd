#pragma once

#include "Request.h"
#include "Response.h"
#include <string>

// Cross-origin headers stamped on every outgoing response, errors included.
struct CorsPolicy {
    std::string allow_origin = "http://localhost:5173";
    std::string allow_methods = "GET, POST, PUT, DELETE, OPTIONS";
    std::string allow_headers = "*";
    bool allow_credentials = true;

    void apply(Response& res) const;
    // 204 answer for an OPTIONS request no route claims.
    Response preflight(const Request& req) const;
};
