#pragma once

#include "Url.h"
#include <boost/beast/http.hpp>
#include <string>

using Request = boost::beast::http::request<boost::beast::http::string_body>;

// Target path with the query string removed; still percent-encoded.
inline std::string request_path(const Request& req) {
    return split_target(std::string(req.target())).first;
}
