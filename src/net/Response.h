#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include <utility>

using Response = boost::beast::http::response<boost::beast::http::string_body>;

// JSON response with the given status; body is sent as-is.
inline Response make_json_response(boost::beast::http::status st, unsigned version, bool keep_alive, std::string body) {
    Response res{st, version};
    res.set(boost::beast::http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}
