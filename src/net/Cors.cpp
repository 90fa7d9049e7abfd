#include "Cors.h"

namespace http = boost::beast::http;

void CorsPolicy::apply(Response& res) const {
    res.set(http::field::access_control_allow_origin, allow_origin);
    res.set(http::field::access_control_allow_methods, allow_methods);
    res.set(http::field::access_control_allow_headers, allow_headers);
    if (allow_credentials) res.set(http::field::access_control_allow_credentials, "true");
    else res.erase(http::field::access_control_allow_credentials);
    if (allow_origin != "*") res.set(http::field::vary, "Origin");
}

Response CorsPolicy::preflight(const Request& req) const {
    Response res{http::status::no_content, req.version()};
    res.keep_alive(req.keep_alive());
    res.set(http::field::access_control_max_age, "600");
    apply(res);
    res.prepare_payload();
    return res;
}
