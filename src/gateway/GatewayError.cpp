#include "GatewayError.h"

namespace http = boost::beast::http;

namespace gateway {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Upstream: return "upstream";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

static std::string describe(const JsonValue& detail) {
    return detail.is_string() ? detail.as_string() : json_dump(detail);
}

GatewayError::GatewayError(ErrorKind kind, int status, JsonValue detail)
    : std::runtime_error(describe(detail)), kind_(kind), status_(status), detail_(std::move(detail)) {}

GatewayError GatewayError::validation(const std::string& message) {
    return GatewayError(ErrorKind::Validation, 400, JsonValue(message));
}

GatewayError GatewayError::upstream(int status, JsonValue detail) {
    // an out-of-range upstream status cannot be relayed as-is
    if (status < 100 || status > 999) status = 502;
    return GatewayError(ErrorKind::Upstream, status, std::move(detail));
}

GatewayError GatewayError::unavailable(const std::string& transport_error) {
    return GatewayError(ErrorKind::Unavailable, 503, JsonValue("Service unavailable: " + transport_error));
}

GatewayError GatewayError::internal(const std::string& what) {
    return GatewayError(ErrorKind::Internal, 500, JsonValue("Internal server error: " + what));
}

Response error_response(const GatewayError& err, unsigned version, bool keep_alive) {
    JsonValue body = JsonValue::object();
    body.set("detail", err.detail());
    return make_json_response(static_cast<http::status>(err.status()), version, keep_alive, json_dump(body));
}

}
