#pragma once

#include "net/MiniJson.h"
#include "net/Response.h"
#include <stdexcept>
#include <string>

namespace gateway {

enum class ErrorKind { Validation, Upstream, Unavailable, Internal };

const char* to_string(ErrorKind kind);

// Terminal failure of one request. The detail is sent back verbatim as the
// "detail" member of the JSON error body.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, int status, JsonValue detail);

    // 400, detail is the message
    static GatewayError validation(const std::string& message);
    // upstream status, detail is the parsed upstream body or its raw text
    static GatewayError upstream(int status, JsonValue detail);
    // 503
    static GatewayError unavailable(const std::string& transport_error);
    // 500
    static GatewayError internal(const std::string& what);

    ErrorKind kind() const noexcept { return kind_; }
    int status() const noexcept { return status_; }
    const JsonValue& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    int status_;
    JsonValue detail_;
};

Response error_response(const GatewayError& err, unsigned version, bool keep_alive);

}
