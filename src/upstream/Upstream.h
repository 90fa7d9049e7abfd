#pragma once

#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace upstream {

struct UpstreamRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    // path and query relative to the configured base URL
    std::string target;
    // serialized JSON; empty for bodiless requests
    std::string body;
};

struct UpstreamResponse {
    // set for transport failures (resolve, connect, TLS, timeout); status is 0 then
    boost::system::error_code ec;
    std::string error;
    int status = 0;
    std::string content_type;
    std::string body;

    bool transport_failed() const { return static_cast<bool>(ec); }
    bool ok() const { return !ec && status >= 200 && status < 300; }
};

using ResponseHandler = std::function<void(UpstreamResponse)>;

// Seam between the gateway and the wire; the handler runs exactly once.
class Upstream {
public:
    virtual ~Upstream() = default;
    virtual void async_send(UpstreamRequest req, ResponseHandler handler) = 0;
    // Absolute URL for a target, used in diagnostics.
    virtual std::string url_for(const std::string& target) const = 0;
};

}
