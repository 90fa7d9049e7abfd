#pragma once

#include "GatewayError.h"
#include "Translate.h"
#include "net/Router.h"
#include "upstream/Upstream.h"
#include <memory>
#include <string>

namespace gateway {

struct GatewayOptions {
    bool api_key_configured = false;
    bool metrics_enabled = true;
};

// Proxies the scheduling routes to the upstream. Holds no per-request state;
// handlers may run concurrently on any io thread.
class Gateway {
public:
    Gateway(std::shared_ptr<upstream::Upstream> upstream, GatewayOptions opts);

    void register_routes(Router& router);

    void list_resources(const Request& req, const RouteParams& params, Router::Reply reply);
    void create_resource(const Request& req, const RouteParams& params, Router::Reply reply);
    void create_schedule(const Request& req, const RouteParams& params, Router::Reply reply);
    void update_schedule_status(const Request& req, const RouteParams& params, Router::Reply reply);
    void list_schedules(const Request& req, const RouteParams& params, Router::Reply reply);
    void check_connection(const Request& req, const RouteParams& params, Router::Reply reply);

private:
    // Validates/translates synchronously, then forwards. Errors from either
    // step come back through reply as a mapped error response.
    template <class Translate>
    void proxy(const Request& req, const RouteParams& params, Router::Reply reply, Translate&& translate);
    void forward(const std::string& route, unsigned version, bool keep_alive, upstream::UpstreamRequest call, Router::Reply reply);

    std::shared_ptr<upstream::Upstream> upstream_;
    GatewayOptions opts_;
};

// Maps an upstream outcome onto the inbound response: 2xx bodies pass
// through, everything else throws GatewayError.
Response map_upstream_response(const upstream::UpstreamResponse& res, unsigned version, bool keep_alive);

// The single boundary that turns any failure into a {"detail": ...} response.
Response respond_with_error(const std::exception& e, const std::string& route, unsigned version, bool keep_alive);

Response test_cors(const Request& req);
Response schedules_preflight(const Request& req);

}
