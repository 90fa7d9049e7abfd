#include "Gateway.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include <chrono>
#include <utility>

namespace http = boost::beast::http;

using observability::log_error;
using observability::log_info;
using observability::log_warn;

namespace gateway {

Gateway::Gateway(std::shared_ptr<upstream::Upstream> upstream, GatewayOptions opts)
    : upstream_(std::move(upstream)), opts_(opts) {}

void Gateway::register_routes(Router& router) {
    router.add_async_route("GET", "/api/resources", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        list_resources(req, p, std::move(reply));
    });
    router.add_async_route("POST", "/api/resources", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        create_resource(req, p, std::move(reply));
    });
    router.add_async_route("GET", "/api/schedules", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        list_schedules(req, p, std::move(reply));
    });
    router.add_async_route("POST", "/api/schedules", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        create_schedule(req, p, std::move(reply));
    });
    router.add_async_route("PUT", "/api/schedules/{scheduleId}/status", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        update_schedule_status(req, p, std::move(reply));
    });
    router.add_async_route("GET", "/api/check-connection", [this](const Request& req, const RouteParams& p, Router::Reply reply) {
        check_connection(req, p, std::move(reply));
    });
    router.add_route("OPTIONS", "/api/schedules", schedules_preflight);
    router.add_route("GET", "/test-cors", test_cors);
}

template <class Translate>
void Gateway::proxy(const Request& req, const RouteParams& params, Router::Reply reply, Translate&& translate) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    const std::string route = std::string(req.method_string()) + " " + params.pattern;
    upstream::UpstreamRequest call;
    try {
        call = translate();
    } catch (const std::exception& e) {
        reply(respond_with_error(e, route, version, keep_alive));
        return;
    }
    forward(route, version, keep_alive, std::move(call), std::move(reply));
}

void Gateway::list_resources(const Request& req, const RouteParams& params, Router::Reply reply) {
    proxy(req, params, std::move(reply), [&]() { return to_upstream(parse_resource_list_query(params.query)); });
}

void Gateway::create_resource(const Request& req, const RouteParams& params, Router::Reply reply) {
    proxy(req, params, std::move(reply), [&]() { return to_upstream(parse_resource_create(req.body())); });
}

void Gateway::create_schedule(const Request& req, const RouteParams& params, Router::Reply reply) {
    proxy(req, params, std::move(reply), [&]() { return to_upstream(parse_schedule_create(req.body())); });
}

void Gateway::update_schedule_status(const Request& req, const RouteParams& params, Router::Reply reply) {
    proxy(req, params, std::move(reply), [&]() {
        return to_upstream(parse_schedule_status_update(params.path_param("scheduleId"), req.body()));
    });
}

void Gateway::list_schedules(const Request& req, const RouteParams& params, Router::Reply reply) {
    proxy(req, params, std::move(reply), [&]() { return to_upstream(parse_schedule_list_query(params.query)); });
}

void Gateway::forward(const std::string& route, unsigned version, bool keep_alive, upstream::UpstreamRequest call, Router::Reply reply) {
    auto started = std::chrono::steady_clock::now();
    log_info("upstream_request", {{"route", route}, {"method", std::string(http::to_string(call.method))}, {"target", call.target}});
    const bool metrics = opts_.metrics_enabled;
    upstream_->async_send(std::move(call), [route, version, keep_alive, started, metrics, reply = std::move(reply)](upstream::UpstreamResponse res) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        auto outcome = observability::UpstreamOutcome::Ok;
        if (res.transport_failed()) {
            outcome = observability::UpstreamOutcome::Unavailable;
            log_warn("upstream_error", {{"route", route}, {"error", res.error}, {"duration_ms", ms}});
        } else {
            if (!res.ok()) outcome = observability::UpstreamOutcome::HttpError;
            log_info("upstream_response", {{"route", route}, {"status", int64_t(res.status)}, {"duration_ms", ms}});
        }
        if (metrics) {
            observability::Metrics::instance().inc_upstream(route, outcome);
            observability::Metrics::instance().observe_upstream_latency(route, ms);
        }

        Response out;
        try {
            out = map_upstream_response(res, version, keep_alive);
        } catch (const std::exception& e) {
            out = respond_with_error(e, route, version, keep_alive);
        }
        reply(std::move(out));
    });
}

void Gateway::check_connection(const Request& req, const RouteParams&, Router::Reply reply) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    if (!opts_.api_key_configured) {
        JsonValue body = JsonValue::object();
        body.set("status", "error");
        body.set("message", "API key not configured");
        reply(make_json_response(http::status::ok, version, keep_alive, json_dump(body)));
        return;
    }
    std::string url = upstream_->url_for("/api/resources");
    upstream::UpstreamRequest probe{http::verb::get, "/api/resources", std::string()};
    upstream_->async_send(std::move(probe), [url, version, keep_alive, reply = std::move(reply)](upstream::UpstreamResponse res) {
        JsonValue body = JsonValue::object();
        if (res.ok()) {
            body.set("status", "success");
            body.set("message", "Connection to Hourglass API successful");
            body.set("url", url);
        } else {
            std::string why = res.transport_failed() ? res.error : "HTTP " + std::to_string(res.status);
            log_warn("connection_check_failed", {{"error", why}});
            body.set("status", "error");
            body.set("message", "Connection failed: " + why);
        }
        reply(make_json_response(http::status::ok, version, keep_alive, json_dump(body)));
    });
}

Response map_upstream_response(const upstream::UpstreamResponse& res, unsigned version, bool keep_alive) {
    if (res.transport_failed()) throw GatewayError::unavailable(res.error);
    if (!res.ok()) {
        if (auto doc = json_try_parse(res.body)) throw GatewayError::upstream(res.status, std::move(*doc));
        throw GatewayError::upstream(res.status, JsonValue(res.body));
    }
    Response out{static_cast<http::status>(res.status), version};
    out.keep_alive(keep_alive);
    if (!res.body.empty()) {
        if (!json_try_parse(res.body)) throw GatewayError::internal("upstream returned a non-JSON body");
        out.set(http::field::content_type, "application/json");
        out.body() = res.body;
    }
    out.prepare_payload();
    return out;
}

Response respond_with_error(const std::exception& e, const std::string& route, unsigned version, bool keep_alive) {
    if (auto* ge = dynamic_cast<const GatewayError*>(&e)) {
        if (ge->kind() == ErrorKind::Internal) {
            log_error("request_failed", {{"route", route}, {"error", std::string(ge->what())}});
        } else {
            log_warn("request_rejected", {{"route", route}, {"kind", std::string(to_string(ge->kind()))},
                                          {"status", int64_t(ge->status())}, {"detail", std::string(ge->what())}});
        }
        return error_response(*ge, version, keep_alive);
    }
    log_error("request_failed", {{"route", route}, {"error", std::string(e.what())}});
    return error_response(GatewayError::internal(e.what()), version, keep_alive);
}

Response test_cors(const Request& req) {
    return make_json_response(http::status::ok, req.version(), req.keep_alive(), "{\"message\":\"CORS is working properly!\"}");
}

Response schedules_preflight(const Request& req) {
    return make_json_response(http::status::ok, req.version(), req.keep_alive(), "{}");
}

}
