#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "upstream/UpstreamClient.h"
#include "gateway/Gateway.h"

using config::Config;
using observability::LogLevel;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    LogLevel lvl = LogLevel::INFO;
    switch (cfg.log_level) {
        case Config::LogLevel::DEBUG: lvl = LogLevel::DEBUG; break;
        case Config::LogLevel::INFO: lvl = LogLevel::INFO; break;
        case Config::LogLevel::WARN: lvl = LogLevel::WARN; break;
        case Config::LogLevel::ERROR: lvl = LogLevel::ERROR; break;
    }
    set_log_level(lvl);

    if (cfg.api_key.empty()) log_warn("api_key_missing", {});
    else log_info("api_key_loaded", {{"key", observability::mask_secret(cfg.api_key)}});

    try {
        boost::asio::io_context io(cfg.io_threads);

        upstream::ClientOptions copts;
        copts.base_url = cfg.upstream_base_url;
        copts.api_key = cfg.api_key;
        copts.timeout = std::chrono::seconds(cfg.upstream_timeout_sec);
        copts.max_idle = static_cast<std::size_t>(cfg.upstream_pool_size);
        copts.idle_ttl = std::chrono::seconds(cfg.upstream_idle_ttl_sec);
        copts.tls_verify = cfg.upstream_tls_verify;
        std::shared_ptr<upstream::UpstreamClient> client;
        try {
            client = std::make_shared<upstream::UpstreamClient>(io, copts);
        } catch (const std::invalid_argument& e) {
            log_error("upstream_config_invalid", {{"url", cfg.upstream_base_url}, {"error", std::string(e.what())}});
            std::cerr << "fatal: " << e.what() << "\n";
            return 2;
        }
        if (!cfg.upstream_tls_verify) log_warn("upstream_tls_verify_disabled", {});

        Router router;

        router.add_route("GET", "/health", [](const Request& req) {
            return make_json_response(boost::beast::http::status::ok, req.version(), req.keep_alive(), "{\"status\":\"ok\"}");
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        gateway::Gateway gw(client, {!cfg.api_key.empty(), cfg.metrics_enabled});
        gw.register_routes(router);

        ServerOptions sopts;
        sopts.address = cfg.bind_address;
        sopts.port = cfg.port;
        sopts.metrics_enabled = cfg.metrics_enabled;
        sopts.access_log = cfg.access_log;
        CorsPolicy cors;
        cors.allow_origin = cfg.cors_allow_origin;
        HttpServer server(io, sopts, router, cors);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            server.stop();
            client->shutdown();
            io.stop();
        });

        log_info("server_start", {{"address", cfg.bind_address}, {"port", int64_t(server.port())},
                                  {"upstream", cfg.upstream_base_url}, {"io_threads", int64_t(cfg.io_threads)}});
        server.run();

        std::vector<std::thread> workers;
        for (int i = 1; i < cfg.io_threads; ++i) workers.emplace_back([&io] { io.run(); });
        io.run();
        for (auto& t : workers) t.join();
    } catch (const std::exception& e) {
        log_error("server_error", {{"error", std::string(e.what())}});
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
