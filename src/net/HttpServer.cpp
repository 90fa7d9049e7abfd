#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <array>
#include <chrono>
#include <memory>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static constexpr std::size_t kHeaderLimit = 8 * 1024;
static constexpr std::size_t kBodyLimit = 1 * 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    const Router& router;
    const CorsPolicy& cors;
    bool metrics_enabled;
    bool access_log;
    unsigned http_version = 11;
    Request req;
    bool closed_ = false;
    std::array<char, 4096> drain_buf_{};
    std::chrono::steady_clock::time_point start_ts;
    std::shared_ptr<http::request_parser<http::string_body>> parser;

    Session(net::ip::tcp::socket&& s, const Router& r, const CorsPolicy& c, bool me, bool al)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), cors(c), metrics_enabled(me), access_log(al) {}

    void run() {
        // the socket carries its own strand; start there
        net::dispatch(socket.get_executor(), [self = shared_from_this()]() { self->do_read(); });
    }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        // idle keep-alive connections and slow headers share one timeout
        read_timer.expires_after(std::chrono::seconds(15));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self](beast::error_code ec, std::size_t) {
            self->on_header(ec);
        });
    }

    void on_header(beast::error_code ec) {
        read_timer.cancel();
        if (ec) {
            if (ec == http::error::end_of_stream || ec == net::error::operation_aborted) { close_socket(); return; }
            if (ec == http::error::header_limit) {
                reply_json_error(http::status::request_header_fields_too_large, "{\"detail\":\"Request header fields too large\"}", "(header)");
                return;
            }
            // the parser rejects an oversized Content-Length before the header completes
            if (ec == http::error::body_limit) {
                http_version = parser->get().version();
                auto len = parser->content_length();
                observability::log_warn("oversized_body_header", {{"len", int64_t(len ? *len : 0)}});
                reply_json_error(http::status::payload_too_large, "{\"detail\":\"Payload too large\"}", "(body)");
                return;
            }
            if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                ec == http::error::bad_field || ec == http::error::bad_value || ec == http::error::bad_line_ending) {
                reply_json_error(http::status::bad_request, "{\"detail\":\"Bad request\"}", "(parse)");
                return;
            }
            close_socket();
            return;
        }

        http_version = parser->get().version();
        auto len = parser->content_length();
        if (len && *len > kBodyLimit) {
            observability::log_warn("oversized_body_header", {{"len", int64_t(*len)}});
            reply_json_error(http::status::payload_too_large, "{\"detail\":\"Payload too large\"}", "(body)");
            return;
        }

        auto self = shared_from_this();
        read_timer.expires_after(std::chrono::seconds(len && *len > 128 * 1024 ? 60 : 20));
        read_timer.async_wait([self](const boost::system::error_code& ec2) {
            if (!ec2) self->close_socket();
        });
        http::async_read(socket, buffer, *parser, [self](beast::error_code ec2, std::size_t) {
            self->on_body(ec2);
        });
    }

    void on_body(beast::error_code ec) {
        read_timer.cancel();
        if (ec) {
            if (ec == http::error::body_limit) {
                reply_json_error(http::status::payload_too_large, "{\"detail\":\"Payload too large\"}", "(body)");
                return;
            }
            close_socket();
            return;
        }
        req = parser->release();
        start_ts = std::chrono::steady_clock::now();
        handle_request();
    }

    void handle_request() {
        auto self = shared_from_this();
        std::string path = request_path(req);
        std::string pattern = router.pattern_for(path);

        if (req.method() == http::verb::options && !router.has_route("OPTIONS", path)) {
            send_response(std::make_shared<Response>(cors.preflight(req)), pattern);
            return;
        }

        auto reply = [self, pattern](Response res) {
            auto sp = std::make_shared<Response>(std::move(res));
            // handlers may answer from an upstream strand
            net::dispatch(self->socket.get_executor(), [self, sp, pattern]() {
                self->send_response(sp, pattern);
            });
        };
        try {
            router.route(req, std::move(reply));
        } catch (const std::exception& e) {
            observability::log_error("request_failed", {{"path", pattern}, {"error", std::string(e.what())}});
            auto res = make_json_response(http::status::internal_server_error, req.version(), req.keep_alive(), "{\"detail\":\"Internal server error\"}");
            send_response(std::make_shared<Response>(std::move(res)), pattern);
        }
    }

    void send_response(std::shared_ptr<Response> sp, const std::string& pattern) {
        if (closed_) return;
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) sp->keep_alive(req.keep_alive());
        cors.apply(*sp);

        int code = sp->result_int();
        std::string method = std::string(req.method_string());
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            observability::Metrics::instance().inc(pattern, method, code);
            observability::Metrics::instance().observe_latency(pattern, method, ms);
        }
        if (access_log) {
            observability::log_info("http_access", {{"method", method}, {"path", std::string(req.target())}, {"status", int64_t(code)}, {"duration_ms", ms}});
        }

        http::async_write(socket, *sp, [self, sp, pattern](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", pattern}, {"error", ec.message()}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    // Error written before a full request was read; the connection is not reused.
    void reply_json_error(http::status st, const std::string& body, const std::string& label) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        start_ts = std::chrono::steady_clock::now();
        send_response(res, label);
    }

    void close_socket() {
        if (closed_) return;
        closed_ = true;
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    // Half-close and drain so the client sees the response before the RST.
    void graceful_close_after_write() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });
        do_drain_read();
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != net::error::operation_aborted) self->close_socket();
                return;
            }
            self->do_drain_read();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, const ServerOptions& opts, const Router& router, CorsPolicy cors)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::make_address(opts.address), opts.port)), router_(router), cors_(std::move(cors)), opts_(opts) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

uint16_t HttpServer::port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, cors_, opts_.metrics_enabled, opts_.access_log);
            s->run();
        } else {
            observability::log_warn("accept_error", {{"error", ec.message()}});
        }
        if (acceptor_.is_open()) do_accept();
    });
}
