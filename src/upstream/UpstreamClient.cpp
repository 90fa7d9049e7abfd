#include "UpstreamClient.h"
#include "observability/Logging.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <functional>
#include <optional>
#include <poll.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace upstream {

using Clock = std::chrono::steady_clock;
using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

static constexpr std::uint64_t kMaxResponseBody = 32 * 1024 * 1024;
static constexpr int kMaxRedirects = 10;

// One keep-alive connection. Lives on its own strand; at most one exchange
// is in flight at a time, which the pool guarantees by handing it out only
// while idle.
class UpstreamClient::Connection : public std::enable_shared_from_this<Connection> {
public:
    using Done = std::function<void(boost::system::error_code, std::string, HttpResponse)>;

    Connection(net::io_context& ioc, ssl::context* ctx, const BaseUrl& base, bool verify)
        : strand_(net::make_strand(ioc)), resolver_(strand_), timer_(strand_), base_(base), verify_(verify) {
        if (ctx) tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(strand_, *ctx);
        else plain_ = std::make_unique<beast::tcp_stream>(strand_);
    }

    void exchange(std::shared_ptr<HttpRequest> req, Clock::time_point deadline, Done done) {
        req_ = std::move(req);
        deadline_ = deadline;
        done_ = std::move(done);
        net::dispatch(strand_, [self = shared_from_this()]() {
            if (self->connected_) self->do_write();
            else self->do_resolve();
        });
    }

    bool reusable() const { return connected_ && reusable_; }

    // Called only while idle.
    bool usable(Clock::time_point now, std::chrono::seconds idle_ttl) {
        if (!reusable()) return false;
        if (now - last_used_ > idle_ttl) return false;
        auto& sock = lowest_layer().socket();
        if (!sock.is_open()) return false;
        // an idle socket that polls readable was closed by the peer
        pollfd p{};
        p.fd = sock.native_handle();
        p.events = POLLIN;
        return ::poll(&p, 1, 0) == 0;
    }

    void close_async() {
        net::post(strand_, [self = shared_from_this()]() { self->close(); });
    }

private:
    beast::tcp_stream& lowest_layer() {
        if (tls_) return beast::get_lowest_layer(*tls_);
        return *plain_;
    }

    template <class F>
    void with_stream(F&& f) {
        if (tls_) f(*tls_);
        else f(*plain_);
    }

    void do_resolve() {
        auto self = shared_from_this();
        timed_out_ = false;
        timer_.expires_at(deadline_);
        timer_.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) { self->timed_out_ = true; self->resolver_.cancel(); }
        });
        resolver_.async_resolve(base_.host, base_.port, [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            self->timer_.cancel();
            if (self->timed_out_) { self->fail(beast::error::timeout, "resolve"); return; }
            if (ec) { self->fail(ec, "resolve"); return; }
            self->do_connect(results);
        });
    }

    void do_connect(const tcp::resolver::results_type& results) {
        auto self = shared_from_this();
        lowest_layer().expires_at(deadline_);
        lowest_layer().async_connect(results, [self](const boost::system::error_code& ec, const tcp::endpoint& ep) {
            if (ec) { self->fail(ec, "connect"); return; }
            observability::log_debug("upstream_connect", {{"host", self->base_.host}, {"endpoint", ep.address().to_string()}});
            if (self->tls_) self->do_handshake();
            else { self->connected_ = true; self->do_write(); }
        });
    }

    void do_handshake() {
        auto self = shared_from_this();
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), base_.host.c_str())) {
            boost::system::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            fail(ec, "tls");
            return;
        }
        if (verify_) tls_->set_verify_callback(ssl::host_name_verification(base_.host));
        lowest_layer().expires_at(deadline_);
        tls_->async_handshake(ssl::stream_base::client, [self](const boost::system::error_code& ec) {
            if (ec) { self->fail(ec, "tls handshake"); return; }
            self->connected_ = true;
            self->do_write();
        });
    }

    void do_write() {
        auto self = shared_from_this();
        lowest_layer().expires_at(deadline_);
        with_stream([&](auto& stream) {
            http::async_write(stream, *req_, [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) { self->fail(ec, "write"); return; }
                self->do_read();
            });
        });
    }

    void do_read() {
        auto self = shared_from_this();
        parser_.emplace();
        parser_->body_limit(kMaxResponseBody);
        lowest_layer().expires_at(deadline_);
        with_stream([&](auto& stream) {
            http::async_read(stream, buffer_, *parser_, [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) { self->fail(ec, "read"); return; }
                self->finish();
            });
        });
    }

    void finish() {
        HttpResponse res = parser_->release();
        parser_.reset();
        reusable_ = res.keep_alive() && !res.need_eof();
        lowest_layer().expires_never();
        last_used_ = Clock::now();
        req_.reset();
        if (!reusable_) close();
        auto done = std::move(done_);
        done_ = nullptr;
        done({}, std::string(), std::move(res));
    }

    void fail(const boost::system::error_code& ec, const char* stage) {
        reusable_ = false;
        close();
        req_.reset();
        std::string msg = std::string(stage) + ": " + (ec == beast::error::timeout ? std::string("timed out") : ec.message());
        auto done = std::move(done_);
        done_ = nullptr;
        if (done) done(ec, std::move(msg), HttpResponse{});
    }

    void close() {
        connected_ = false;
        boost::system::error_code ignored;
        auto& sock = lowest_layer().socket();
        if (!sock.is_open()) return;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    net::steady_timer timer_;
    BaseUrl base_;
    bool verify_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::string_body>> parser_;
    std::shared_ptr<HttpRequest> req_;
    Done done_;
    Clock::time_point deadline_;
    Clock::time_point last_used_;
    bool connected_ = false;
    bool reusable_ = false;
    bool timed_out_ = false;
};

UpstreamClient::UpstreamClient(net::io_context& ioc, ClientOptions opts)
    : ioc_(ioc), opts_(std::move(opts)), base_(parse_base_url(opts_.base_url)) {
    if (base_.tls) {
        ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        if (opts_.tls_verify) {
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
        } else {
            ssl_ctx_->set_verify_mode(ssl::verify_none);
        }
    }
}

UpstreamClient::~UpstreamClient() {
    shutdown();
}

std::string UpstreamClient::url_for(const std::string& target) const {
    return base_.origin() + base_.path + target;
}

std::size_t UpstreamClient::idle_connections() const {
    std::lock_guard lock(mu_);
    return idle_.size();
}

std::shared_ptr<UpstreamClient::Connection> UpstreamClient::acquire() {
    std::shared_ptr<Connection> found;
    std::vector<std::shared_ptr<Connection>> stale;
    {
        std::lock_guard lock(mu_);
        if (shut_down_) return nullptr;
        auto now = Clock::now();
        while (!idle_.empty() && !found) {
            auto c = std::move(idle_.back());
            idle_.pop_back();
            if (c->usable(now, opts_.idle_ttl)) found = std::move(c);
            else stale.push_back(std::move(c));
        }
    }
    for (auto& c : stale) c->close_async();
    if (found) return found;
    opened_.fetch_add(1);
    return std::make_shared<Connection>(ioc_, ssl_ctx_.get(), base_, opts_.tls_verify);
}

void UpstreamClient::release(const std::shared_ptr<Connection>& conn) {
    if (!conn->reusable()) return;
    {
        std::lock_guard lock(mu_);
        if (!shut_down_ && idle_.size() < opts_.max_idle) {
            idle_.push_back(conn);
            return;
        }
    }
    conn->close_async();
}

void UpstreamClient::shutdown() {
    std::vector<std::shared_ptr<Connection>> idle;
    {
        std::lock_guard lock(mu_);
        if (shut_down_) return;
        shut_down_ = true;
        idle.swap(idle_);
    }
    for (auto& c : idle) c->close_async();
    observability::log_info("upstream_pool_closed", {{"closed", int64_t(idle.size())}});
}

static bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

void UpstreamClient::async_send(UpstreamRequest req, ResponseHandler handler) {
    std::string target = base_.path + req.target;
    send_attempt(std::move(req), std::move(target), Clock::now() + opts_.timeout, kMaxRedirects, std::move(handler));
}

// Redirect hops share the first attempt's deadline.
void UpstreamClient::send_attempt(UpstreamRequest req, std::string target, Clock::time_point deadline, int redirects_left,
                                  ResponseHandler handler) {
    auto conn = acquire();
    if (!conn) {
        net::post(ioc_, [handler = std::move(handler)]() {
            UpstreamResponse out;
            out.ec = net::error::operation_aborted;
            out.error = "upstream client is shut down";
            handler(std::move(out));
        });
        return;
    }

    auto http_req = std::make_shared<HttpRequest>(req.method, target, 11);
    bool default_port = (base_.tls && base_.port == "443") || (!base_.tls && base_.port == "80");
    http_req->set(http::field::host, default_port ? base_.host : base_.host + ":" + base_.port);
    http_req->set(http::field::user_agent, opts_.user_agent);
    http_req->set(http::field::accept, "application/json");
    http_req->set(http::field::content_type, "application/json");
    if (!opts_.api_key.empty()) http_req->set("X-Api-Key", opts_.api_key);
    http_req->keep_alive(true);
    http_req->body() = req.body;
    http_req->prepare_payload();

    auto self = shared_from_this();
    conn->exchange(http_req, deadline,
        [self, conn, req = std::move(req), target = std::move(target), deadline, redirects_left, handler = std::move(handler)](
            boost::system::error_code ec, std::string err, HttpResponse res) mutable {
            UpstreamResponse out;
            if (ec) {
                out.ec = ec;
                out.error = std::move(err);
                handler(std::move(out));
                return;
            }
            self->release(conn);

            const int status = res.result_int();
            auto location = res[http::field::location];
            if (is_redirect(status) && !location.empty()) {
                auto next = resolve_redirect(self->base_, std::string_view(location.data(), location.size()), target);
                if (next) {
                    if (redirects_left <= 0) {
                        out.ec = boost::system::errc::make_error_code(boost::system::errc::protocol_error);
                        out.error = "redirect: too many redirects";
                        handler(std::move(out));
                        return;
                    }
                    if ((status == 303 && req.method != http::verb::head) ||
                        ((status == 301 || status == 302) && req.method == http::verb::post)) {
                        req.method = http::verb::get;
                        req.body.clear();
                    }
                    observability::log_debug("upstream_redirect", {{"status", int64_t(status)}, {"from", target}, {"to", *next}});
                    self->send_attempt(std::move(req), std::move(*next), deadline, redirects_left - 1, std::move(handler));
                    return;
                }
            }

            out.status = status;
            out.content_type = std::string(res[http::field::content_type]);
            out.body = std::move(res.body());
            handler(std::move(out));
        });
}

}
