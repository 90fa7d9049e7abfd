#pragma once

#include "Upstream.h"
#include "net/Url.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace upstream {

struct ClientOptions {
    std::string base_url;
    std::string api_key;
    std::chrono::seconds timeout{30};
    std::size_t max_idle = 16;
    std::chrono::seconds idle_ttl{15};
    bool tls_verify = true;
    std::string user_agent = "scheduling-gateway/1.0";
};

// HTTP(S) client for the scheduling API. One instance per process; idle
// keep-alive connections are pooled and shared by all inbound requests.
class UpstreamClient : public Upstream, public std::enable_shared_from_this<UpstreamClient> {
public:
    // Throws std::invalid_argument for an unusable base URL.
    UpstreamClient(boost::asio::io_context& ioc, ClientOptions opts);
    ~UpstreamClient() override;

    void async_send(UpstreamRequest req, ResponseHandler handler) override;
    std::string url_for(const std::string& target) const override;

    // Closes idle connections; later calls fail with operation_aborted.
    void shutdown();

    std::size_t idle_connections() const;
    uint64_t connections_opened() const { return opened_.load(); }

private:
    class Connection;
    std::shared_ptr<Connection> acquire();
    void release(const std::shared_ptr<Connection>& conn);
    void send_attempt(UpstreamRequest req, std::string target, std::chrono::steady_clock::time_point deadline, int redirects_left,
                      ResponseHandler handler);

    boost::asio::io_context& ioc_;
    ClientOptions opts_;
    BaseUrl base_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    mutable std::mutex mu_;
    std::vector<std::shared_ptr<Connection>> idle_;
    bool shut_down_ = false;
    std::atomic<uint64_t> opened_{0};
};

}
