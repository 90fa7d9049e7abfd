#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Cors.h"
#include "Router.h"
#include <cstdint>
#include <string>

struct ServerOptions {
    std::string address = "0.0.0.0";
    // 0 binds an ephemeral port, see HttpServer::port()
    uint16_t port = 5000;
    bool metrics_enabled = true;
    bool access_log = true;
};

class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const ServerOptions& opts, const Router& router, CorsPolicy cors);
    void run();
    void stop();
    uint16_t port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const Router& router_;
    CorsPolicy cors_;
    ServerOptions opts_;
};
