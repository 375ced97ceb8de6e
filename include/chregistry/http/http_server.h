#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>

#include <chregistry/http/router.h>
#include <chregistry/runtime/app.h>

namespace chregistry::http {

struct ListenAddress {
    std::string host;
    std::uint16_t port = 0;
};

// Parses "host:port".
bool ParseListenAddress(std::string_view s, ListenAddress& out);

struct HttpServerOptions {
    std::size_t body_limit = 64 * 1024;           // registrations are small
    std::chrono::seconds idle_timeout{30};        // keep-alive connections
};

class HttpServer final : public chregistry::IService, public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router, HttpServerOptions opts = {});

    const char* Name() const override { return "http server"; }
    void Start() override;
    void Stop() override;

private:
    void DoAccept();

    boost::asio::io_context& ioc_;
    ListenAddress addr_;
    Router router_;
    HttpServerOptions opts_;

    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
};

} // namespace chregistry::http
