#include <chregistry/http/http_server.h>

#include <chregistry/core/log.h>
#include <chregistry/core/metrics.h>
#include <chregistry/http/types.h>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <charconv>
#include <chrono>
#include <optional>
#include <string_view>

namespace chregistry::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

std::string_view ExtractPath(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return target;
    }
    return target.substr(0, q);
}

void ParseQuery(std::string_view target, std::unordered_map<std::string, std::string>& out) {
    auto q = target.find('?');
    if (q == std::string_view::npos || q + 1 >= target.size()) {
        return;
    }

    std::string_view s = target.substr(q + 1);
    while (!s.empty()) {
        auto amp = s.find('&');
        auto part = (amp == std::string_view::npos) ? s : s.substr(0, amp);
        auto eq = part.find('=');
        if (eq != std::string_view::npos) {
            out.emplace(std::string(part.substr(0, eq)), std::string(part.substr(eq + 1)));
        } else if (!part.empty()) {
            out.emplace(std::string(part), "");
        }
        if (amp == std::string_view::npos) {
            break;
        }
        s.remove_prefix(amp + 1);
    }
}

std::string FormatPeer(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) {
        return {};
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Router& router, const HttpServerOptions& opts)
        : peer_(FormatPeer(socket)), stream_(std::move(socket)), router_(router), opts_(opts) {}

    void Run() {
        Read();
    }

private:
    void Read() {
        parser_.emplace();
        parser_->body_limit(opts_.body_limit);
        stream_.expires_after(opts_.idle_timeout);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
            return DoClose();
        }
        if (ec == http::error::body_limit) {
            chregistry::log::warn("request from {} exceeds body limit of {} bytes", peer_, opts_.body_limit);
            return DoClose();
        }
        if (ec) {
            chregistry::log::debug("read from {} failed: {}", peer_, ec.message());
            return;
        }

        auto start = std::chrono::steady_clock::now();

        Request req;
        req.raw = parser_->release();
        req.remote = peer_;
        auto target_sv = std::string_view(req.raw.target().data(), req.raw.target().size());
        req.path = std::string(ExtractPath(target_sv));
        ParseQuery(target_sv, req.query);

        Response resp;
        router_.Handle(req, resp);

        http::response<http::string_body> out{http::status(resp.status), req.raw.version()};
        out.keep_alive(req.raw.keep_alive());
        out.set(http::field::server, "chregistry/0.1");
        out.set(http::field::content_type, resp.content_type);
        for (const auto& h : resp.headers) {
            out.set(h.first, h.second);
        }
        out.body() = std::move(resp.body);
        out.prepare_payload();

        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        chregistry::DefaultMetrics()
            .HistogramMetric("http_server_request_ms", "HTTP server request latency (ms)",
                             {0.5, 1, 5, 10, 50, 100, 500, 1000, 5000},
                             MetricLabels{{{"path", req.path}}})
            .Observe(elapsed);
        chregistry::DefaultMetrics()
            .CounterMetric("http_server_requests_total", "HTTP server requests total",
                           MetricLabels{{{"path", req.path}, {"status", std::to_string(resp.status)}}})
            .Inc(1);

        chregistry::log::debug("{} {} from {} -> {} ({:.2f} ms)",
            std::string_view(req.raw.method_string().data(), req.raw.method_string().size()),
            req.path, peer_, resp.status, elapsed);

        auto sp = std::make_shared<http::response<http::string_body>>(std::move(out));
        http::async_write(stream_, *sp,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<void>, beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }
        if (close) {
            return DoClose();
        }
        Read();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

private:
    std::string peer_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    Router& router_;
    HttpServerOptions opts_;
};

} // namespace

std::string_view Request::Query(std::string_view key) const {
    auto it = query.find(std::string(key));
    if (it == query.end()) {
        return {};
    }
    return it->second;
}

void Response::SetJson(std::string json) {
    content_type = "application/json; charset=utf-8";
    body = std::move(json);
}

void Response::SetJson(unsigned status_code, std::string json) {
    status = status_code;
    SetJson(std::move(json));
}

bool ParseListenAddress(std::string_view s, ListenAddress& out) {
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    auto host = s.substr(0, colon);
    auto port_sv = s.substr(colon + 1);
    if (host.empty() || port_sv.empty()) {
        return false;
    }
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (ec != std::errc() || ptr != port_sv.data() + port_sv.size() || port == 0 || port > 65535) {
        return false;
    }
    out.host = std::string(host);
    out.port = static_cast<std::uint16_t>(port);
    return true;
}

HttpServer::HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router, HttpServerOptions opts)
    : ioc_(ioc), addr_(std::move(addr)), router_(std::move(router)), opts_(opts), acceptor_(ioc) {}

void HttpServer::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    beast::error_code ec;
    auto address = boost::asio::ip::make_address(addr_.host, ec);
    if (ec) {
        chregistry::log::error("invalid listen address {}: {}", addr_.host, ec.message());
        return;
    }
    tcp::endpoint endpoint{address, addr_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        chregistry::log::error("acceptor open failed: {}", ec.message());
        return;
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        chregistry::log::warn("acceptor set_option failed: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        chregistry::log::error("acceptor bind {}:{} failed: {}", addr_.host, addr_.port, ec.message());
        return;
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        chregistry::log::error("acceptor listen failed: {}", ec.message());
        return;
    }

    chregistry::log::info("Registry HTTP server listening on {}:{}", addr_.host, addr_.port);
    DoAccept();
}

void HttpServer::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (self->running_.load(std::memory_order_relaxed)) {
                    chregistry::log::warn("accept failed: {}", ec.message());
                    self->DoAccept();
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), self->router_, self->opts_)->Run();
            self->DoAccept();
        });
}

} // namespace chregistry::http
