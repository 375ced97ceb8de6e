#include <chregistry/http/http_client.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>

namespace chregistry::http {
namespace {
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

struct ClientOpState {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};
    boost::asio::steady_timer timer{ioc};
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::response<http::string_body> resp;
    beast::error_code ec;
    bool timed_out = false;
};

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

chregistry::Result<HttpClientResponse> Send(
    http::verb method,
    const std::string& url,
    std::string body,
    std::string content_type,
    std::chrono::milliseconds timeout) {
    auto parsed = ParseHttpUrl(url);
    if (!parsed.ok()) {
        return parsed.status();
    }
    const auto& u = parsed.value();

    ClientOpState st;
    st.req.method(method);
    st.req.version(11);
    st.req.target(u.target);
    st.req.set(http::field::host, u.port == "80" ? u.host : u.host + ":" + u.port);
    st.req.set(http::field::user_agent, "chregistry/0.1");
    st.req.keep_alive(false);
    if (method != http::verb::get) {
        st.req.set(http::field::content_type, content_type);
        st.req.body() = std::move(body);
        st.req.prepare_payload();
    }

    st.timer.expires_after(timeout);
    st.timer.async_wait([&](beast::error_code ec) {
        if (ec) {
            return;
        }
        st.timed_out = true;
        st.resolver.cancel();
        st.stream.cancel();
    });

    auto finish = [&](beast::error_code ec) {
        st.ec = ec;
        st.timer.cancel();
    };

    st.resolver.async_resolve(u.host, u.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return finish(ec);
        }
        st.stream.async_connect(results, [&](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
            if (ec) {
                return finish(ec);
            }
            http::async_write(st.stream, st.req, [&](beast::error_code ec, std::size_t) {
                if (ec) {
                    return finish(ec);
                }
                http::async_read(st.stream, st.buffer, st.resp, [&](beast::error_code ec, std::size_t) {
                    if (!ec) {
                        beast::error_code ec2;
                        st.stream.socket().shutdown(tcp::socket::shutdown_both, ec2);
                    }
                    finish(ec);
                });
            });
        });
    });

    st.ioc.run();

    if (st.timed_out) {
        return chregistry::Status(chregistry::StatusCode::timeout, "http client timeout: " + url);
    }
    if (st.ec) {
        return chregistry::Status(chregistry::StatusCode::unavailable, url + ": " + st.ec.message());
    }

    HttpClientResponse out;
    out.status = static_cast<int>(st.resp.result_int());
    out.body = std::move(st.resp.body());
    if (auto it = st.resp.find(http::field::content_type); it != st.resp.end()) {
        out.content_type = std::string(it->value().data(), it->value().size());
    }
    return out;
}

} // namespace

chregistry::Result<HttpUrl> ParseHttpUrl(std::string_view url) {
    constexpr std::string_view kScheme = "http://";
    if (url.size() < kScheme.size() || !IEquals(url.substr(0, kScheme.size()), kScheme)) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument,
                                  "unsupported url (expected http://): " + std::string(url));
    }
    url.remove_prefix(kScheme.size());

    HttpUrl out;
    auto slash = url.find('/');
    auto authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.target = std::string(url.substr(slash));
    }

    // Bracketed IPv6 literal: [::1]:8080
    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return chregistry::Status(chregistry::StatusCode::invalid_argument, "malformed ipv6 host in url");
        }
        host = authority.substr(1, close - 1);
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return chregistry::Status(chregistry::StatusCode::invalid_argument, "malformed url authority");
            }
            port = rest.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument, "url has no host: " + std::string(url));
    }
    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return chregistry::Status(chregistry::StatusCode::invalid_argument, "url port is not numeric");
        }
        out.port = std::string(port);
    }
    out.host = std::string(host);
    return out;
}

chregistry::Result<HttpClientResponse> HttpClient::Get(const std::string& url, std::chrono::milliseconds timeout) {
    return Send(http::verb::get, url, {}, {}, timeout);
}

chregistry::Result<HttpClientResponse> HttpClient::Post(
    const std::string& url,
    std::string body,
    std::string content_type,
    std::chrono::milliseconds timeout) {
    return Send(http::verb::post, url, std::move(body), std::move(content_type), timeout);
}

} // namespace chregistry::http
