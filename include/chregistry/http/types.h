#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/http.hpp>

namespace chregistry::http {

namespace beast_http = boost::beast::http;

struct Request {
    beast_http::request<beast_http::string_body> raw;
    std::string path; // target without query
    std::unordered_map<std::string, std::string> query;
    std::string remote; // peer "ip:port", empty when unknown

    std::string_view Query(std::string_view key) const;
    const std::string& Body() const { return raw.body(); }
};

struct Response {
    unsigned status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::unordered_map<std::string, std::string> headers;

    void SetJson(std::string json);
    void SetJson(unsigned status_code, std::string json);
};

} // namespace chregistry::http
