#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <chregistry/core/status.h>

namespace chregistry::http {

struct HttpClientResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

// Pieces of an "http://host[:port][/target]" URL.
struct HttpUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

// Only plain http is supported; anything else is invalid_argument.
chregistry::Result<HttpUrl> ParseHttpUrl(std::string_view url);

// Outbound HTTP used by the registry core. Implementations must be thread-safe.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual chregistry::Result<HttpClientResponse> Get(
        const std::string& url,
        std::chrono::milliseconds timeout) = 0;

    virtual chregistry::Result<HttpClientResponse> Post(
        const std::string& url,
        std::string body,
        std::string content_type,
        std::chrono::milliseconds timeout) = 0;
};

class HttpClient final : public IHttpTransport {
public:
    // Thread-safe: each call uses a local io_context.
    chregistry::Result<HttpClientResponse> Get(
        const std::string& url,
        std::chrono::milliseconds timeout) override;

    chregistry::Result<HttpClientResponse> Post(
        const std::string& url,
        std::string body,
        std::string content_type,
        std::chrono::milliseconds timeout) override;
};

} // namespace chregistry::http
