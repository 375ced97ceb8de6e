#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include <chregistry/http/types.h>

namespace chregistry::http {

using Handler = std::function<void(const Request&, Response&)>;
using Next = std::function<void()>;
using Middleware = std::function<void(const Request&, Response&, Next)>;

// Exact-path router. Each path owns a small method table, so a request for a
// known path with an unbound method is told which methods the path accepts.
class Router {
public:
    // Thread-safe for read after construction. Build routes before serving.
    void Use(Middleware mw);

    // Binding the same method and path twice replaces the earlier handler.
    void AddRoute(boost::beast::http::verb method, std::string path, Handler handler);

    void Get(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::get, std::move(path), std::move(handler)); }
    void Post(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::post, std::move(path), std::move(handler)); }
    void Delete(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::delete_, std::move(path), std::move(handler)); }

    // 404 for an unknown path; 405 with an Allow header for a known path
    // without a handler for the method. Middleware runs only for bound routes.
    void Handle(const Request& req, Response& resp) const;

    // Comma-separated methods bound on path, in binding order; empty if unknown.
    std::string AllowedMethods(const std::string& path) const;

private:
    using MethodTable = std::vector<std::pair<boost::beast::http::verb, Handler>>;

    const Handler* Find(const MethodTable& table, boost::beast::http::verb method) const;

    std::vector<Middleware> middleware_;
    std::unordered_map<std::string, MethodTable> paths_;
};

} // namespace chregistry::http
