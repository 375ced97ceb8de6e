#include <chregistry/http/router.h>

#include <algorithm>

namespace chregistry::http {

void Router::Use(Middleware mw) {
    middleware_.push_back(std::move(mw));
}

void Router::AddRoute(boost::beast::http::verb method, std::string path, Handler handler) {
    auto& table = paths_[std::move(path)];
    auto it = std::find_if(table.begin(), table.end(), [&](const auto& e) { return e.first == method; });
    if (it != table.end()) {
        it->second = std::move(handler);
        return;
    }
    table.emplace_back(method, std::move(handler));
}

const Handler* Router::Find(const MethodTable& table, boost::beast::http::verb method) const {
    for (const auto& [m, h] : table) {
        if (m == method) {
            return &h;
        }
    }
    return nullptr;
}

std::string Router::AllowedMethods(const std::string& path) const {
    std::string out;
    auto it = paths_.find(path);
    if (it == paths_.end()) {
        return out;
    }
    for (const auto& e : it->second) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::string(boost::beast::http::to_string(e.first));
    }
    return out;
}

void Router::Handle(const Request& req, Response& resp) const {
    auto path_it = paths_.find(req.path);
    if (path_it == paths_.end()) {
        resp.SetJson(404, "{\"error\":\"not_found\"}");
        return;
    }

    const Handler* handler = Find(path_it->second, req.raw.method());
    if (handler == nullptr) {
        resp.headers["Allow"] = AllowedMethods(req.path);
        resp.SetJson(405, "{\"error\":\"method_not_allowed\"}");
        return;
    }

    std::size_t idx = 0;
    std::function<void()> run;
    run = [&]() {
        if (idx < middleware_.size()) {
            auto& mw = middleware_[idx++];
            mw(req, resp, run);
            return;
        }
        (*handler)(req, resp);
    };

    run();
}

} // namespace chregistry::http
