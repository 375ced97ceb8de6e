#include <chregistry/registry/registration_gateway.h>

#include <chregistry/core/log.h>

#include <chjson/chjson.hpp>

#include <string_view>

namespace chregistry::registry {
namespace {

void SetError(chregistry::http::Response& resp, unsigned status, const chregistry::Status& st) {
    chjson::value j(chjson::value::object{
        {"error", chjson::value(std::string(chregistry::StatusCodeName(st.code())))},
        {"message", chjson::value(st.message())},
    });
    resp.SetJson(status, chjson::dump(j));
}

std::string_view Trim(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto b = s.find_first_not_of(kSpace);
    if (b == std::string_view::npos) {
        return {};
    }
    auto e = s.find_last_not_of(kSpace);
    return s.substr(b, e - b + 1);
}

} // namespace

void RegistrationGateway::RegisterRoutes(chregistry::http::Router& router) {
    router.Post(kServicesPath, [this](const chregistry::http::Request& req, chregistry::http::Response& resp) {
        HandleRegister(req, resp);
    });
    router.Delete(kServicesPath, [this](const chregistry::http::Request& req, chregistry::http::Response& resp) {
        HandleDeregister(req, resp);
    });
}

void RegistrationGateway::HandleRegister(const chregistry::http::Request& req, chregistry::http::Response& resp) {
    auto reg = DecodeRegistration(req.Body());
    if (!reg.ok()) {
        chregistry::log::warn("rejected registration from {}: {}", req.remote, reg.status().message());
        SetError(resp, 400, reg.status());
        return;
    }

    chregistry::log::info("Add service {} with url {}", reg.value().service_name, reg.value().service_url);
    auto st = store_.Add(std::move(reg).value());
    if (!st.ok()) {
        SetError(resp, 400, st);
        return;
    }
    resp.status = 200;
    resp.body.clear();
}

void RegistrationGateway::HandleDeregister(const chregistry::http::Request& req, chregistry::http::Response& resp) {
    std::string url(Trim(req.Body()));
    chregistry::log::info("Remove service with url {}", url);

    auto st = store_.Remove(url);
    if (!st.ok()) {
        chregistry::log::error("remove {} failed: {}", url, st.ToString());
        SetError(resp, 500, st);
        return;
    }
    resp.status = 200;
    resp.body.clear();
}

} // namespace chregistry::registry
