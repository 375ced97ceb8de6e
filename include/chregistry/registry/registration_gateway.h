#pragma once

#include <string>

#include <chregistry/http/router.h>
#include <chregistry/registry/registry_store.h>

namespace chregistry::registry {

inline constexpr const char* kServicesPath = "/services";

// HTTP front of the store:
//   POST   /services  JSON Registration   -> 200, or 400 on bad body / failed add
//   DELETE /services  raw ServiceUrl body -> 200, or 500 on failed remove
// Any other method on /services is answered 405 by the router.
class RegistrationGateway {
public:
    explicit RegistrationGateway(RegistryStore& store) : store_(store) {}

    void RegisterRoutes(chregistry::http::Router& router);

    void HandleRegister(const chregistry::http::Request& req, chregistry::http::Response& resp);
    void HandleDeregister(const chregistry::http::Request& req, chregistry::http::Response& resp);

private:
    RegistryStore& store_;
};

} // namespace chregistry::registry
