#include <chtest.hpp>

#include <chregistry/http/router.h>
#include <chregistry/registry/dependency_notifier.h>
#include <chregistry/registry/registration_gateway.h>
#include <chregistry/registry/registry_store.h>

#include "fake_transport.h"

using namespace chregistry::registry;
using chregistry::testing::FakeTransport;

namespace {

struct Fixture {
    Fixture() : notifier(transport, NotifierOptions{}), store(notifier), gateway(store) {
        notifier.Start();
        gateway.RegisterRoutes(router);
    }

    chregistry::http::Response Call(boost::beast::http::verb method, std::string body) {
        chregistry::http::Request req;
        req.raw.method(method);
        req.raw.body() = std::move(body);
        req.path = kServicesPath;
        req.remote = "127.0.0.1:50000";

        chregistry::http::Response resp;
        router.Handle(req, resp);
        return resp;
    }

    FakeTransport transport;
    DependencyNotifier notifier;
    RegistryStore store;
    RegistrationGateway gateway;
    chregistry::http::Router router;
};

constexpr const char* kLogService =
    R"({"ServiceName":"Log Service","ServiceUrl":"http://localhost:4000",
        "RequiredServices":[],"ServiceUpdateUrl":"http://localhost:4000/services",
        "HeartbeatUrl":"http://localhost:4000/heartbeat"})";

} // namespace

TEST_CASE("POST /services registers a service") {
    Fixture f;
    auto resp = f.Call(boost::beast::http::verb::post, kLogService);

    REQUIRE(resp.status == 200);
    REQUIRE(resp.body.empty());
    REQUIRE(f.store.Size() == 1);
    REQUIRE(f.store.Snapshot()[0].service_name == "Log Service");
}

TEST_CASE("POST /services rejects a bad body with 400") {
    Fixture f;

    auto resp = f.Call(boost::beast::http::verb::post, "{\"ServiceName\":");
    REQUIRE(resp.status == 400);
    REQUIRE(resp.body.find("invalid_argument") != std::string::npos);

    resp = f.Call(boost::beast::http::verb::post, R"({"ServiceName":"x"})");
    REQUIRE(resp.status == 400);
    REQUIRE(f.store.Size() == 0);
}

TEST_CASE("POST /services answers 400 when the catch-up cannot be delivered") {
    Fixture f;
    f.transport.SetPostStatus("http://localhost:6000/services", 0);

    auto resp = f.Call(boost::beast::http::verb::post,
        R"({"ServiceName":"Grading","ServiceUrl":"http://localhost:6000","RequiredServices":["Log Service"],
            "ServiceUpdateUrl":"http://localhost:6000/services"})");

    REQUIRE(resp.status == 400);
    REQUIRE(f.store.Size() == 1);
}

TEST_CASE("DELETE /services removes by url") {
    Fixture f;
    REQUIRE(f.Call(boost::beast::http::verb::post, kLogService).status == 200);

    auto resp = f.Call(boost::beast::http::verb::delete_, "http://localhost:4000\n");
    REQUIRE(resp.status == 200);
    REQUIRE(f.store.Size() == 0);

    // Unknown urls are not an error.
    REQUIRE(f.Call(boost::beast::http::verb::delete_, "http://localhost:9999").status == 200);
}

TEST_CASE("Other methods on /services are 405") {
    Fixture f;
    REQUIRE(f.Call(boost::beast::http::verb::get, "").status == 405);
    REQUIRE(f.Call(boost::beast::http::verb::put, kLogService).status == 405);
    REQUIRE(f.store.Size() == 0);
}
