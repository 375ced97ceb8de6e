#include <chtest.hpp>

#include <chregistry/config/config.h>
#include <chregistry/registry/registry_options.h>

using chregistry::config::Config;
using chregistry::registry::ApplyConfig;
using chregistry::registry::RegistryOptions;
using chregistry::registry::RemovalPolicy;

TEST_CASE("Config reads dotted keys from nested objects") {
    auto cfg = Config::Parse(R"({"listen":"127.0.0.1:3000","heartbeat":{"interval_ms":500,"removal":"eager"},
                                 "store":{"unique_service_url":false}})");
    REQUIRE(cfg.ok());

    REQUIRE(cfg.value().Has("heartbeat.interval_ms"));
    REQUIRE(!cfg.value().Has("heartbeat.missing"));
    REQUIRE(!cfg.value().Has("listen.port"));
    REQUIRE(cfg.value().GetInt("heartbeat.interval_ms").value() == 500);
    REQUIRE(cfg.value().GetString("heartbeat.removal").value() == "eager");
    REQUIRE(cfg.value().GetBool("store.unique_service_url").value() == false);

    REQUIRE(cfg.value().GetInt("missing", 7).value() == 7);
    REQUIRE(!cfg.value().GetInt("listen").ok());
    REQUIRE(cfg.value().GetInt("missing").status().code() == chregistry::StatusCode::not_found);
}

TEST_CASE("Config rejects invalid json and non-object roots") {
    REQUIRE(Config::Parse("{").status().code() == chregistry::StatusCode::invalid_argument);
    REQUIRE(!Config::Parse("[1,2]").ok());
    REQUIRE(Config::LoadFile("/nonexistent/registry.json").status().code() == chregistry::StatusCode::not_found);
}

TEST_CASE("An empty config leaves the defaults") {
    auto cfg = Config::Parse("{}");
    REQUIRE(cfg.ok());

    RegistryOptions opt;
    REQUIRE(ApplyConfig(cfg.value(), opt).ok());

    REQUIRE(opt.listen.host == "0.0.0.0");
    REQUIRE(opt.listen.port == 3000);
    REQUIRE(opt.heartbeat.interval == std::chrono::milliseconds(3000));
    REQUIRE(opt.heartbeat.max_attempts == 3);
    REQUIRE(opt.heartbeat.retry_pause == std::chrono::milliseconds(1000));
    REQUIRE(opt.heartbeat.removal == RemovalPolicy::eager);
    REQUIRE(opt.notifier.timeout == std::chrono::milliseconds(3000));
    REQUIRE(opt.store.unique_service_url);
}

TEST_CASE("ApplyConfig overlays every section") {
    auto cfg = Config::Parse(R"({
        "listen": "127.0.0.1:8500",
        "io_threads": 2,
        "log_level": "debug",
        "http_client": {"timeout_ms": 750},
        "heartbeat": {"interval_ms": 100, "max_attempts": 5, "retry_pause_ms": 0,
                      "removal": "after_retries", "probe_threads": 3},
        "notifier": {"workers": 2, "max_pending": 16, "drain_timeout_ms": 10},
        "store": {"unique_service_url": false}
    })");
    REQUIRE(cfg.ok());

    RegistryOptions opt;
    REQUIRE(ApplyConfig(cfg.value(), opt).ok());

    REQUIRE(opt.listen.port == 8500);
    REQUIRE(opt.io_threads == 2);
    REQUIRE(opt.log_level == "debug");
    REQUIRE(opt.heartbeat.timeout == std::chrono::milliseconds(750));
    REQUIRE(opt.notifier.timeout == std::chrono::milliseconds(750));
    REQUIRE(opt.heartbeat.interval == std::chrono::milliseconds(100));
    REQUIRE(opt.heartbeat.max_attempts == 5);
    REQUIRE(opt.heartbeat.retry_pause == std::chrono::milliseconds(0));
    REQUIRE(opt.heartbeat.removal == RemovalPolicy::after_retries);
    REQUIRE(opt.heartbeat.probe_threads == 3);
    REQUIRE(opt.notifier.workers == 2);
    REQUIRE(opt.notifier.max_pending == 16);
    REQUIRE(opt.notifier.drain_timeout == std::chrono::milliseconds(10));
    REQUIRE(!opt.store.unique_service_url);
}

TEST_CASE("ApplyConfig rejects bad values") {
    const char* bad[] = {
        R"({"listen":"nowhere"})",
        R"({"log_level":"loud"})",
        R"({"heartbeat":{"interval_ms":0}})",
        R"({"heartbeat":{"max_attempts":"three"}})",
        R"({"heartbeat":{"removal":"never"}})",
        R"({"notifier":{"workers":0}})",
        R"({"http_client":{"timeout_ms":-1}})",
        R"({"store":{"unique_service_url":"yes"}})",
    };
    for (const char* text : bad) {
        auto cfg = Config::Parse(text);
        REQUIRE(cfg.ok());
        RegistryOptions opt;
        REQUIRE(ApplyConfig(cfg.value(), opt).code() == chregistry::StatusCode::invalid_argument);
    }
}
