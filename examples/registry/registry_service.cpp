#include <chregistry/config/config.h>
#include <chregistry/core/log.h>
#include <chregistry/core/metrics.h>
#include <chregistry/http/http_client.h>
#include <chregistry/http/http_server.h>
#include <chregistry/http/router.h>
#include <chregistry/registry/dependency_notifier.h>
#include <chregistry/registry/heartbeat_monitor.h>
#include <chregistry/registry/registration_gateway.h>
#include <chregistry/registry/registry_options.h>
#include <chregistry/registry/registry_store.h>
#include <chregistry/runtime/app.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

// The App owns services through shared_ptr; the notifier and monitor are owned by main.
template <class T>
std::shared_ptr<chregistry::IService> Borrow(T& service) {
    return std::shared_ptr<chregistry::IService>(&service, [](chregistry::IService*) {});
}

void Usage() {
    std::cerr << "usage: chregistry_service [--config file.json] [--listen host:port] [--threads n]\n"
                 "                          [--log level] [--heartbeat-ms n]\n";
}

} // namespace

int main(int argc, char** argv) {
    chregistry::registry::RegistryOptions opt;

    // The config file is applied first so that flags override it.
    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            auto cfg = chregistry::config::Config::LoadFile(argv[++i]);
            if (!cfg.ok()) {
                std::cerr << "Failed to load config: " << cfg.status().message() << "\n";
                return 2;
            }
            if (auto st = chregistry::registry::ApplyConfig(cfg.value(), opt); !st.ok()) {
                std::cerr << "Invalid config: " << st.message() << "\n";
                return 2;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            ++i;
        } else if (a == "--threads" && i + 1 < argc) {
            opt.io_threads = static_cast<std::size_t>(std::atoi(argv[++i]));
        } else if (a == "--listen" && i + 1 < argc) {
            if (!chregistry::http::ParseListenAddress(argv[++i], opt.listen)) {
                std::cerr << "Invalid --listen, expected host:port\n";
                return 2;
            }
        } else if (a == "--log" && i + 1 < argc) {
            opt.log_level = argv[++i];
        } else if (a == "--heartbeat-ms" && i + 1 < argc) {
            int ms = std::atoi(argv[++i]);
            if (ms <= 0) {
                std::cerr << "Invalid --heartbeat-ms\n";
                return 2;
            }
            opt.heartbeat.interval = std::chrono::milliseconds(ms);
        } else if (a == "--help" || a == "-h") {
            Usage();
            return 0;
        } else {
            Usage();
            return 2;
        }
    }

    chregistry::App app(chregistry::AppOptions{opt.io_threads, opt.log_level});

    chregistry::http::HttpClient client;
    chregistry::registry::DependencyNotifier notifier(client, opt.notifier);
    chregistry::registry::RegistryStore store(notifier, opt.store);
    chregistry::registry::HeartbeatMonitor monitor(store, client, opt.heartbeat);
    chregistry::registry::RegistrationGateway gateway(store);

    chregistry::http::Router r;
    gateway.RegisterRoutes(r);

    r.Get("/health", [](const chregistry::http::Request&, chregistry::http::Response& resp) {
        resp.status = 200;
        resp.content_type = "text/plain; charset=utf-8";
        resp.body = "ok";
    });

    r.Get("/metrics", [](const chregistry::http::Request&, chregistry::http::Response& resp) {
        resp.status = 200;
        resp.content_type = "text/plain; version=0.0.4; charset=utf-8";
        resp.body = chregistry::DefaultMetrics().ToPrometheusText();
    });

    auto& ioc = app.Io().Next();
    auto server = std::make_shared<chregistry::http::HttpServer>(ioc, opt.listen, std::move(r));

    // Stopped in reverse: server, monitor, then the notifier drains.
    app.AddService(Borrow(notifier));
    app.AddService(Borrow(monitor));
    app.AddService(server);

    chregistry::log::info("Registry service: http://{}:{}{} (heartbeat every {} ms, removal={})",
                          opt.listen.host, opt.listen.port, chregistry::registry::kServicesPath,
                          opt.heartbeat.interval.count(),
                          chregistry::registry::RemovalPolicyName(opt.heartbeat.removal));
    chregistry::log::info("Press Ctrl+C to stop.");
    int rc = app.Run();
    chregistry::log::info("Shutting down registry service.");
    return rc;
}
