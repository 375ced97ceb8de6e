#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <chregistry/config/config.h>
#include <chregistry/core/status.h>
#include <chregistry/http/http_server.h>
#include <chregistry/registry/dependency_notifier.h>
#include <chregistry/registry/heartbeat_monitor.h>
#include <chregistry/registry/registry_store.h>

namespace chregistry::registry {

// Everything the registry process is configured with; defaults match an empty config.
struct RegistryOptions {
    chregistry::http::ListenAddress listen{"0.0.0.0", 3000};
    std::size_t io_threads = 0;
    std::string log_level = "info";
    std::chrono::milliseconds http_timeout{3000};

    HeartbeatOptions heartbeat;
    NotifierOptions notifier;
    StoreOptions store;
};

// Overlays the keys present in cfg onto out. Wrong types or out-of-range values
// are invalid_argument; out is left partially updated on error.
chregistry::Status ApplyConfig(const chregistry::config::Config& cfg, RegistryOptions& out);

} // namespace chregistry::registry
