#include <chregistry/registry/registry_options.h>

#include <chregistry/core/log.h>

namespace chregistry::registry {
namespace {

chregistry::Status OutOfRange(std::string_view key, std::string_view what) {
    return chregistry::Status(chregistry::StatusCode::invalid_argument,
                              std::string(key) + ": " + std::string(what));
}

// Reads an int key that must be >= min; absent keys keep `out`.
template <class T>
chregistry::Status ReadAtLeast(const chregistry::config::Config& cfg, std::string_view key, int min, T& out) {
    if (!cfg.Has(key)) {
        return chregistry::Status::Ok();
    }
    auto v = cfg.GetInt(key);
    if (!v.ok()) {
        return v.status();
    }
    if (v.value() < min) {
        return OutOfRange(key, "must be >= " + std::to_string(min));
    }
    out = T(v.value());
    return chregistry::Status::Ok();
}

} // namespace

chregistry::Status ApplyConfig(const chregistry::config::Config& cfg, RegistryOptions& out) {
    if (auto listen = cfg.GetString("listen", ""); !listen.ok()) {
        return listen.status();
    } else if (!listen.value().empty() && !chregistry::http::ParseListenAddress(listen.value(), out.listen)) {
        return OutOfRange("listen", "expected host:port");
    }

    if (auto level = cfg.GetString("log_level", out.log_level); !level.ok()) {
        return level.status();
    } else if (!chregistry::log::IsKnownLevel(level.value())) {
        return OutOfRange("log_level", "unknown level");
    } else {
        out.log_level = level.value();
    }

    chregistry::Status st;
    if (st = ReadAtLeast(cfg, "io_threads", 0, out.io_threads); !st.ok()) {
        return st;
    }

    int timeout_ms = static_cast<int>(out.http_timeout.count());
    if (st = ReadAtLeast(cfg, "http_client.timeout_ms", 1, timeout_ms); !st.ok()) {
        return st;
    }
    out.http_timeout = std::chrono::milliseconds(timeout_ms);
    out.heartbeat.timeout = out.http_timeout;
    out.notifier.timeout = out.http_timeout;

    auto& hb = out.heartbeat;
    if (st = ReadAtLeast(cfg, "heartbeat.interval_ms", 1, hb.interval); !st.ok()) {
        return st;
    }
    if (st = ReadAtLeast(cfg, "heartbeat.max_attempts", 1, hb.max_attempts); !st.ok()) {
        return st;
    }
    if (st = ReadAtLeast(cfg, "heartbeat.retry_pause_ms", 0, hb.retry_pause); !st.ok()) {
        return st;
    }
    if (st = ReadAtLeast(cfg, "heartbeat.probe_threads", 0, hb.probe_threads); !st.ok()) {
        return st;
    }
    if (cfg.Has("heartbeat.removal")) {
        auto s = cfg.GetString("heartbeat.removal");
        if (!s.ok()) {
            return s.status();
        }
        auto policy = ParseRemovalPolicy(s.value());
        if (!policy.ok()) {
            return policy.status();
        }
        hb.removal = policy.value();
    }

    auto& n = out.notifier;
    if (st = ReadAtLeast(cfg, "notifier.workers", 1, n.workers); !st.ok()) {
        return st;
    }
    if (st = ReadAtLeast(cfg, "notifier.max_pending", 1, n.max_pending); !st.ok()) {
        return st;
    }
    if (st = ReadAtLeast(cfg, "notifier.drain_timeout_ms", 0, n.drain_timeout); !st.ok()) {
        return st;
    }

    if (auto unique = cfg.GetBool("store.unique_service_url", out.store.unique_service_url); !unique.ok()) {
        return unique.status();
    } else {
        out.store.unique_service_url = unique.value();
    }

    return chregistry::Status::Ok();
}

} // namespace chregistry::registry
