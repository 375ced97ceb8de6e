#include <chregistry/registry/heartbeat_monitor.h>

#include <chregistry/core/log.h>
#include <chregistry/core/metrics.h>

#include <exception>
#include <system_error>
#include <vector>

namespace chregistry::registry {
namespace {

void CountProbe(const char* result) {
    chregistry::DefaultMetrics()
        .CounterMetric("registry_heartbeat_probes_total", "Heartbeat probe attempts and outcomes",
                       chregistry::MetricLabels{{{"result", result}}})
        .Inc();
}

} // namespace

chregistry::Result<RemovalPolicy> ParseRemovalPolicy(std::string_view s) {
    if (s == "eager") {
        return RemovalPolicy::eager;
    }
    if (s == "after_retries") {
        return RemovalPolicy::after_retries;
    }
    return chregistry::Status(chregistry::StatusCode::invalid_argument,
                              "removal policy must be eager or after_retries");
}

const char* RemovalPolicyName(RemovalPolicy p) {
    switch (p) {
        case RemovalPolicy::eager: return "eager";
        case RemovalPolicy::after_retries: return "after_retries";
    }
    return "unknown";
}

const char* ProbeOutcomeName(ProbeOutcome o) {
    switch (o) {
        case ProbeOutcome::healthy: return "healthy";
        case ProbeOutcome::recovered: return "recovered";
        case ProbeOutcome::removed: return "removed";
        case ProbeOutcome::skipped: return "skipped";
        case ProbeOutcome::cancelled: return "cancelled";
    }
    return "unknown";
}

HeartbeatMonitor::HeartbeatMonitor(RegistryStore& store, chregistry::http::IHttpTransport& transport, HeartbeatOptions opts)
    : store_(store),
      transport_(transport),
      opts_(opts),
      retry_(chregistry::resilience::RetryPolicy::Fixed(opts.max_attempts, opts.retry_pause)) {
    if (opts_.probe_threads > 0) {
        probes_ = std::make_unique<chregistry::IoContextPool>("heartbeat", opts_.probe_threads);
    }
}

HeartbeatMonitor::~HeartbeatMonitor() {
    Stop();
}

void HeartbeatMonitor::Start() {
    std::call_once(start_once_, [this] {
        if (stopping()) {
            return;
        }
        if (probes_) {
            probes_->Start();
        }
        loop_ = std::thread([this] { Loop(); });
        chregistry::log::info("Heartbeat monitor started (interval={}ms, attempts={}, pause={}ms, removal={})",
                              opts_.interval.count(), retry_.max_attempts(), opts_.retry_pause.count(),
                              RemovalPolicyName(opts_.removal));
    });
}

void HeartbeatMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }
    cv_.notify_all();

    if (loop_.joinable()) {
        loop_.join();
    }
    if (probes_) {
        probes_->Stop();
    }
}

void HeartbeatMonitor::Loop() {
    while (!stopping()) {
        RunWave();
        if (!SleepFor(opts_.interval)) {
            break;
        }
    }
}

bool HeartbeatMonitor::SleepFor(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, d, [&] { return stopping(); });
}

std::size_t HeartbeatMonitor::RunWave() {
    auto regs = store_.Snapshot();
    if (regs.empty() || stopping()) {
        return 0;
    }

    if (probes_) {
        probes_->Start();
    }
    auto start = std::chrono::steady_clock::now();

    std::size_t posted = 0;
    std::vector<std::thread> probers;
    probers.reserve(regs.size());
    for (auto& reg : regs) {
        auto task = [this, reg = std::move(reg)] { ProbeLogged(reg); };
        if (probes_) {
            if (probes_->Post(task)) {
                ++posted;
            }
            continue;
        }
        try {
            probers.emplace_back(task);
        } catch (const std::system_error& e) {
            chregistry::log::warn("heartbeat: cannot start probe thread ({}), probing inline", e.what());
            task();
        }
        ++posted;
    }
    for (auto& t : probers) {
        t.join();
    }
    if (probes_) {
        probes_->WaitIdle();
    }

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    chregistry::DefaultMetrics()
        .HistogramMetric("registry_heartbeat_wave_ms", "Duration of one heartbeat wave (ms)",
                         {10, 50, 100, 500, 1000, 2000, 5000, 10000})
        .Observe(elapsed);
    chregistry::log::debug("Heartbeat wave probed {} registration(s) in {:.1f} ms", posted, elapsed);
    return posted;
}

void HeartbeatMonitor::ProbeLogged(const Registration& reg) {
    // A failing probe must not take down the wave.
    try {
        Probe(reg);
    } catch (const std::exception& e) {
        chregistry::log::error("heartbeat probe for {} ({}) threw: {}", reg.service_name, reg.service_url, e.what());
    }
}

ProbeOutcome HeartbeatMonitor::Probe(const Registration& reg) {
    if (reg.heartbeat_url.empty()) {
        return ProbeOutcome::skipped;
    }

    bool removed = false;
    for (int attempt = 1; attempt <= retry_.max_attempts(); ++attempt) {
        if (attempt > 1 && !SleepFor(retry_.BackoffBeforeAttempt(attempt))) {
            return ProbeOutcome::cancelled;
        }
        if (stopping()) {
            return ProbeOutcome::cancelled;
        }

        auto r = transport_.Get(reg.heartbeat_url, opts_.timeout);
        if (r.ok() && r.value().status == 200) {
            CountProbe("passed");
            if (!removed) {
                chregistry::log::debug("Heartbeat check passed for service {}", reg.service_name);
                return ProbeOutcome::healthy;
            }
            // The service may have registered again meanwhile; that entry is newer than reg.
            bool inserted = false;
            auto st = store_.AddIfAbsent(reg, &inserted);
            if (!st.ok()) {
                chregistry::log::warn("re-adding {} ({}) after recovery: {}", reg.service_name, reg.service_url, st.ToString());
            } else if (!inserted) {
                chregistry::log::info("Service {} re-registered at {} during its heartbeat, keeping that entry",
                                      reg.service_name, reg.service_url);
            }
            chregistry::log::info("Heartbeat recovered for service {} on attempt {}", reg.service_name, attempt);
            CountProbe("recovered");
            return ProbeOutcome::recovered;
        }

        CountProbe("failed");
        chregistry::log::warn("Heartbeat check failed for service {} ({}), attempt {}/{}: {}",
                              reg.service_name, reg.heartbeat_url, attempt, retry_.max_attempts(),
                              r.ok() ? "status " + std::to_string(r.value().status) : r.status().ToString());

        if (opts_.removal == RemovalPolicy::eager && !removed) {
            auto st = store_.Remove(reg.service_url);
            if (!st.ok()) {
                chregistry::log::error("removing {} after failed heartbeat: {}", reg.service_url, st.ToString());
            }
            removed = true;
        }
    }

    if (!removed) {
        auto st = store_.Remove(reg.service_url);
        if (!st.ok()) {
            chregistry::log::error("removing {} after failed heartbeat: {}", reg.service_url, st.ToString());
        }
    }
    chregistry::log::warn("Service {} at {} removed after {} failed heartbeat(s)",
                          reg.service_name, reg.service_url, retry_.max_attempts());
    return ProbeOutcome::removed;
}

} // namespace chregistry::registry
