#include <chregistry/registry/dependency_notifier.h>

#include <chregistry/core/log.h>
#include <chregistry/core/metrics.h>

#include <algorithm>

namespace chregistry::registry {
namespace {

chregistry::Counter& Deliveries(const char* result) {
    return chregistry::DefaultMetrics().CounterMetric(
        "registry_notifications_total",
        "Patch deliveries to dependents",
        chregistry::MetricLabels{{{"result", result}}});
}

} // namespace

DependencyNotifier::DependencyNotifier(chregistry::http::IHttpTransport& transport, NotifierOptions opts)
    : transport_(transport),
      opts_(opts),
      pool_("notifier", std::max<std::size_t>(opts.workers, 1), opts.max_pending) {}

DependencyNotifier::~DependencyNotifier() {
    Stop();
}

void DependencyNotifier::Start() {
    stopped_.store(false, std::memory_order_release);
    pool_.Start();
}

void DependencyNotifier::Stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (!pool_.WaitIdle(opts_.drain_timeout)) {
        chregistry::log::warn("notifier: {} delivery(ies) still pending after {} ms drain",
                              pool_.Pending(), opts_.drain_timeout.count());
    }
    auto abandoned = pool_.Stop();
    if (abandoned > 0) {
        Deliveries("abandoned").Inc(static_cast<std::int64_t>(abandoned));
    }
}

void DependencyNotifier::Notify(const Patch& full, const std::vector<Registration>& subscribers) {
    if (full.empty()) {
        return;
    }

    for (const auto& sub : subscribers) {
        auto sub_patch = FilterPatch(full, sub.required_services);
        if (sub_patch.empty()) {
            continue;
        }
        if (sub.service_update_url.empty()) {
            chregistry::log::warn("notifier: {} ({}) depends on updates but has no ServiceUpdateUrl",
                                  sub.service_name, sub.service_url);
            continue;
        }

        bool queued = !stopped_.load(std::memory_order_acquire) &&
            pool_.Post([this, patch = std::move(sub_patch), url = sub.service_update_url, name = sub.service_name] {
                auto st = Deliver(patch, url);
                if (!st.ok()) {
                    chregistry::log::warn("notifier: patch to {} at {} failed: {}", name, url, st.ToString());
                    Deliveries("failed").Inc();
                    return;
                }
                Deliveries("delivered").Inc();
            });
        if (!queued) {
            chregistry::log::warn("notifier: dropped patch for {} at {} (stopped or {} pending)",
                                  sub.service_name, sub.service_update_url, opts_.max_pending);
            Deliveries("dropped").Inc();
        }
    }
}

chregistry::Status DependencyNotifier::Deliver(const Patch& patch, const std::string& url) {
    auto r = transport_.Post(url, EncodePatch(patch), "application/json", opts_.timeout);
    if (!r.ok()) {
        return r.status();
    }
    auto code = r.value().status;
    if (code < 200 || code > 299) {
        return chregistry::Status(chregistry::StatusCode::unavailable,
                                  "failed to send patch, status " + std::to_string(code));
    }
    return chregistry::Status::Ok();
}

bool DependencyNotifier::WaitIdle(std::chrono::milliseconds timeout) {
    return pool_.WaitIdle(timeout);
}

} // namespace chregistry::registry
