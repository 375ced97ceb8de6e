#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include <chregistry/core/status.h>
#include <chregistry/http/http_client.h>
#include <chregistry/registry/registration.h>
#include <chregistry/registry/registry_store.h>
#include <chregistry/resilience/retry.h>
#include <chregistry/runtime/app.h>
#include <chregistry/runtime/io_context_pool.h>

namespace chregistry::registry {

enum class RemovalPolicy {
    eager = 0,      // remove on the first failed attempt, re-add if a later attempt passes
    after_retries,  // remove only once every attempt failed
};

chregistry::Result<RemovalPolicy> ParseRemovalPolicy(std::string_view s);
const char* RemovalPolicyName(RemovalPolicy p);

struct HeartbeatOptions {
    std::chrono::milliseconds interval{3000};
    int max_attempts = 3;
    std::chrono::milliseconds retry_pause{1000};
    std::chrono::milliseconds timeout{3000}; // per GET
    RemovalPolicy removal = RemovalPolicy::eager;
    // 0: one probe thread per registration each wave. Otherwise a fixed pool
    // of this many threads caps how many probes run at once.
    std::size_t probe_threads = 0;
};

enum class ProbeOutcome {
    healthy = 0,
    recovered, // removed during this sequence, then re-added
    removed,
    skipped,   // no HeartbeatUrl
    cancelled,
};

const char* ProbeOutcomeName(ProbeOutcome o);

// Periodically probes every registration's HeartbeatUrl in waves: all probes of a
// wave run concurrently, one task per registration, and the wave is joined before
// the next interval starts.
class HeartbeatMonitor final : public chregistry::IService {
public:
    HeartbeatMonitor(RegistryStore& store, chregistry::http::IHttpTransport& transport, HeartbeatOptions opts);
    ~HeartbeatMonitor() override;

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    const char* Name() const override { return "heartbeat monitor"; }

    // Launches the loop thread. Only the first call has any effect.
    void Start() override;

    // Interrupts pauses, joins the running wave and the loop. Idempotent.
    void Stop() override;

    // One synchronous wave over the current snapshot. Returns the number of probes run.
    std::size_t RunWave();

    // Probes one registration through its full attempt sequence.
    ProbeOutcome Probe(const Registration& reg);

    const HeartbeatOptions& options() const { return opts_; }

private:
    void Loop();
    void ProbeLogged(const Registration& reg);

    // Sleeps for d unless stopped first; false when stopped.
    bool SleepFor(std::chrono::milliseconds d);
    bool stopping() const { return stopping_.load(std::memory_order_acquire); }

    RegistryStore& store_;
    chregistry::http::IHttpTransport& transport_;
    HeartbeatOptions opts_;
    chregistry::resilience::RetryPolicy retry_;
    std::unique_ptr<chregistry::IoContextPool> probes_; // only with a probe_threads cap

    std::once_flag start_once_;
    std::thread loop_;
    std::atomic<bool> stopping_{false};
    std::mutex mu_;
    std::condition_variable cv_;
};

} // namespace chregistry::registry
