#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <chregistry/core/status.h>
#include <chregistry/http/http_client.h>
#include <chregistry/registry/registration.h>
#include <chregistry/runtime/app.h>
#include <chregistry/runtime/io_context_pool.h>

namespace chregistry::registry {

struct NotifierOptions {
    std::size_t workers = 4;
    std::size_t max_pending = 1024;                  // queued or in-flight deliveries
    std::chrono::milliseconds timeout{3000};         // per POST
    std::chrono::milliseconds drain_timeout{2000};   // how long Stop() waits
};

// Pushes patches to dependents' ServiceUpdateUrl. Fan-out is best-effort: one
// pool task per subscriber, no retries, failures only logged and counted.
class DependencyNotifier final : public chregistry::IService {
public:
    DependencyNotifier(chregistry::http::IHttpTransport& transport, NotifierOptions opts);
    ~DependencyNotifier() override;

    DependencyNotifier(const DependencyNotifier&) = delete;
    DependencyNotifier& operator=(const DependencyNotifier&) = delete;

    const char* Name() const override { return "dependency notifier"; }
    void Start() override;
    void Stop() override;

    // Thread-safe. Returns once the deliveries are queued; does not wait for them.
    void Notify(const Patch& full, const std::vector<Registration>& subscribers);

    // Thread-safe. Synchronous POST of one patch (catch-up path and pool tasks).
    chregistry::Status Deliver(const Patch& patch, const std::string& url);

    // Blocks until every queued delivery has finished.
    bool WaitIdle(std::chrono::milliseconds timeout);

private:
    chregistry::http::IHttpTransport& transport_;
    NotifierOptions opts_;
    chregistry::IoContextPool pool_;
    std::atomic<bool> stopped_{false};
};

} // namespace chregistry::registry
