#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <chregistry/core/status.h>
#include <chregistry/registry/dependency_notifier.h>
#include <chregistry/registry/registration.h>

namespace chregistry::registry {

struct StoreOptions {
    // Add() with an already-registered ServiceUrl replaces that entry instead of
    // appending a duplicate.
    bool unique_service_url = true;
};

// The set of live registrations. One reader/writer lock guards the sequence;
// it is never held across network I/O. Patches are computed under the lock and
// delivered after it is released.
class RegistryStore {
public:
    RegistryStore(DependencyNotifier& notifier, StoreOptions opts = {});

    RegistryStore(const RegistryStore&) = delete;
    RegistryStore& operator=(const RegistryStore&) = delete;

    // Thread-safe. Stores reg, sends it the catch-up patch of live services it
    // requires (synchronously, only when it requires any), then announces it to
    // its dependents. A failed catch-up is returned as unavailable/timeout; the
    // registration is kept either way.
    chregistry::Status Add(Registration reg);

    // Thread-safe. Add() that leaves an existing registration with the same
    // ServiceUrl untouched; the check and the insert share one lock hold.
    // inserted (optional) reports whether reg was stored.
    chregistry::Status AddIfAbsent(Registration reg, bool* inserted = nullptr);

    // Thread-safe. Removes every registration with this ServiceUrl and announces
    // each removal. An unknown url is a no-op.
    chregistry::Status Remove(std::string_view service_url);

    // Thread-safe. Copy of the current registrations in insertion order.
    std::vector<Registration> Snapshot() const;

    std::size_t Size() const;

private:
    enum class InsertMode {
        upsert,
        if_absent,
    };

    chregistry::Status Insert(Registration reg, InsertMode mode, bool* inserted);
    void PublishSize(std::size_t size) const;

    DependencyNotifier& notifier_;
    StoreOptions opts_;

    mutable std::shared_mutex mu_;
    std::vector<Registration> regs_;
};

} // namespace chregistry::registry
