#include <chregistry/registry/registry_store.h>

#include <chregistry/core/log.h>
#include <chregistry/core/metrics.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace chregistry::registry {
namespace {

// Copies of the registrations in `regs` (except index `skip`) that require `name`.
std::vector<Registration> DependentsOf(const std::vector<Registration>& regs,
                                       const std::string& name,
                                       std::size_t skip = static_cast<std::size_t>(-1)) {
    std::vector<Registration> out;
    for (std::size_t i = 0; i < regs.size(); ++i) {
        if (i != skip && regs[i].DependsOn(name)) {
            out.push_back(regs[i]);
        }
    }
    return out;
}

struct Announcement {
    Patch patch;
    std::vector<Registration> subscribers;
};

} // namespace

RegistryStore::RegistryStore(DependencyNotifier& notifier, StoreOptions opts)
    : notifier_(notifier), opts_(opts) {}

chregistry::Status RegistryStore::Add(Registration reg) {
    return Insert(std::move(reg), InsertMode::upsert, nullptr);
}

chregistry::Status RegistryStore::AddIfAbsent(Registration reg, bool* inserted) {
    return Insert(std::move(reg), InsertMode::if_absent, inserted);
}

chregistry::Status RegistryStore::Insert(Registration reg, InsertMode mode, bool* inserted) {
    if (inserted != nullptr) {
        *inserted = false;
    }
    if (reg.service_name.empty() || reg.service_url.empty()) {
        return chregistry::Status(chregistry::StatusCode::invalid_argument,
                                  "registration needs ServiceName and ServiceUrl");
    }

    const auto entry = EntryOf(reg);
    Patch catch_up;
    Announcement announce;
    std::optional<PatchEntry> replaced;
    std::size_t size = 0;

    try {
        std::unique_lock<std::shared_mutex> lk(mu_);

        auto self = regs_.size();
        auto it = std::find_if(regs_.begin(), regs_.end(),
            [&](const Registration& r) { return r.service_url == reg.service_url; });
        if (it != regs_.end() && mode == InsertMode::if_absent) {
            chregistry::log::debug("{} already registered at {}, keeping it", it->service_name, reg.service_url);
            return chregistry::Status::Ok();
        }
        if (it != regs_.end() && opts_.unique_service_url) {
            self = static_cast<std::size_t>(it - regs_.begin());
            replaced = EntryOf(*it);
            *it = reg;
        }
        if (self == regs_.size()) {
            regs_.push_back(reg);
        }

        for (std::size_t i = 0; i < regs_.size(); ++i) {
            if (i != self && reg.DependsOn(regs_[i].service_name)) {
                catch_up.added.push_back(EntryOf(regs_[i]));
            }
        }

        // Re-registering the same name at the same url changes nothing for dependents.
        if (!replaced) {
            announce.patch.added.push_back(entry);
            announce.subscribers = DependentsOf(regs_, entry.name, self);
        } else if (!(*replaced == entry)) {
            // Same url under a new name: old name's dependents see a removal, new name's an addition.
            announce.patch.removed.push_back(*replaced);
            announce.patch.added.push_back(entry);
            announce.subscribers = DependentsOf(regs_, entry.name, self);
            for (auto& r : DependentsOf(regs_, replaced->name, self)) {
                if (!r.DependsOn(entry.name)) {
                    announce.subscribers.push_back(std::move(r));
                }
            }
        }
        size = regs_.size();
    } catch (const std::exception& e) {
        chregistry::log::error("add {} ({}) failed: {}", reg.service_name, reg.service_url, e.what());
        return chregistry::Status(chregistry::StatusCode::internal_error, e.what());
    }

    if (inserted != nullptr) {
        *inserted = true;
    }
    PublishSize(size);
    if (replaced) {
        chregistry::log::info("Replaced service {} at {} (was {})", entry.name, entry.url, replaced->name);
    } else {
        chregistry::log::info("Added service {} at {}", entry.name, entry.url);
    }

    chregistry::Status result;
    if (!reg.required_services.empty()) {
        result = notifier_.Deliver(catch_up, reg.service_update_url);
        chregistry::DefaultMetrics()
            .CounterMetric("registry_catchup_total", "Catch-up patches sent to new registrations",
                           chregistry::MetricLabels{{{"result", result.ok() ? "delivered" : "failed"}}})
            .Inc();
        if (!result.ok()) {
            chregistry::log::warn("catch-up patch to {} at {} failed: {}",
                                  reg.service_name, reg.service_update_url, result.ToString());
        }
    }

    notifier_.Notify(announce.patch, announce.subscribers);
    return result;
}

chregistry::Status RegistryStore::Remove(std::string_view service_url) {
    if (service_url.empty()) {
        return chregistry::Status::Ok();
    }

    std::vector<Announcement> announcements;
    std::size_t size = 0;

    try {
        std::unique_lock<std::shared_mutex> lk(mu_);

        auto first = std::stable_partition(regs_.begin(), regs_.end(),
            [&](const Registration& r) { return r.service_url != service_url; });
        if (first == regs_.end()) {
            return chregistry::Status::Ok();
        }

        std::vector<Registration> gone(std::make_move_iterator(first), std::make_move_iterator(regs_.end()));
        regs_.erase(first, regs_.end());

        for (auto& r : gone) {
            Announcement a;
            a.patch.removed.push_back(EntryOf(r));
            a.subscribers = DependentsOf(regs_, r.service_name);
            announcements.push_back(std::move(a));
        }
        size = regs_.size();
    } catch (const std::exception& e) {
        chregistry::log::error("remove {} failed: {}", service_url, e.what());
        return chregistry::Status(chregistry::StatusCode::internal_error, e.what());
    }

    PublishSize(size);
    for (const auto& a : announcements) {
        chregistry::log::info("Removed service {} at {}", a.patch.removed.front().name, a.patch.removed.front().url);
        notifier_.Notify(a.patch, a.subscribers);
    }
    return chregistry::Status::Ok();
}

std::vector<Registration> RegistryStore::Snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return regs_;
}

std::size_t RegistryStore::Size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return regs_.size();
}

void RegistryStore::PublishSize(std::size_t size) const {
    chregistry::DefaultMetrics()
        .GaugeMetric("registry_registrations", "Live registrations")
        .Set(static_cast<double>(size));
}

} // namespace chregistry::registry
