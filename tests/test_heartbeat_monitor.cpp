#include <chtest.hpp>

#include <chregistry/registry/dependency_notifier.h>
#include <chregistry/registry/heartbeat_monitor.h>
#include <chregistry/registry/registry_store.h>

#include "fake_transport.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace chregistry::registry;
using chregistry::testing::FakeTransport;
using chregistry::testing::MakeRegistration;

namespace {

HeartbeatOptions FastOptions(RemovalPolicy removal = RemovalPolicy::eager) {
    HeartbeatOptions opt;
    opt.interval = std::chrono::milliseconds(10);
    opt.retry_pause = std::chrono::milliseconds(1);
    opt.timeout = std::chrono::milliseconds(100);
    opt.removal = removal;
    return opt;
}

struct Fixture {
    explicit Fixture(HeartbeatOptions opts = FastOptions())
        : notifier(transport, NotifierOptions{}), store(notifier), monitor(store, transport, opts) {
        notifier.Start();
    }

    FakeTransport transport;
    DependencyNotifier notifier;
    RegistryStore store;
    HeartbeatMonitor monitor;
};

bool StoreHas(const RegistryStore& store, const std::string& url) {
    for (const auto& r : store.Snapshot()) {
        if (r.service_url == url) {
            return true;
        }
    }
    return false;
}

// Counts how many GETs are in flight at once. Each GET waits (bounded) until
// `expected` GETs have arrived, so full concurrency shows up as peak == expected.
struct InFlight {
    explicit InFlight(int expected) : expected(expected) {}

    void Enter(std::chrono::milliseconds hold) {
        std::unique_lock<std::mutex> lk(mu);
        ++arrived;
        ++current;
        peak = std::max(peak, current);
        cv.notify_all();
        cv.wait_for(lk, hold, [&] { return arrived >= expected; });
        --current;
    }

    const int expected;
    std::mutex mu;
    std::condition_variable cv;
    int arrived = 0;
    int current = 0;
    int peak = 0;
};

} // namespace

TEST_CASE("A passing heartbeat keeps the registration") {
    Fixture f;
    auto reg = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(reg).ok());

    REQUIRE(f.monitor.Probe(reg) == ProbeOutcome::healthy);
    REQUIRE(f.transport.GetCalls("http://l/heartbeat") == 1);
    REQUIRE(f.store.Size() == 1);
}

TEST_CASE("Eager removal drops the entry on the first failure and restores it on recovery") {
    Fixture f;
    auto reg = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(reg).ok());
    f.transport.ScriptGet("http://l/heartbeat", {500, 200});

    std::atomic<bool> absent_during_retry{false};
    f.transport.OnGet([&](const std::string&, int call) {
        if (call == 2) {
            absent_during_retry = !StoreHas(f.store, "http://l");
        }
    });

    REQUIRE(f.monitor.Probe(reg) == ProbeOutcome::recovered);
    REQUIRE(absent_during_retry.load());
    REQUIRE(StoreHas(f.store, "http://l"));
    REQUIRE(f.store.Size() == 1);
}

TEST_CASE("Three failed attempts remove the service once") {
    Fixture f;
    auto log = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(log).ok());
    REQUIRE(f.store.Add(MakeRegistration("grades", "http://g", {"log"})).ok());
    f.transport.ScriptGet("http://l/heartbeat", {500, 0, 503});

    REQUIRE(f.monitor.Probe(log) == ProbeOutcome::removed);
    REQUIRE(f.notifier.WaitIdle(std::chrono::seconds(2)));

    REQUIRE(f.transport.GetCalls("http://l/heartbeat") == 3);
    REQUIRE(!StoreHas(f.store, "http://l"));

    int removals = 0;
    for (const auto& p : f.transport.PostsTo("http://g/services")) {
        if (!p.patch.removed.empty()) {
            ++removals;
            REQUIRE(p.patch.removed[0] == (PatchEntry{"log", "http://l"}));
        }
    }
    REQUIRE(removals == 1);
}

TEST_CASE("Removal after retries keeps a flapping service listed") {
    Fixture f(FastOptions(RemovalPolicy::after_retries));
    auto reg = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(reg).ok());
    f.transport.ScriptGet("http://l/heartbeat", {0, 0, 200});

    std::atomic<int> missing{0};
    f.transport.OnGet([&](const std::string&, int) {
        if (!StoreHas(f.store, "http://l")) {
            ++missing;
        }
    });

    REQUIRE(f.monitor.Probe(reg) == ProbeOutcome::healthy);
    REQUIRE(missing.load() == 0);

    f.transport.ScriptGet("http://l/heartbeat", {0, 0, 0});
    REQUIRE(f.monitor.Probe(reg) == ProbeOutcome::removed);
    REQUIRE(f.store.Size() == 0);
}

TEST_CASE("Registrations without a heartbeat url are not probed") {
    Fixture f;
    auto reg = MakeRegistration("log", "http://l");
    reg.heartbeat_url.clear();
    REQUIRE(f.store.Add(reg).ok());
    REQUIRE(f.store.Add(MakeRegistration("grades", "http://g")).ok());

    REQUIRE(f.monitor.Probe(reg) == ProbeOutcome::skipped);
    REQUIRE(f.monitor.RunWave() == 2);
    REQUIRE(f.transport.GetCalls("http://g/heartbeat") == 1);
    REQUIRE(f.store.Size() == 2);
}

TEST_CASE("RunWave probes every registration") {
    Fixture f;
    REQUIRE(f.monitor.RunWave() == 0);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(f.store.Add(MakeRegistration("svc", "http://s" + std::to_string(i))).ok());
    }
    f.transport.ScriptGet("http://s3/heartbeat", {0, 0, 0});

    REQUIRE(f.monitor.RunWave() == 5);
    REQUIRE(f.store.Size() == 4);
    REQUIRE(!StoreHas(f.store, "http://s3"));
}

TEST_CASE("Monitor loop runs waves until stopped") {
    Fixture f;
    REQUIRE(f.store.Add(MakeRegistration("log", "http://l")).ok());

    f.monitor.Start();
    f.monitor.Start(); // no second loop

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (f.transport.GetCalls("http://l/heartbeat") < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(f.transport.GetCalls("http://l/heartbeat") >= 3);

    f.monitor.Stop();
    auto calls = f.transport.GetCalls("http://l/heartbeat");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(f.transport.GetCalls("http://l/heartbeat") == calls);

    f.monitor.Stop();
    f.monitor.Start();
    REQUIRE(f.monitor.RunWave() == 0);
}

TEST_CASE("Stop cancels a probe waiting between attempts") {
    HeartbeatOptions opt = FastOptions(RemovalPolicy::after_retries);
    opt.retry_pause = std::chrono::seconds(30);
    Fixture f(opt);
    auto reg = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(reg).ok());
    f.transport.ScriptGet("http://l/heartbeat", {500});

    ProbeOutcome outcome = ProbeOutcome::healthy;
    std::thread prober([&] { outcome = f.monitor.Probe(reg); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (f.transport.GetCalls("http://l/heartbeat") < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    f.monitor.Stop();
    prober.join();

    REQUIRE(outcome == ProbeOutcome::cancelled);
    REQUIRE(f.store.Size() == 1);
}

TEST_CASE("Removal policy names parse") {
    REQUIRE(ParseRemovalPolicy("eager").value() == RemovalPolicy::eager);
    REQUIRE(ParseRemovalPolicy("after_retries").value() == RemovalPolicy::after_retries);
    REQUIRE(!ParseRemovalPolicy("never").ok());
    REQUIRE(std::string(RemovalPolicyName(RemovalPolicy::after_retries)) == "after_retries");
}

TEST_CASE("Recovery keeps a registration that arrived during the retry pause") {
    Fixture f;
    auto stale = MakeRegistration("log", "http://l");
    REQUIRE(f.store.Add(stale).ok());
    f.transport.ScriptGet("http://l/heartbeat", {500, 200});

    auto fresh = MakeRegistration("log", "http://l", {"auth"});
    fresh.service_update_url = "http://l/v2/updates";
    std::atomic<bool> readded{false};
    f.transport.OnGet([&](const std::string&, int call) {
        if (call == 2) {
            // The service restarts and registers again between attempts.
            readded = f.store.Add(fresh).ok();
        }
    });

    REQUIRE(f.monitor.Probe(stale) == ProbeOutcome::recovered);
    REQUIRE(readded.load());

    auto snap = f.store.Snapshot();
    REQUIRE(snap.size() == 1);
    REQUIRE(snap[0].service_update_url == "http://l/v2/updates");
    REQUIRE(snap[0].required_services == std::vector<std::string>{"auth"});
}

TEST_CASE("A wave probes every registration concurrently") {
    constexpr int kCount = 16;
    Fixture f;
    for (int i = 0; i < kCount; ++i) {
        REQUIRE(f.store.Add(MakeRegistration("svc", "http://s" + std::to_string(i))).ok());
    }

    InFlight flight(kCount);
    f.transport.OnGet([&](const std::string&, int) { flight.Enter(std::chrono::seconds(2)); });

    REQUIRE(f.monitor.RunWave() == static_cast<std::size_t>(kCount));
    REQUIRE(flight.peak == kCount);
    REQUIRE(f.store.Size() == static_cast<std::size_t>(kCount));
}

TEST_CASE("probe_threads caps how many probes run at once") {
    HeartbeatOptions opt = FastOptions();
    opt.probe_threads = 2;
    Fixture f(opt);
    for (int i = 0; i < 6; ++i) {
        REQUIRE(f.store.Add(MakeRegistration("svc", "http://s" + std::to_string(i))).ok());
    }

    InFlight flight(6);
    f.transport.OnGet([&](const std::string&, int) { flight.Enter(std::chrono::milliseconds(20)); });

    REQUIRE(f.monitor.RunWave() == 6);
    REQUIRE(flight.arrived == 6);
    REQUIRE(flight.peak <= 2);
    for (int i = 0; i < 6; ++i) {
        REQUIRE(f.transport.GetCalls("http://s" + std::to_string(i) + "/heartbeat") == 1);
    }
}
