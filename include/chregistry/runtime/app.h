#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <chregistry/runtime/io_context_pool.h>

namespace chregistry {

// Anything with a start/stop lifecycle owned by the App: HTTP servers,
// the heartbeat monitor, the notifier's delivery pool.
class IService {
public:
    virtual ~IService() = default;
    virtual const char* Name() const = 0;
    virtual void Start() = 0;
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0;
    std::string log_level = "info";
};

class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoContextPool& Io();

    // Services start in the order added and stop in reverse order.
    void AddService(std::shared_ptr<IService> service);

    // Blocking until Stop() or ctrl-c / SIGTERM
    int Run();
    void Stop();

private:
    AppOptions options_;
    IoContextPool io_;
    std::vector<std::shared_ptr<IService>> services_;

    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stopped_{false};
};

} // namespace chregistry
