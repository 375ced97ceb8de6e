#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace chregistry {

// One io_context per thread. Used both as the HTTP server's I/O pool and as a
// bounded worker pool for blocking tasks (deliveries, heartbeat probes).
class IoContextPool {
public:
    // max_pending == 0 means Post() is never refused for capacity.
    IoContextPool(std::string name, std::size_t threads, std::size_t max_pending = 0);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    // Thread-safe. Queues task on the next context. Returns false when the pool is
    // stopped or max_pending tasks are already queued or running.
    bool Post(std::function<void()> task);

    // Thread-safe. Blocks until no posted task is queued or running.
    void WaitIdle();
    bool WaitIdle(std::chrono::milliseconds timeout);

    std::size_t Pending() const;
    std::size_t threads() const { return threads_; }

    void Start();

    // Stops the contexts and joins the threads. Tasks still queued (also those
    // posted before Start()) are discarded; returns how many.
    std::size_t Stop();

private:
    void OnTaskDone();

    std::string name_;
    std::size_t threads_{0};
    std::size_t max_pending_{0};

    std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
    std::vector<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guards_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> generation_{0}; // bumped by Stop(); stale tasks never run

    mutable std::mutex pending_mu_;
    std::condition_variable idle_cv_;
    std::size_t pending_{0};
};

} // namespace chregistry
