#include <chregistry/runtime/io_context_pool.h>

#include <chregistry/core/log.h>

#include <boost/asio/post.hpp>

#include <exception>
#include <stdexcept>

namespace chregistry {

IoContextPool::IoContextPool(std::string name, std::size_t threads, std::size_t max_pending)
    : name_(std::move(name)), threads_(threads), max_pending_(max_pending) {
    if (threads_ == 0) {
        throw std::invalid_argument("IoContextPool threads must be > 0");
    }

    contexts_.reserve(threads_);
    for (std::size_t i = 0; i < threads_; ++i) {
        contexts_.push_back(std::make_unique<boost::asio::io_context>(1));
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

boost::asio::io_context& IoContextPool::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx];
}

bool IoContextPool::Post(std::function<void()> task) {
    // The stopped check, the count and the enqueue happen under one lock so
    // Stop() sees every accepted task either run or discarded.
    std::lock_guard<std::mutex> lk(pending_mu_);
    if (stopped_.load(std::memory_order_acquire)) {
        return false;
    }
    if (max_pending_ != 0 && pending_ >= max_pending_) {
        return false;
    }
    ++pending_;

    boost::asio::post(Next(), [this, gen = generation_.load(std::memory_order_acquire), task = std::move(task)] {
        // Left over from before a Stop(); already counted as discarded.
        if (gen != generation_.load(std::memory_order_acquire)) {
            return;
        }
        try {
            task();
        } catch (const std::exception& e) {
            chregistry::log::error("{}: task failed: {}", name_, e.what());
        }
        OnTaskDone();
    });
    return true;
}

void IoContextPool::OnTaskDone() {
    std::lock_guard<std::mutex> lk(pending_mu_);
    if (pending_ > 0) {
        --pending_;
    }
    if (pending_ == 0) {
        idle_cv_.notify_all();
    }
}

void IoContextPool::WaitIdle() {
    std::unique_lock<std::mutex> lk(pending_mu_);
    idle_cv_.wait(lk, [&] { return pending_ == 0; });
}

bool IoContextPool::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pending_mu_);
    return idle_cv_.wait_for(lk, timeout, [&] { return pending_ == 0; });
}

std::size_t IoContextPool::Pending() const {
    std::lock_guard<std::mutex> lk(pending_mu_);
    return pending_;
}

void IoContextPool::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        stopped_.store(false, std::memory_order_release);
    }

    guards_.clear();
    workers_.reserve(contexts_.size());
    for (auto& ctx : contexts_) {
        ctx->restart();
        guards_.push_back(boost::asio::make_work_guard(*ctx));
    }
    for (auto& ctx : contexts_) {
        workers_.emplace_back([c = ctx.get()] { c->run(); });
    }
}

std::size_t IoContextPool::Stop() {
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        stopped_.store(true, std::memory_order_release);
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }

    bool expected = true;
    if (started_.compare_exchange_strong(expected, false)) {
        for (auto& g : guards_) {
            g.reset();
        }
        for (auto& ctx : contexts_) {
            ctx->stop();
        }
        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }
        workers_.clear();
    }

    // Whatever did not run is gone with the stopped contexts.
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        discarded = pending_;
        pending_ = 0;
    }
    idle_cv_.notify_all();
    if (discarded > 0) {
        chregistry::log::warn("{}: discarded {} queued task(s) on stop", name_, discarded);
    }
    return discarded;
}

} // namespace chregistry
